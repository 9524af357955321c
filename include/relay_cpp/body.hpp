#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace relay_cpp {

    /// @brief Ordered form fields. Duplicate names are allowed.
    using FormFields = std::vector<std::pair<std::string, std::string>>;

    /// @brief Request payload as supplied by the caller.
    /// - bytes are sent unchanged
    /// - text is sent as UTF-8
    /// - FormFields and JSON objects are "structured" and are encoded as a
    ///   form, multipart or JSON depending on the content type
    using RequestBody = std::variant<std::monostate, std::vector<std::uint8_t>,
                                     std::string, FormFields, nlohmann::json>;

    struct EncodedBody {
        std::string bytes;
        /// Content-Type chosen by the encoder when the caller gave none.
        std::optional<std::string> content_type;
    };

    inline bool body_empty(const RequestBody& body) {
        return std::holds_alternative<std::monostate>(body);
    }

    /// @brief Encode a payload into wire bytes.
    /// @param content_type The caller's Content-Type, empty when none.
    /// @param multipart Encode structured payloads as multipart/form-data
    /// instead of application/x-www-form-urlencoded.
    /// @param boundary Multipart boundary.
    EncodedBody encode_body(const RequestBody& body,
                            const std::string& content_type, bool multipart,
                            const std::string& boundary);

    /// @brief Query string rendering of a payload for GET-like methods.
    std::string query_from_body(const RequestBody& body);

    /// @brief multipart/form-data rendering of form fields.
    std::string encode_multipart_formdata(const FormFields& fields,
                                          const std::string& boundary);

    /// @brief Random 32 hex digit boundary.
    std::string choose_boundary();

}  // namespace relay_cpp
