#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "response.hpp"
#include "result.hpp"

namespace relay_cpp {

    // Overload for types adaptable to nlohmann::json
    template <typename T>
    void deserialize(const Response& response, T& out) {
        auto j = nlohmann::json::parse(response.body);
        j.get_to(out);
    }

    /// @brief Decode a JSON response body into T. A malformed body or a
    /// shape mismatch is reported as an Error instead of an exception.
    template <typename T>
    Result<T> deserialize(const Response& response) {
        try {
            T out;
            deserialize(response, out);
            return Result<T>::ok(std::move(out));
        } catch (const nlohmann::json::exception& e) {
            return Result<T>::err(Error::Code::Unknown,
                                  std::string("Could not decode ") +
                                      response.url + ": " + e.what(),
                                  response.status_code);
        }
    }

    /// @brief Decode the outcome of HttpResponse::wait() into T.
    template <typename T>
    Result<T> to_result_t(Result<Response>&& res) {
        if (res.has_error()) return Result<T>::err(std::move(res).error());
        return deserialize<T>(res.value());
    }

}  // namespace relay_cpp
