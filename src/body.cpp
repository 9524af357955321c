#include "relay_cpp/body.hpp"

#include <random>

#include "relay_cpp/url.hpp"

namespace relay_cpp {

    namespace {

        /// Flatten a JSON object into form fields. Non-string values are
        /// rendered as JSON text.
        FormFields fields_from_json(const nlohmann::json& j) {
            FormFields out;
            if (!j.is_object()) return out;
            for (auto it = j.begin(); it != j.end(); ++it) {
                if (it.value().is_string()) {
                    out.emplace_back(it.key(), it.value().get<std::string>());
                } else {
                    out.emplace_back(it.key(), it.value().dump());
                }
            }
            return out;
        }

        bool is_json_type(const std::string& content_type) {
            return content_type.find("json") != std::string::npos;
        }

    }  // namespace

    EncodedBody encode_body(const RequestBody& body,
                            const std::string& content_type, bool multipart,
                            const std::string& boundary) {
        EncodedBody out;

        if (std::holds_alternative<std::monostate>(body)) return out;

        if (auto* bytes = std::get_if<std::vector<std::uint8_t>>(&body)) {
            out.bytes.assign(bytes->begin(), bytes->end());
            return out;
        }

        if (auto* text = std::get_if<std::string>(&body)) {
            out.bytes = *text;
            if (content_type.empty()) {
                out.content_type = "text/plain; charset=utf-8";
            }
            return out;
        }

        const FormFields* fields = std::get_if<FormFields>(&body);
        const nlohmann::json* json = std::get_if<nlohmann::json>(&body);

        // Structured payload with an explicit JSON type, or a JSON value that
        // is not a flat object, goes out as JSON.
        if (json && (is_json_type(content_type) ||
                     (content_type.empty() && !json->is_object()))) {
            out.bytes = json->dump();
            if (content_type.empty()) out.content_type = "application/json";
            return out;
        }

        if (content_type.empty()) {
            FormFields flat = fields ? *fields : fields_from_json(*json);
            if (multipart) {
                out.bytes = encode_multipart_formdata(flat, boundary);
                out.content_type = "multipart/form-data; boundary=" + boundary;
            } else {
                out.bytes = url_utils::encode_form(flat);
                out.content_type = "application/x-www-form-urlencoded";
            }
            return out;
        }

        if (content_type.find("x-www-form-urlencoded") != std::string::npos) {
            out.bytes =
                url_utils::encode_form(fields ? *fields : fields_from_json(*json));
            return out;
        }

        // No other match: JSON
        if (json) {
            out.bytes = json->dump();
        } else {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& [k, v] : *fields) obj[k] = v;
            out.bytes = obj.dump();
        }
        return out;
    }

    std::string query_from_body(const RequestBody& body) {
        if (auto* fields = std::get_if<FormFields>(&body)) {
            return url_utils::encode_form(*fields);
        }
        if (auto* json = std::get_if<nlohmann::json>(&body)) {
            return url_utils::encode_form(fields_from_json(*json));
        }
        if (auto* text = std::get_if<std::string>(&body)) return *text;
        if (auto* bytes = std::get_if<std::vector<std::uint8_t>>(&body)) {
            return std::string(bytes->begin(), bytes->end());
        }
        return {};
    }

    std::string encode_multipart_formdata(const FormFields& fields,
                                          const std::string& boundary) {
        std::string out;
        for (const auto& [name, value] : fields) {
            out += "--" + boundary + "\r\n";
            out += "Content-Disposition: form-data; name=\"" + name + "\"\r\n";
            out += "\r\n";
            out += value;
            out += "\r\n";
        }
        out += "--" + boundary + "--\r\n";
        return out;
    }

    std::string choose_boundary() {
        static constexpr char hex[] = "0123456789abcdef";
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<int> dist(0, 15);
        std::string out;
        out.reserve(32);
        for (int i = 0; i < 32; ++i) out.push_back(hex[dist(gen)]);
        return out;
    }

}  // namespace relay_cpp
