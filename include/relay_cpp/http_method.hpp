#pragma once

#include <boost/beast/http/verb.hpp>
#include <optional>
#include <string_view>

namespace relay_cpp {

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
        Connect,
        Trace,
    };

    inline constexpr boost::beast::http::verb to_beast_verb(HttpMethod method) {
        namespace http = boost::beast::http;
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            case HttpMethod::Connect:
                return http::verb::connect;
            case HttpMethod::Trace:
                return http::verb::trace;
        }
        return http::verb::unknown;
    }

    inline constexpr std::string_view to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return "GET";
            case HttpMethod::Post:
                return "POST";
            case HttpMethod::Put:
                return "PUT";
            case HttpMethod::Patch:
                return "PATCH";
            case HttpMethod::Delete:
                return "DELETE";
            case HttpMethod::Head:
                return "HEAD";
            case HttpMethod::Options:
                return "OPTIONS";
            case HttpMethod::Connect:
                return "CONNECT";
            case HttpMethod::Trace:
                return "TRACE";
        }
        return "GET";
    }

    /// @brief Parse a request-line method token. Matching is exact, as on
    /// the wire.
    inline std::optional<HttpMethod> method_from_string(std::string_view s) {
        namespace http = boost::beast::http;
        switch (http::string_to_verb(s)) {
            case http::verb::get:
                return HttpMethod::Get;
            case http::verb::post:
                return HttpMethod::Post;
            case http::verb::put:
                return HttpMethod::Put;
            case http::verb::patch:
                return HttpMethod::Patch;
            case http::verb::delete_:
                return HttpMethod::Delete;
            case http::verb::head:
                return HttpMethod::Head;
            case http::verb::options:
                return HttpMethod::Options;
            case http::verb::connect:
                return HttpMethod::Connect;
            case http::verb::trace:
                return HttpMethod::Trace;
            default:
                return std::nullopt;
        }
    }

    /// @brief Methods whose payload is folded into the query string instead
    /// of being sent as a body.
    inline constexpr bool encodes_body_in_url(HttpMethod method) {
        return method == HttpMethod::Get || method == HttpMethod::Head ||
               method == HttpMethod::Delete || method == HttpMethod::Options;
    }

    /// @brief Methods that may be replayed after the request bytes were
    /// already written to a connection that then died.
    inline constexpr bool is_idempotent(HttpMethod method) {
        return method != HttpMethod::Post && method != HttpMethod::Patch &&
               method != HttpMethod::Connect;
    }

}  // namespace relay_cpp
