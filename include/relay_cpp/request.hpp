#pragma once

#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "body.hpp"
#include "endpoint.hpp"
#include "headers.hpp"
#include "http_method.hpp"
#include "url.hpp"

namespace relay_cpp {

    /**
     * @brief Per-request overrides. Unset optionals fall back to the client
     * configuration.
     */
    struct RequestOptions {
        /** @brief Merged over the client defaults, request wins. */
        Headers headers;
        /** @brief Lower precedence than headers, resent on every redirect
         * hop. */
        Headers unredirected_headers;
        RequestBody body;

        std::optional<bool> allow_redirects;
        std::optional<size_t> max_redirects;
        std::optional<std::chrono::milliseconds> timeout;
        std::optional<bool> decompress;
        std::optional<bool> encode_multipart;
        std::optional<std::string> multipart_boundary;
        std::optional<unsigned> version;

        /** @brief Extra cookies appended to the Cookie header. */
        std::vector<std::pair<std::string, std::string>> cookies;

        /** @brief TLS context for this request instead of the client's. */
        std::shared_ptr<boost::asio::ssl::context> ssl_context;

        /** @brief Address of the downstream peer, for header middleware. */
        std::optional<std::string> client_address;
    };

    /// @brief Effective per-attempt policy, resolved from client config and
    /// RequestOptions.
    struct RequestParameters {
        unsigned version{11};
        std::chrono::milliseconds timeout{0};
        bool allow_redirects{false};
        size_t max_redirects{10};
        size_t redirect_count{0};
        bool decompress{true};
        bool encode_multipart{true};
        std::string multipart_boundary;
        size_t max_body_bytes{0};
        /// Cookies the caller supplied (Cookie header value and
        /// RequestOptions::cookies). Sent again on every redirect hop.
        std::string given_cookie;
        std::vector<std::pair<std::string, std::string>> cookies;
    };

    /**
     * @brief Immutable description of one outbound attempt.
     *
     * A redirect or a new attempt builds a new HttpRequest. A reconnect
     * replays the same one.
     */
    class HttpRequest {
       public:
        HttpRequest(HttpMethod method, UrlComponents url,
                    std::optional<UrlComponents> proxy, Headers headers,
                    Headers unredirected_headers, RequestBody body,
                    RequestParameters params,
                    std::shared_ptr<boost::asio::ssl::context> tls);

        HttpMethod method() const noexcept { return method_; }
        const UrlComponents& url() const noexcept { return url_; }
        const std::optional<UrlComponents>& proxy() const noexcept {
            return proxy_;
        }
        const Headers& headers() const noexcept { return headers_; }
        const Headers& unredirected_headers() const noexcept {
            return unredirected_;
        }
        /// @brief The payload as supplied, before encoding. Empty for
        /// GET-like methods, whose payload went into the query.
        const RequestBody& body() const noexcept { return body_; }
        const std::string& encoded_body() const noexcept { return encoded_; }
        const RequestParameters& params() const noexcept { return params_; }
        const std::shared_ptr<boost::asio::ssl::context>& tls() const noexcept {
            return tls_;
        }

        /// @brief Pool key: (scheme, host, port, timeout) of the socket peer.
        Endpoint key() const;

        /// @brief The socket goes to a proxy that must open a CONNECT tunnel
        /// first (https origins and CONNECT requests through a proxy).
        bool tunnel() const noexcept;

        ConnectPlan connect_plan() const;

        /// @brief Wire bytes of the request head plus body. CONNECT requests
        /// encode to an empty string.
        std::string encode() const;

        /// @brief "GET /path HTTP/1.1"
        std::string first_line() const;

        /// @brief Absolute URL of the target, or host:port for CONNECT.
        std::string full_url() const;

        bool is_head() const noexcept { return method_ == HttpMethod::Head; }

       private:
        std::string request_target() const;

        HttpMethod method_;
        UrlComponents url_;
        std::optional<UrlComponents> proxy_;
        Headers headers_;
        Headers unredirected_;
        RequestBody body_;
        RequestParameters params_;
        std::shared_ptr<boost::asio::ssl::context> tls_;

        std::string encoded_;
        std::optional<std::string> content_type_;
    };

}  // namespace relay_cpp
