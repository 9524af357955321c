#pragma once
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "headers.hpp"

namespace relay_cpp {

    /// @brief scheme ("http", "https") to proxy URL, plus an optional "no"
    /// entry holding a comma separated list of host suffixes to bypass.
    using ProxyInfo = std::map<std::string, std::string>;

    /**
     * @brief TLS material and verification mode for outbound connections.
     */
    struct TlsOptions {
        /** @brief PEM private key for client certificates. */
        std::string key_file;
        /** @brief PEM client certificate chain. */
        std::string cert_file;
        /** @brief Extra CA bundle used when verifying peers. */
        std::string ca_file;
        /** @brief Verify the server certificate. */
        bool verify{false};
    };

    /**
     * @brief Configuration shared by every per-endpoint connection pool.
     */
    struct ConnectionPoolConfiguration {
        /** @brief Ceiling on in-use connections per endpoint key. */
        size_t max_connections{10};
        /** @brief Cap on idle connections kept per endpoint key. */
        size_t max_available{10};
        /** @brief How long a request waits for pool capacity. 0 = forever. */
        std::chrono::milliseconds acquire_timeout{0};
    };

    /**
     * @brief Configuration for HttpClient. Read once at construction.
     */
    struct HttpClientConfiguration {
        /** @brief User-Agent string sent with each request. */
        std::string user_agent{"relay_cpp/1.0"};

        /** @brief Headers added to every request, overridable per request. */
        Headers default_headers;

        /** @brief Whole-request timeout, including connect. 0 disables it. */
        std::chrono::milliseconds timeout{0};

        /** @brief Reconnect budget per request after transport failures. */
        size_t max_reconnect{1};

        /** @brief Base lag for the reconnect backoff. */
        std::chrono::milliseconds reconnect_time_lag{2000};

        /** @brief Also replay POST/PATCH after a transport failure. */
        bool reconnect_non_idempotent{false};

        size_t max_redirects{10};

        /** @brief Follow redirects. get() and options() default to true. */
        bool allow_redirects{false};

        /** @brief Number of prior hops a response keeps in its history. */
        size_t history_limit{10};

        /** @brief Inflate gzip/deflate response bodies. */
        bool decompress{true};

        /** @brief Record Set-Cookie headers and replay them. */
        bool store_cookies{true};

        /** @brief Encode structured bodies as multipart/form-data. */
        bool encode_multipart{true};

        /** @brief Multipart boundary. A random one is chosen when unset. */
        std::optional<std::string> multipart_boundary;

        /** @brief HTTP version as major*10+minor. */
        unsigned version{11};

        TlsOptions tls;

        /** @brief Proxies by scheme. Empty means "from the environment" when
         * trust_env is set. */
        ProxyInfo proxy_info;

        bool trust_env{true};

        /** @brief Maximum size of a response body in bytes. 0 = unlimited. */
        size_t max_body_bytes{0};

        /** @brief Header middleware applied, in order, to every request. */
        std::vector<std::shared_ptr<const class HeaderMiddleware>>
            header_middleware;

        ConnectionPoolConfiguration pool_config;
    };

}  // namespace relay_cpp
