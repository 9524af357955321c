#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "headers.hpp"

namespace relay_cpp {

    /// @brief Pool key. Requests with different keys never share a pool.
    struct Endpoint {
        std::string scheme;  // "http", "https" or "connect"
        std::string host;
        std::string port;
        std::chrono::milliseconds timeout{0};

        inline void normalize_host() {
            if (host.empty()) host = "localhost";
            std::transform(host.begin(), host.end(), host.begin(),
                           [](unsigned char c) { return std::tolower(c); });
        }

        std::string to_string() const {
            return scheme + "://" + host + ":" + port + "/" +
                   std::to_string(timeout.count()) + "ms";
        }

        friend bool operator==(Endpoint const& a, Endpoint const& b) noexcept {
            return a.scheme == b.scheme && a.host == b.host &&
                   a.port == b.port && a.timeout == b.timeout;
        }
    };

    /// @brief Everything a Connection needs to reach the origin: the socket
    /// address, an optional CONNECT hop through a proxy, and TLS.
    struct ConnectPlan {
        std::string host;
        std::string port;
        /// Set when the socket goes to a proxy that must be asked to tunnel
        /// to this "host:port" first.
        std::optional<std::string> tunnel_authority;
        Headers tunnel_headers;
        /// Set for https origins.
        std::shared_ptr<boost::asio::ssl::context> tls;
        std::string sni_host;
        std::chrono::milliseconds timeout{0};
    };

    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

    /// @brief Apply TlsOptions to a context.
    /// @throws std::runtime_error when a configured file cannot be loaded.
    inline void init_tls_on_ssl_context(boost::asio::ssl::context& ctx,
                                        const TlsOptions& tls) {
        namespace ssl = boost::asio::ssl;
        try {
            if (tls.verify) {
                ctx.set_default_verify_paths();
                ctx.set_verify_mode(ssl::verify_peer);
            } else {
                ctx.set_verify_mode(ssl::verify_none);
            }
            if (!tls.ca_file.empty()) ctx.load_verify_file(tls.ca_file);
            if (!tls.cert_file.empty())
                ctx.use_certificate_chain_file(tls.cert_file);
            if (!tls.key_file.empty())
                ctx.use_private_key_file(tls.key_file, ssl::context::pem);
        } catch (const boost::system::system_error& e) {
            throw std::runtime_error(
                std::string("Failed to initialise TLS context: ") + e.what());
        }
    }

}  // namespace relay_cpp

namespace std {
    template <>
    struct hash<relay_cpp::Endpoint> {
        size_t operator()(relay_cpp::Endpoint const& e) const noexcept {
            size_t h = 1469598103934665603ull;
            auto mix = [&](std::string_view s) {
                for (unsigned char c : s) {
                    h ^= c;
                    h *= 1099511628211ull;
                }
                h ^= 0xFF;
                h *= 1099511628211ull;
            };
            mix(e.scheme);
            mix(e.host);
            mix(e.port);
            h ^= static_cast<size_t>(e.timeout.count());
            h *= 1099511628211ull;
            return h;
        }
    };
}  // namespace std
