#pragma once

#include <boost/system/error_code.hpp>
#include <string>

namespace relay_cpp {
    /**
     * @brief Represents an error that ended a request, a connection or a
     * tunnel.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,          /**< The provided URL is malformed or invalid. */
            ConnectionFailed,    /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed,  /**< Failed to perform TLS handshake. */
            Timeout,             /**< The operation timed out. */
            SendFailed,          /**< Failed to send the request. */
            ReceiveFailed,       /**< The peer went away while reading. */
            NetworkError,        /**< General network error. */
            ProtocolViolation,   /**< Response bytes could not be parsed. */
            TooManyRedirects,    /**< Redirect chain exceeded max_redirects. */
            ProxyConfiguration,  /**< A proxy URL could not be understood. */
            TunnelEstablishment, /**< Upstream CONNECT did not succeed. */
            ClientClosed,        /**< The client no longer accepts requests. */
            InvalidState,        /**< Call not valid in the current state. */
            Unknown,             /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code{Code::Unknown};
        /** @brief A descriptive error message. */
        std::string message;
        /** @brief Last known HTTP status code, 0 when none was received. */
        int status_code{0};
    };

    /// @brief Stable name of an error code, for logs and diagnostics.
    const char* to_string(Error::Code code) noexcept;

    /// @brief True for failures of the socket itself (refused, reset, timed
    /// out). Only these are candidates for a reconnect.
    bool is_transport_error(Error::Code code) noexcept;

    /// @brief Map an Asio/Beast/OpenSSL error code onto an Error.
    /// @param ec The error code reported by the transport.
    /// @param fallback Code used when ec has no more specific mapping.
    Error error_from_transport(const boost::system::error_code& ec,
                               Error::Code fallback = Error::Code::NetworkError);

    /// @brief One-line rendering such as "Timeout: read timed out (status 0)".
    std::string describe(const Error& error);

}  // namespace relay_cpp
