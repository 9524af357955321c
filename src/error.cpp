#include "relay_cpp/error.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/error.hpp>

namespace relay_cpp {

    const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::ProtocolViolation:
                return "ProtocolViolation";
            case Error::Code::TooManyRedirects:
                return "TooManyRedirects";
            case Error::Code::ProxyConfiguration:
                return "ProxyConfiguration";
            case Error::Code::TunnelEstablishment:
                return "TunnelEstablishment";
            case Error::Code::ClientClosed:
                return "ClientClosed";
            case Error::Code::InvalidState:
                return "InvalidState";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    bool is_transport_error(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::ConnectionFailed:
            case Error::Code::Timeout:
            case Error::Code::SendFailed:
            case Error::Code::ReceiveFailed:
            case Error::Code::NetworkError:
                return true;
            default:
                return false;
        }
    }

    Error error_from_transport(const boost::system::error_code& ec,
                               Error::Code fallback) {
        namespace ae = boost::asio::error;

        Error e{fallback, ec.message()};

        if (ec == boost::beast::error::timeout || ec == ae::timed_out) {
            e.code = Error::Code::Timeout;
        } else if (ec == ae::connection_refused || ec == ae::host_not_found ||
                   ec == ae::host_not_found_try_again ||
                   ec == ae::network_unreachable ||
                   ec == ae::host_unreachable) {
            e.code = Error::Code::ConnectionFailed;
        } else if (ec == ae::eof || ec == ae::connection_reset ||
                   ec == ae::connection_aborted ||
                   ec == boost::asio::ssl::error::stream_truncated) {
            e.code = Error::Code::ReceiveFailed;
        } else if (ec == ae::broken_pipe) {
            e.code = Error::Code::SendFailed;
        } else if (ec.category() == ae::get_ssl_category()) {
            e.code = Error::Code::TlsHandshakeFailed;
        }
        return e;
    }

    std::string describe(const Error& error) {
        std::string out = to_string(error.code);
        if (!error.message.empty()) {
            out += ": ";
            out += error.message;
        }
        if (error.status_code != 0) {
            out += " (status ";
            out += std::to_string(error.status_code);
            out += ")";
        }
        return out;
    }

}  // namespace relay_cpp
