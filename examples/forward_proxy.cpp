// examples/forward_proxy.cpp
//
// Minimal forward proxy on top of relay_cpp.
//
//   forward_proxy [port] [upstream-proxy-url]
//
// Plain requests must use absolute-form targets
// ("GET http://host/path HTTP/1.1"). They are relayed through HttpClient and
// the answer is streamed back, one request per downstream connection.
// CONNECT requests become raw tunnels.

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

#include "relay_cpp/client.hpp"
#include "relay_cpp/connection/connection.hpp"
#include "relay_cpp/headers.hpp"
#include "relay_cpp/log.hpp"
#include "relay_cpp/middleware.hpp"
#include "relay_cpp/tunnel.hpp"

namespace asio = boost::asio;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;

namespace {

    std::string failure_response(int status, std::string_view reason,
                                 const std::string& text) {
        std::string body = text + "\n";
        return "HTTP/1.1 " + std::to_string(status) + " " +
               std::string(reason) +
               "\r\nContent-Type: text/plain; charset=utf-8\r\n"
               "Content-Length: " +
               std::to_string(body.size()) +
               "\r\nConnection: close\r\n\r\n" + body;
    }

    /// Reads one request head from a downstream connection and hands it to
    /// the client, or to a TunnelBridge for CONNECT.
    class ProxySession : public relay_cpp::ProtocolConsumer,
                         public std::enable_shared_from_this<ProxySession> {
       public:
        explicit ProxySession(std::shared_ptr<relay_cpp::HttpClient> client)
            : client_(std::move(client)) {
            parser_.header_limit(64 * 1024);
            parser_.body_limit(8 * 1024 * 1024);
        }

        void connection_made(
            const std::shared_ptr<relay_cpp::Connection>& conn) override {
            conn_ = conn;
        }

        void data_received(std::string_view data) override {
            if (done_) return;
            buffer_.append(data.data(), data.size());

            // Beast needs the whole head in one buffer: keep unparsed bytes
            while (!buffer_.empty() && !parser_.is_done()) {
                boost::beast::error_code ec;
                size_t used = parser_.put(
                    asio::buffer(buffer_.data(), buffer_.size()), ec);
                if (ec == http::error::need_more) return;
                if (ec) {
                    reject(400, "Bad Request", ec.message());
                    return;
                }
                buffer_.erase(0, used);
                if (used == 0) return;
            }
            if (parser_.is_done()) dispatch(std::move(buffer_));
        }

        void connection_lost(const relay_cpp::Error& error) override {
            relay_cpp::logger()->debug("downstream went away: {}",
                                       relay_cpp::describe(error));
            done_ = true;
        }

        bool finished() const noexcept override { return done_; }

       private:
        void dispatch(std::string leftover) {
            done_ = true;
            auto conn = conn_.lock();
            if (!conn) return;

            auto& req = parser_.get();
            std::string target(req.target());

            relay_cpp::RequestOptions opts;
            opts.client_address = conn->remote_address();

            if (req.method() == http::verb::connect) {
                relay_cpp::TunnelBridge::start(client_, conn, target,
                                               std::move(opts),
                                               std::move(leftover));
                return;
            }

            auto method = relay_cpp::method_from_string(
                std::string_view(req.method_string()));
            if (!method) {
                reject(501, "Not Implemented", "Unsupported method");
                return;
            }

            opts.headers = relay_cpp::headers::strip_hop_by_hop(req.base());
            opts.headers.erase(http::field::host);
            opts.allow_redirects = false;
            if (!req.body().empty()) opts.body = std::move(req.body());

            auto res = client_->request(*method, target, std::move(opts));
            if (!res) {
                reject(400, "Bad Request", res.error().message);
                return;
            }
            relay(std::move(res).value(), conn);
        }

        void relay(const std::shared_ptr<relay_cpp::HttpResponse>& resp,
                   const std::shared_ptr<relay_cpp::Connection>& conn) {
            auto headers_sent = std::make_shared<bool>(false);

            resp->on_headers([conn, headers_sent](
                                 relay_cpp::HttpResponse& r) {
                std::string head = "HTTP/1.1 " +
                                   std::to_string(r.status_code()) + " " +
                                   r.reason() + "\r\n";
                for (const auto& f : r.headers()) {
                    head.append(f.name_string().data(),
                                f.name_string().size());
                    head += ": ";
                    head.append(f.value().data(), f.value().size());
                    head += "\r\n";
                }
                head += "Connection: close\r\n\r\n";
                *headers_sent = true;
                conn->write(std::move(head));
            });
            resp->on_data([conn](std::string_view chunk) {
                conn->write(std::string(chunk));
            });
            resp->on_finished([conn, headers_sent](
                                  relay_cpp::HttpResponse& r) {
                if (!r.error()) {
                    conn->close();
                } else if (!*headers_sent) {
                    conn->write(failure_response(504, "Gateway Timeout",
                                                 r.error()->message));
                    conn->close();
                } else {
                    // Too late for a status line
                    conn->close(true);
                }
            });
        }

        void reject(int status, std::string_view reason,
                    const std::string& why) {
            done_ = true;
            relay_cpp::logger()->warn("rejecting downstream request: {}", why);
            if (auto conn = conn_.lock()) {
                conn->write(failure_response(status, reason, why));
                conn->close();
            }
        }

        std::shared_ptr<relay_cpp::HttpClient> client_;
        std::weak_ptr<relay_cpp::Connection> conn_;
        http::request_parser<http::string_body> parser_;
        std::string buffer_;
        bool done_{false};
    };

    asio::awaitable<void> accept_loop(
        tcp::acceptor& acceptor, std::shared_ptr<relay_cpp::HttpClient> client) {
        std::uint64_t next_id = 1;
        for (;;) {
            boost::system::error_code ec;
            tcp::socket socket = co_await acceptor.async_accept(
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec == asio::error::operation_aborted) co_return;
            if (ec) {
                relay_cpp::logger()->warn("accept failed: {}", ec.message());
                continue;
            }
            relay_cpp::Connection::adopt(
                std::move(socket), next_id++,
                std::make_shared<ProxySession>(client));
        }
    }

}  // namespace

int main(int argc, char** argv) {
    unsigned short port =
        argc > 1 ? static_cast<unsigned short>(std::atoi(argv[1])) : 8080;

    relay_cpp::HttpClientConfiguration cfg;
    cfg.decompress = false;
    cfg.store_cookies = false;
    cfg.timeout = std::chrono::seconds(30);
    cfg.header_middleware.push_back(
        std::make_shared<relay_cpp::XForwardedFor>());
    if (argc > 2) {
        cfg.proxy_info["http"] = argv[2];
        cfg.proxy_info["https"] = argv[2];
    }

    asio::io_context ioc;
    auto client = relay_cpp::HttpClient::create(ioc.get_executor(), cfg);

    tcp::acceptor acceptor(ioc, tcp::endpoint(tcp::v4(), port));
    relay_cpp::logger()->info("forward proxy listening on port {}",
                              acceptor.local_endpoint().port());

    asio::co_spawn(ioc, accept_loop(acceptor, client),
                   relay_cpp::log_on_exception{"accept loop"});

    asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code&, int) {
        boost::system::error_code ec;
        acceptor.close(ec);
        asio::co_spawn(
            ioc,
            [client]() -> asio::awaitable<void> {
                co_await client->close(std::chrono::seconds(2));
            },
            [&ioc](std::exception_ptr) { ioc.stop(); });
    });

    ioc.run();
    return 0;
}
