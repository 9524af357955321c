#include "relay_cpp/connection/connection.hpp"

#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/empty_body.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>

#include "relay_cpp/log.hpp"

namespace relay_cpp {

    namespace asio = boost::asio;
    namespace beast = boost::beast;
    namespace http = boost::beast::http;

    Connection::Connection(asio::any_io_executor executor, std::uint64_t id)
        : ex_(std::move(executor)), id_(id) {}

    Connection::~Connection() noexcept { close_transport(); }

    std::shared_ptr<Connection> Connection::adopt(
        tcp::socket socket, std::uint64_t id,
        std::shared_ptr<ProtocolConsumer> consumer) {
        asio::any_io_executor strand = asio::make_strand(socket.get_executor());
        auto conn = std::make_shared<Connection>(strand, id);
        conn->m_stream.emplace<HttpStream>(std::move(socket));
        conn->open_.store(true);
        {
            std::lock_guard<std::mutex> lk(conn->mu_);
            conn->consumer_ = consumer;
        }
        asio::dispatch(conn->ex_, [conn, consumer] {
            if (consumer) consumer->connection_made(conn);
            conn->start_reading();
        });
        return conn;
    }

    asio::awaitable<std::optional<Error>> Connection::connect(
        ConnectPlan plan) {
        auto self = shared_from_this();
        boost::system::error_code ec;

        auto closed_error = [this](const char* what) {
            return pending_error_.value_or(
                Error{Error::Code::ConnectionFailed, what});
        };

        if (closed_.load()) co_return closed_error("connection closed");

        tcp::resolver resolver(ex_);
        auto results = co_await resolver.async_resolve(
            plan.host, plan.port,
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return error_from_transport(ec, Error::Code::ConnectionFailed);
        }
        if (closed_.load()) co_return closed_error("connection closed");

        m_stream.emplace<HttpStream>(ex_);
        auto& s = std::get<HttpStream>(m_stream);
        if (plan.timeout.count() > 0) s.expires_after(plan.timeout);

        co_await s.async_connect(results,
                                 asio::redirect_error(asio::use_awaitable, ec));
        if (ec || closed_.load()) {
            close_transport();
            if (pending_error_) co_return *pending_error_;
            if (!ec) co_return closed_error("connection closed");
            co_return error_from_transport(ec, Error::Code::ConnectionFailed);
        }
        open_.store(true);

        if (plan.tunnel_authority) {
            if (auto err = co_await open_tunnel(s, plan)) {
                close_transport();
                co_return err;
            }
        }

        if (plan.tls) {
            HttpStream plain(std::move(s));
            m_stream.emplace<HttpsStream>(std::move(plain), *plan.tls);
            auto& hs = std::get<HttpsStream>(m_stream);

            if (!set_sni(hs, plan.sni_host, ec)) {
                close_transport();
                co_return error_from_transport(
                    ec, Error::Code::TlsHandshakeFailed);
            }

            co_await hs.async_handshake(
                asio::ssl::stream_base::client,
                asio::redirect_error(asio::use_awaitable, ec));
            if (ec || closed_.load()) {
                close_transport();
                if (pending_error_) co_return *pending_error_;
                if (!ec) co_return closed_error("connection closed");
                Error e = error_from_transport(
                    ec, Error::Code::TlsHandshakeFailed);
                if (e.code == Error::Code::NetworkError)
                    e.code = Error::Code::TlsHandshakeFailed;
                co_return e;
            }
            beast::get_lowest_layer(hs).expires_never();
        } else {
            s.expires_never();
        }

        start_reading();
        co_return std::nullopt;
    }

    asio::awaitable<std::optional<Error>> Connection::open_tunnel(
        HttpStream& stream, const ConnectPlan& plan) {
        boost::system::error_code ec;
        const std::string& authority = *plan.tunnel_authority;

        http::request<http::empty_body> req{http::verb::connect, authority,
                                            11};
        req.set(http::field::host, authority);
        for (const auto& f : plan.tunnel_headers) {
            req.insert(f.name_string(), f.value());
        }

        co_await http::async_write(stream, req,
                                   asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            co_return error_from_transport(ec, Error::Code::SendFailed);
        }

        beast::flat_buffer buffer;
        http::response_parser<http::empty_body> parser;
        parser.skip(true);
        co_await http::async_read_header(
            stream, buffer, parser,
            asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            Error e = error_from_transport(ec, Error::Code::TunnelEstablishment);
            e.message = "CONNECT " + authority + " failed: " + e.message;
            co_return e;
        }

        int status = static_cast<int>(parser.get().result_int());
        if (status < 200 || status >= 300) {
            co_return Error{Error::Code::TunnelEstablishment,
                            "Proxy refused CONNECT " + authority + ": " +
                                std::to_string(status) + " " +
                                std::string(parser.get().reason()),
                            status};
        }
        if (buffer.size() != 0) {
            co_return Error{Error::Code::ProtocolViolation,
                            "Unexpected bytes after CONNECT response", status};
        }

        logger()->debug("tunnel to {} open via {}:{}", authority, plan.host,
                        plan.port);
        co_return std::nullopt;
    }

    void Connection::start_reading() {
        asio::co_spawn(ex_, read_loop(shared_from_this()),
                       log_on_exception{"connection read loop"});
    }

    asio::awaitable<void> Connection::read_loop(
        std::shared_ptr<Connection> self) {
        std::array<char, 16 * 1024> buf;
        boost::system::error_code ec;

        for (;;) {
            std::size_t n = 0;
            if (auto* h = std::get_if<HttpStream>(&m_stream)) {
                n = co_await h->async_read_some(
                    asio::buffer(buf),
                    asio::redirect_error(asio::use_awaitable, ec));
            } else if (auto* hs = std::get_if<HttpsStream>(&m_stream)) {
                n = co_await hs->async_read_some(
                    asio::buffer(buf),
                    asio::redirect_error(asio::use_awaitable, ec));
            } else {
                break;
            }
            if (ec) break;
            if (n == 0) continue;

            auto c = consumer();
            if (!c || c->finished()) {
                logger()->warn("connection {}: {} unexpected bytes with no "
                               "active consumer",
                               id_, n);
                if (!pending_error_) {
                    pending_error_ = Error{Error::Code::ProtocolViolation,
                                           "Unexpected data on idle connection"};
                }
                break;
            }
            c->data_received(std::string_view(buf.data(), n));
            if (!open_.load()) break;
        }

        bool peer_closed = ec == asio::error::eof ||
                           ec == asio::ssl::error::stream_truncated;
        if (peer_closed && !pending_error_) {
            if (auto c = consumer(); c && !c->finished()) c->eof_received();
        }

        close_transport();
        closed_.store(true);

        Error err;
        if (pending_error_) {
            err = *pending_error_;
        } else if (peer_closed) {
            err = Error{Error::Code::ReceiveFailed,
                        "Connection closed by peer"};
        } else if (ec == asio::error::operation_aborted || !ec) {
            err = Error{Error::Code::NetworkError, "Connection closed"};
        } else {
            err = error_from_transport(ec, Error::Code::ReceiveFailed);
        }

        LostHandler handler;
        std::shared_ptr<ProtocolConsumer> c;
        {
            std::lock_guard<std::mutex> lk(mu_);
            handler = std::move(lost_handler_);
            lost_handler_ = nullptr;
            c = consumer_;
        }
        if (handler) {
            handler(self, err);
        } else if (c && !c->finished()) {
            c->connection_lost(err);
        }
    }

    void Connection::write(std::string bytes) {
        if (bytes.empty()) return;
        asio::dispatch(ex_, [self = shared_from_this(),
                             bytes = std::move(bytes)]() mutable {
            if (!self->open_.load() || self->close_after_flush_) return;
            self->write_queue_.push_back(std::move(bytes));
            if (!self->writing_) {
                self->writing_ = true;
                asio::co_spawn(self->ex_, self->write_loop(self),
                               log_on_exception{"connection write loop"});
            }
        });
    }

    asio::awaitable<void> Connection::write_loop(
        std::shared_ptr<Connection> self) {
        boost::system::error_code ec;

        while (!write_queue_.empty() && open_.load()) {
            const std::string& front = write_queue_.front();
            if (auto* h = std::get_if<HttpStream>(&m_stream)) {
                co_await asio::async_write(
                    *h, asio::buffer(front),
                    asio::redirect_error(asio::use_awaitable, ec));
            } else if (auto* hs = std::get_if<HttpsStream>(&m_stream)) {
                co_await asio::async_write(
                    *hs, asio::buffer(front),
                    asio::redirect_error(asio::use_awaitable, ec));
            } else {
                break;
            }
            if (ec) {
                if (!pending_error_) {
                    pending_error_ =
                        error_from_transport(ec, Error::Code::SendFailed);
                }
                write_queue_.clear();
                writing_ = false;
                close_transport();
                co_return;
            }
            write_queue_.pop_front();
        }

        write_queue_.clear();
        writing_ = false;
        if (close_after_flush_) close_transport();
    }

    void Connection::close(bool abort) {
        bool first = !closed_.exchange(true);
        if (!first && !abort) return;

        asio::dispatch(ex_, [self = shared_from_this(), abort] {
            if (abort || !self->writing_) {
                self->write_queue_.clear();
                self->close_transport();
            } else {
                self->close_after_flush_ = true;
            }
        });
    }

    void Connection::abort_with(Error error) {
        closed_.store(true);
        asio::dispatch(ex_, [self = shared_from_this(),
                             error = std::move(error)]() mutable {
            if (!self->pending_error_) self->pending_error_ = std::move(error);
            self->write_queue_.clear();
            self->close_transport();
        });
    }

    bool Connection::has_transport() const noexcept {
        return open_.load() && !closed_.load();
    }

    bool Connection::is_stale() noexcept {
        if (!has_transport()) return true;
        tcp::socket* sock = lowest_socket();
        if (!sock || !sock->is_open()) return true;

        // Non-blocking peek: eof or an error means the socket is dead
        boost::system::error_code ec;
        bool was_non_blocking = sock->non_blocking();
        sock->non_blocking(true, ec);
        if (ec) return true;

        char probe;
        sock->receive(asio::buffer(&probe, 1), tcp::socket::message_peek, ec);

        boost::system::error_code restore_ec;
        sock->non_blocking(was_non_blocking, restore_ec);

        if (ec == asio::error::would_block || ec == asio::error::try_again ||
            ec == asio::error::interrupted)
            return false;
        return ec.failed();
    }

    std::shared_ptr<ProtocolConsumer> Connection::consumer() const {
        std::lock_guard<std::mutex> lk(mu_);
        return consumer_;
    }

    bool Connection::set_consumer(std::shared_ptr<ProtocolConsumer> consumer) {
        std::lock_guard<std::mutex> lk(mu_);
        if (consumer_ && consumer_ != consumer && !consumer_->finished()) {
            logger()->warn(
                "connection {}: refused to replace an active consumer", id_);
            return false;
        }
        consumer_ = std::move(consumer);
        return true;
    }

    void Connection::clear_consumer(const ProtocolConsumer* expected) {
        std::lock_guard<std::mutex> lk(mu_);
        if (consumer_.get() == expected) consumer_.reset();
    }

    void Connection::upgrade(std::shared_ptr<ProtocolConsumer> consumer) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            consumer_ = consumer;
        }
        upgraded_.store(true, std::memory_order_release);
        if (consumer) consumer->connection_made(shared_from_this());
    }

    void Connection::set_lost_handler(LostHandler handler) {
        std::lock_guard<std::mutex> lk(mu_);
        lost_handler_ = std::move(handler);
    }

    std::string Connection::remote_address() const {
        const tcp::socket* sock = lowest_socket();
        if (!sock) return {};
        boost::system::error_code ec;
        auto ep = sock->remote_endpoint(ec);
        if (ec) return {};
        return ep.address().to_string() + ":" + std::to_string(ep.port());
    }

    Connection::tcp::socket* Connection::lowest_socket() noexcept {
        if (auto* h = std::get_if<HttpStream>(&m_stream)) return &h->socket();
        if (auto* hs = std::get_if<HttpsStream>(&m_stream))
            return &beast::get_lowest_layer(*hs).socket();
        return nullptr;
    }

    const Connection::tcp::socket* Connection::lowest_socket() const noexcept {
        return const_cast<Connection*>(this)->lowest_socket();
    }

    /// @note No TLS shutdown is performed, the TCP socket is just closed.
    void Connection::close_transport() noexcept {
        open_.store(false);
        tcp::socket* sock = lowest_socket();
        if (!sock || !sock->is_open()) return;

        boost::system::error_code ec;
        auto shutdown_result = sock->shutdown(tcp::socket::shutdown_both, ec);
        auto close_result = sock->close(ec);
        (void)shutdown_result;
        (void)close_result;
    }

}  // namespace relay_cpp
