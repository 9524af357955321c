#include "relay_cpp/response.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "relay_cpp/connection/connection.hpp"
#include "relay_cpp/log.hpp"

namespace relay_cpp {

    namespace asio = boost::asio;

    namespace {

        ResponseParser::Options parser_options(const HttpRequest& req) {
            ResponseParser::Options o;
            o.head_request = req.is_head();
            o.decompress = req.params().decompress;
            o.max_body_bytes = req.params().max_body_bytes;
            return o;
        }

    }  // namespace

    HttpResponse::HttpResponse(asio::any_io_executor executor,
                               std::shared_ptr<const HttpRequest> request)
        : ex_(std::move(executor)),
          request_(std::move(request)),
          parser_(parser_options(*request_)),
          timer_(ex_) {}

    // -------- ProtocolConsumer --------

    void HttpResponse::connection_made(const std::shared_ptr<Connection>& conn) {
        attach(conn);
    }

    void HttpResponse::data_received(std::string_view data) {
        if (finished()) return;
        bytes_received_ += data.size();

        size_t used = parser_.feed(data);
        if (used < data.size() || parser_.error()) {
            std::string why = parser_.error()
                                  ? *parser_.error()
                                  : std::string("unexpected bytes after the "
                                                "end of the response");
            logger()->warn("protocol violation from {}: {}", url(), why);
            int status = parser_.is_headers_complete() ? parser_.status_code()
                                                       : status_code_;
            fail(Error{Error::Code::ProtocolViolation, why, status});
            return;
        }
        process_parser();
    }

    void HttpResponse::eof_received() {
        if (finished()) return;
        // Nothing arrived yet: left to connection_lost, which may reconnect
        if (bytes_received_ == 0) return;
        parser_.put_eof();
        if (parser_.error()) {
            fail(Error{Error::Code::ProtocolViolation, *parser_.error(),
                       status_code_});
            return;
        }
        process_parser();
    }

    void HttpResponse::connection_lost(const Error& error) { fail(error); }

    bool HttpResponse::finished() const noexcept {
        auto s = state();
        return s == State::Complete || s == State::Errored;
    }

    // -------- accessors --------

    std::string HttpResponse::recv_body() {
        std::string out = content_.substr(flushed_);
        flushed_ = content_.size();
        return out;
    }

    Result<nlohmann::json> HttpResponse::content_json() const {
        try {
            return Result<nlohmann::json>::ok(nlohmann::json::parse(content_));
        } catch (const nlohmann::json::exception& e) {
            return Result<nlohmann::json>::err(
                Error::Code::Unknown,
                std::string("Response body is not JSON: ") + e.what(),
                status_code_);
        }
    }

    bool HttpResponse::is_error() const noexcept {
        if (error_) return true;
        return status_code_ < 200 || status_code_ >= 300;
    }

    std::optional<Error> HttpResponse::status_error() const {
        if (error_) return error_;
        if (status_code_ >= 400) {
            std::string kind = status_code_ >= 500 ? "Server" : "Client";
            return Error{Error::Code::Unknown,
                         std::to_string(status_code_) + " " + kind +
                             " Error: " + reason_ + " for url: " + url(),
                         status_code_};
        }
        return std::nullopt;
    }

    std::shared_ptr<Connection> HttpResponse::connection() const {
        return connection_.lock();
    }

    std::shared_ptr<HttpResponse> HttpResponse::final_response() {
        auto cur = shared_from_this();
        while (cur->next_) cur = cur->next_;
        return cur;
    }

    Response HttpResponse::snapshot() const {
        Response r;
        r.status_code = status_code_;
        r.reason = reason_;
        r.headers = headers_;
        r.body = content_;
        r.url = url();
        r.history = history_;
        return r;
    }

    // -------- hooks --------

    void HttpResponse::on_headers(Hook hook) {
        asio::dispatch(ex_, [self = shared_from_this(),
                             hook = std::move(hook)]() mutable {
            if (self->state() != State::Pending && self->status_code_ != 0) {
                hook(*self);
            } else if (!self->finished()) {
                self->header_hooks_.push_back(std::move(hook));
            }
        });
    }

    void HttpResponse::on_data(DataSink sink) {
        asio::dispatch(ex_, [self = shared_from_this(),
                             sink = std::move(sink)]() mutable {
            if (!self->content_.empty()) {
                sink(std::string_view(self->content_).substr(self->flushed_));
                self->content_.clear();
                self->flushed_ = 0;
            }
            self->sink_ = std::move(sink);
        });
    }

    void HttpResponse::on_finished(Hook hook) {
        asio::dispatch(ex_, [self = shared_from_this(),
                             hook = std::move(hook)]() mutable {
            if (self->finished()) {
                hook(*self);
            } else {
                self->finished_hooks_.push_back(std::move(hook));
            }
        });
    }

    // -------- waiting --------

    asio::awaitable<Result<Response>> HttpResponse::wait() {
        auto self = shared_from_this();
        auto outcome = co_await asio::co_spawn(
            ex_,
            [self]() -> asio::awaitable<std::optional<Result<Response>>> {
                while (!self->settled_) {
                    auto t = std::make_shared<asio::steady_timer>(
                        self->ex_, asio::steady_timer::time_point::max());
                    self->waiters_.push_back(t);
                    boost::system::error_code ec;
                    co_await t->async_wait(
                        asio::redirect_error(asio::use_awaitable, ec));
                }
                co_return self->outcome_;
            },
            asio::use_awaitable);
        co_return std::move(*outcome);
    }

    // -------- lifecycle (executor only) --------

    size_t HttpResponse::can_reconnect(size_t max_reconnect, const Error& error,
                                       bool allow_non_idempotent) {
        if (bytes_received_ > 0) return 0;
        if (!is_transport_error(error.code)) return 0;
        if (!allow_non_idempotent && !is_idempotent(request_->method()))
            return 0;
        if (attempts_ >= max_reconnect) return 0;
        size_t retries = max_reconnect - attempts_;
        ++attempts_;
        return retries;
    }

    void HttpResponse::attach(const std::shared_ptr<Connection>& conn) {
        connection_ = conn;
        if (conn) connection_id_ = conn->id();
    }

    void HttpResponse::detach() { connection_.reset(); }

    void HttpResponse::start() {
        state_.store(State::Pending, std::memory_order_release);
        status_code_ = 0;
        reason_.clear();
        raw_headers_ = Headers{};
        headers_ = Headers{};
        bytes_received_ = 0;
        parser_.reset();
        arm_timer();

        auto conn = connection();
        if (!conn) {
            fail(Error{Error::Code::InvalidState,
                       "Response started without a connection"});
            return;
        }

        if (request_->method() == HttpMethod::Connect) {
            // The tunnel was opened by the transport
            status_code_ = 200;
            reason_ = "Connection established";
            headers_ready();
            if (!finished()) finish();
            return;
        }

        conn->write(request_->encode());
    }

    void HttpResponse::arm_timer() {
        auto timeout = request_->params().timeout;
        if (timeout.count() <= 0) return;
        timer_.expires_after(timeout);
        timer_.async_wait([weak = weak_from_this()](
                              const boost::system::error_code& ec) {
            if (ec) return;
            if (auto self = weak.lock()) self->on_timeout();
        });
    }

    void HttpResponse::on_timeout() {
        if (finished()) return;
        Error err{Error::Code::Timeout,
                  "Request to " + url() + " timed out after " +
                      std::to_string(request_->params().timeout.count()) +
                      "ms",
                  status_code_};
        if (auto conn = connection()) {
            conn->abort_with(std::move(err));
        } else {
            fail(std::move(err));
        }
    }

    void HttpResponse::process_parser() {
        if (state() == State::Pending && parser_.is_headers_complete()) {
            status_code_ = parser_.status_code();
            reason_ = parser_.reason();
            raw_headers_ = parser_.headers();
            headers_ready();
            if (finished()) return;
        }
        if (!parser_.is_headers_complete()) return;

        std::string chunk = parser_.recv_body();
        if (!chunk.empty()) deliver(std::move(chunk));
        if (finished()) return;

        if (parser_.is_message_complete()) finish();
    }

    void HttpResponse::headers_ready() {
        headers_ = headers::strip_hop_by_hop(raw_headers_);
        if (parser_.is_decoding()) {
            headers_.erase(boost::beast::http::field::content_encoding);
            headers_.erase(boost::beast::http::field::content_length);
        }
        state_.store(State::HeadersReceived, std::memory_order_release);

        auto hooks = std::move(header_hooks_);
        header_hooks_.clear();
        for (auto& h : hooks) {
            h(*this);
            if (finished()) break;
        }
    }

    void HttpResponse::deliver(std::string chunk) {
        if (state() == State::HeadersReceived) {
            state_.store(State::StreamingBody, std::memory_order_release);
        }
        if (sink_) {
            sink_(chunk);
        } else {
            content_.append(chunk);
        }
    }

    void HttpResponse::fail(Error error) {
        if (finished()) return;
        if (error.status_code == 0) error.status_code = status_code_;
        logger()->debug("{} failed: {}", request_->first_line(),
                        describe(error));
        error_ = std::move(error);
        timer_.cancel();
        state_.store(State::Errored, std::memory_order_release);
        run_post_hooks();
    }

    void HttpResponse::finish() {
        if (finished()) return;
        timer_.cancel();
        state_.store(State::Complete, std::memory_order_release);
        run_post_hooks();
    }

    void HttpResponse::run_post_hooks() {
        auto self = shared_from_this();

        auto post = std::move(post_hooks_);
        post_hooks_.clear();
        for (auto& h : post) h(*this);

        auto fin = std::move(finished_hooks_);
        finished_hooks_.clear();
        for (auto& h : fin) h(*this);

        settle();
    }

    void HttpResponse::settle() {
        // A successor started by a redirect settles the whole chain
        if (next_) return;

        auto outcome = error_ ? Result<Response>::err(*error_)
                              : Result<Response>::ok(snapshot());
        resolve(outcome);
        for (auto& w : predecessors_) {
            if (auto p = w.lock()) p->resolve(outcome);
        }
    }

    void HttpResponse::resolve(const Result<Response>& outcome) {
        if (settled_) return;
        settled_ = true;
        outcome_ = outcome;
        auto waiters = std::move(waiters_);
        waiters_.clear();
        for (auto& t : waiters) t->cancel();
    }

}  // namespace relay_cpp
