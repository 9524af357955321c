#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "consumer.hpp"
#include "headers.hpp"
#include "request.hpp"
#include "response_parser.hpp"
#include "result.hpp"

namespace relay_cpp {

    class Connection;
    class ConnectionPool;
    class HttpClient;

    /**
     * @brief Value snapshot of a finished HTTP response.
     */
    struct Response {
        /** @brief HTTP status code (e.g., 200, 404). */
        int status_code{0};
        std::string reason;
        /** @brief Headers without hop-by-hop entries. */
        Headers headers;
        /** @brief Decoded body. */
        std::string body;
        /** @brief URL this response answered. */
        std::string url;
        /** @brief Earlier hops (redirects), oldest first. */
        std::vector<Response> history;

        bool ok() const noexcept {
            return status_code >= 200 && status_code < 300;
        }
    };

    /**
     * @brief Streaming response to one request.
     *
     * Consumes bytes from a Connection, moving through
     * Pending -> HeadersReceived -> StreamingBody -> Complete, or into
     * Errored from any earlier state. Headers are visible once
     * HeadersReceived is entered, before the body arrives.
     *
     * Callbacks and state changes happen on the client's executor. Accessors
     * may be called from other threads once wait() has returned.
     */
    class HttpResponse : public ProtocolConsumer,
                         public std::enable_shared_from_this<HttpResponse> {
       public:
        enum class State {
            Pending,
            HeadersReceived,
            StreamingBody,
            Complete,
            Errored,
        };

        using Hook = std::function<void(HttpResponse&)>;
        using DataSink = std::function<void(std::string_view)>;

        HttpResponse(boost::asio::any_io_executor executor,
                     std::shared_ptr<const HttpRequest> request);

        HttpResponse(const HttpResponse&) = delete;
        HttpResponse& operator=(const HttpResponse&) = delete;

        // ProtocolConsumer
        void connection_made(const std::shared_ptr<Connection>& conn) override;
        void data_received(std::string_view data) override;
        void eof_received() override;
        void connection_lost(const Error& error) override;
        bool finished() const noexcept override;

        State state() const noexcept {
            return state_.load(std::memory_order_acquire);
        }

        int status_code() const noexcept { return status_code_; }
        const std::string& reason() const noexcept { return reason_; }

        /// @brief Headers as received, hop-by-hop entries included.
        const Headers& raw_headers() const noexcept { return raw_headers_; }

        /// @brief Headers without hop-by-hop entries. When the body was
        /// decompressed, Content-Encoding and Content-Length are dropped too.
        const Headers& headers() const noexcept { return headers_; }

        /// @brief Body bytes received since the last call.
        std::string recv_body();

        /// @brief Whole body received so far. Empty when an on_data sink
        /// took the bytes.
        const std::string& content() const noexcept { return content_; }
        std::string content_string() const { return content_; }
        Result<nlohmann::json> content_json() const;

        /// @brief Failed, or the status is not 2xx.
        bool is_error() const noexcept;

        /// @brief The failure, or an error describing a 4xx/5xx status.
        std::optional<Error> status_error() const;

        /// @brief The failure that ended this response, if any.
        const std::optional<Error>& error() const noexcept { return error_; }

        const std::shared_ptr<const HttpRequest>& request() const noexcept {
            return request_;
        }

        std::string url() const { return request_->full_url(); }

        const std::vector<Response>& history() const noexcept {
            return history_;
        }

        /// @brief The connection serving this response, only while attached.
        std::shared_ptr<Connection> connection() const;

        /// @brief Id of the last connection this response ran on, 0 if none.
        std::uint64_t connection_id() const noexcept { return connection_id_; }

        size_t reconnect_attempts() const noexcept { return attempts_; }

        /// @brief Bytes received in the current attempt.
        size_t bytes_received() const noexcept { return bytes_received_; }

        /// @brief The last response of a redirect chain starting here.
        std::shared_ptr<HttpResponse> final_response();

        Response snapshot() const;

        /// @brief Call hook once headers are available. Fires immediately
        /// (on the executor) if they already are.
        void on_headers(Hook hook);

        /// @brief Deliver body chunks to sink instead of accumulating them.
        void on_data(DataSink sink);

        /// @brief Call hook once the response is complete or errored.
        void on_finished(Hook hook);

        /// @brief Wait for the final outcome. For a redirect chain this is
        /// the last hop.
        boost::asio::awaitable<Result<Response>> wait();

        /**
         * @brief Decide whether the request may be replayed on a new
         * connection after error.
         * @return Retries remaining before this one (0 = do not reconnect).
         * The attempt counter is consumed when non-zero.
         */
        size_t can_reconnect(size_t max_reconnect, const Error& error,
                             bool allow_non_idempotent);

       private:
        friend class HttpClient;
        friend class ConnectionPool;

        void attach(const std::shared_ptr<Connection>& conn);
        void detach();
        void start();
        void fail(Error error);
        void finish();
        void arm_timer();
        void on_timeout();
        void process_parser();
        void headers_ready();
        void deliver(std::string chunk);
        void run_post_hooks();
        void settle();
        void resolve(const Result<Response>& outcome);

        boost::asio::any_io_executor ex_;
        std::shared_ptr<const HttpRequest> request_;

        std::atomic<State> state_{State::Pending};
        ResponseParser parser_;

        int status_code_{0};
        std::string reason_;
        Headers raw_headers_;
        Headers headers_;
        std::string content_;
        size_t flushed_{0};
        std::optional<Error> error_;

        std::weak_ptr<Connection> connection_;
        std::uint64_t connection_id_{0};
        size_t attempts_{0};
        size_t bytes_received_{0};

        boost::asio::steady_timer timer_;

        std::vector<Hook> header_hooks_;
        DataSink sink_;
        /// Redirect then release, installed by the client
        std::vector<Hook> post_hooks_;
        std::vector<Hook> finished_hooks_;

        std::vector<Response> history_;
        std::shared_ptr<HttpResponse> next_;
        std::vector<std::weak_ptr<HttpResponse>> predecessors_;

        bool settled_{false};
        std::optional<Result<Response>> outcome_;
        std::vector<std::shared_ptr<boost::asio::steady_timer>> waiters_;
    };

}  // namespace relay_cpp
