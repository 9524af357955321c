#pragma once

#include <utility>
#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "relay_cpp/config.hpp"
#include "relay_cpp/connection/connection_pool.hpp"
#include "relay_cpp/cookie_jar.hpp"
#include "relay_cpp/endpoint.hpp"
#include "relay_cpp/http_method.hpp"
#include "relay_cpp/middleware.hpp"
#include "relay_cpp/request.hpp"
#include "relay_cpp/response.hpp"
#include "relay_cpp/result.hpp"

namespace relay_cpp {

    /**
     * @brief An asynchronous HTTP client using C++20 coroutines.
     *
     * Owns one ConnectionPool per endpoint key and funnels every request,
     * redirect and reconnect through response(). All dispatch runs on one
     * strand, so pool bookkeeping never races request dispatch. request()
     * and close() may be called from any thread.
     *
     * Always held by shared_ptr; construct with create().
     */
    class HttpClient : public std::enable_shared_from_this<HttpClient> {
       public:
        /// @brief Overrides for again(). Unset fields are taken from the
        /// prior request.
        struct AgainOptions {
            std::optional<HttpMethod> method;
            std::optional<UrlComponents> url;
            std::optional<RequestBody> body;
            /// Send no body (and no Content-Type) on the new attempt.
            bool drop_body{false};
            /// Record the prior response in the new one's history.
            bool history{true};
            /// Merged over the prior request's headers.
            Headers headers;
        };

        /**
         * @brief Creates a client.
         * @param ex The executor to run on. The client wraps it in a strand.
         * @param cfg Configuration, read once.
         * @throws std::runtime_error when the TLS material cannot be loaded.
         */
        static std::shared_ptr<HttpClient> create(
            boost::asio::any_io_executor ex, HttpClientConfiguration cfg = {});

        HttpClient(const HttpClient&) = delete;
        HttpClient& operator=(const HttpClient&) = delete;

        /**
         * @brief Starts a request.
         * @param method The HTTP method.
         * @param url Absolute http(s) URL, or "host:port" for CONNECT.
         * @param opts Per-request overrides.
         * @return The response handle, or an error when the request could not
         * be built (bad URL, bad proxy configuration, client closed). Every
         * later failure is reported through the handle.
         */
        Result<std::shared_ptr<HttpResponse>> request(HttpMethod method,
                                                      std::string_view url,
                                                      RequestOptions opts = {});

        /// @brief GET. Follows redirects unless opts says otherwise.
        Result<std::shared_ptr<HttpResponse>> get(std::string_view url,
                                                  RequestOptions opts = {});
        /// @brief OPTIONS. Follows redirects unless opts says otherwise.
        Result<std::shared_ptr<HttpResponse>> options(std::string_view url,
                                                      RequestOptions opts = {});
        Result<std::shared_ptr<HttpResponse>> head(std::string_view url,
                                                   RequestOptions opts = {});
        Result<std::shared_ptr<HttpResponse>> post(std::string_view url,
                                                   RequestOptions opts = {});
        Result<std::shared_ptr<HttpResponse>> put(std::string_view url,
                                                  RequestOptions opts = {});
        Result<std::shared_ptr<HttpResponse>> patch(std::string_view url,
                                                    RequestOptions opts = {});
        Result<std::shared_ptr<HttpResponse>> del(std::string_view url,
                                                  RequestOptions opts = {});

        /**
         * @brief Dispatch request on a connection. Every request path ends
         * here: new requests, redirects and reconnects.
         * @param request What to send.
         * @param existing Response to drive, built for request. A new one is
         * created when null.
         * @param new_connection Acquire a connection even if existing still
         * has one.
         * @return The response handle. Failures never escape as exceptions,
         * they finish the response instead.
         */
        std::shared_ptr<HttpResponse> response(
            std::shared_ptr<const HttpRequest> request,
            std::shared_ptr<HttpResponse> existing = nullptr,
            bool new_connection = false);

        /**
         * @brief Start a follow-up attempt of a finished response: a redirect
         * hop or a second pass. The prior response resolves with the outcome
         * of the new one.
         * @return InvalidState when prior has not finished yet.
         */
        Result<std::shared_ptr<HttpResponse>> again(
            const std::shared_ptr<HttpResponse>& prior,
            AgainOptions overrides);

        /// @brief again() with no overrides.
        Result<std::shared_ptr<HttpResponse>> again(
            const std::shared_ptr<HttpResponse>& prior);

        /**
         * @brief Delay before a reconnect when attempts_remaining further
         * retries are left after it: base * (ln(n) + 1), rounded to 100ms.
         * Zero when none are left.
         */
        std::chrono::milliseconds reconnect_time_lag(
            size_t attempts_remaining) const;

        /**
         * @brief Stop accepting requests, close every pool and wait up to
         * drain_timeout for in-use connections to go away.
         * @param abort Discard buffered writes and close sockets at once.
         * @return true when everything drained in time.
         */
        boost::asio::awaitable<bool> close(
            std::chrono::steady_clock::duration drain_timeout =
                std::chrono::seconds(5),
            bool abort = false);

        /// @brief Close every pool without waiting. The pools are closed on
        /// the client's strand, so this only schedules the work when called
        /// from another thread.
        void abort();

        bool closed() const noexcept {
            return closed_.load(std::memory_order_acquire);
        }

        /// @brief In-use connections, summed across pools.
        size_t concurrent_connections() const;
        /// @brief Idle connections, summed across pools.
        size_t available_connections() const;

        [[nodiscard]] HttpClientConfiguration const& config() const noexcept {
            return cfg_;
        }

        /// @brief Effective proxy table (configured or from the environment).
        const ProxyInfo& proxy_info() const noexcept { return proxy_info_; }

        /// @brief The pool for key, nullptr if no request used it yet.
        std::shared_ptr<ConnectionPool> find_pool(const Endpoint& key) const;

        /// @brief The strand all dispatch runs on.
        const boost::asio::any_io_executor& get_executor() const noexcept {
            return strand_;
        }

        CookieJar& cookies() noexcept { return cookies_; }

       private:
        HttpClient(boost::asio::any_io_executor strand,
                   HttpClientConfiguration cfg);

        Result<std::shared_ptr<const HttpRequest>> build_request(
            HttpMethod method, std::string_view url, RequestOptions opts);

        void apply_middleware(const RequestContext& ctx,
                              Headers& headers) const;

        /// @brief Cookie header value for url: given, then the jar, then
        /// extra.
        std::string cookie_header(
            const UrlComponents& url, const std::string& given,
            const std::vector<std::pair<std::string, std::string>>& extra)
            const;

        std::shared_ptr<ConnectionPool> pool_for(const Endpoint& key);

        boost::asio::awaitable<void> dispatch(
            std::shared_ptr<const HttpRequest> request,
            std::shared_ptr<HttpResponse> response, bool new_connection);

        boost::asio::awaitable<bool> close_on_strand(
            std::chrono::steady_clock::duration drain_timeout, bool abort);

        void install_hooks(const std::shared_ptr<HttpResponse>& response);

        /// @brief Post hook: start the next hop of a redirect.
        void follow_redirect(HttpResponse& response);

        /// @brief Post hook: hand the connection back to its pool.
        void release(HttpResponse& response);

        boost::asio::any_io_executor strand_;
        HttpClientConfiguration cfg_;
        ProxyInfo proxy_info_;
        Headers default_headers_;
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
        std::string boundary_;
        CookieJar cookies_;

        mutable std::mutex pools_mu_;
        std::unordered_map<Endpoint, std::shared_ptr<ConnectionPool>> pools_;

        std::atomic<bool> closed_{false};
    };

}  // namespace relay_cpp
