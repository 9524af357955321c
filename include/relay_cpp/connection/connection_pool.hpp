#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "../config.hpp"
#include "../endpoint.hpp"
#include "../error.hpp"
#include "../result.hpp"
#include "connection.hpp"
#include "connection_pool_types.hpp"

namespace relay_cpp {

    class HttpClient;
    class HttpResponse;

    /**
     * Connections for one endpoint key.
     *
     * SAFETY:
     * - Bookkeeping is guarded by a mutex, so the counters may be read from
     *   any thread
     * - Acquire, release and close run on the pool's executor (the client
     *   strand). Idle sockets are peeked and waiter timers woken there
     * - The lock is held only for bookkeeping. Sockets are closed and
     *   waiters woken after it is released
     *
     * INVARIANTS:
     * 1. No connection is both available and concurrent
     * 2. concurrent.size() <= max_connections
     * 3. A connection leaves both sets together when it is lost
     *
     * LIFECYCLE:
     * 1. Created by the client on the first request for its key
     * 2. acquire_connection() / release_connection() while in use
     * 3. close(): stops handing out connections and closes idle ones
     * 4. drain(): wait for in-use connections to go away
     * 5. close(true): closes whatever is still in use
     */
    class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
       public:
        using ConnectionPtr = std::shared_ptr<Connection>;

        ConnectionPool(boost::asio::any_io_executor ex, Endpoint key,
                       ConnectionPoolConfiguration cfg,
                       std::weak_ptr<HttpClient> client);

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        const Endpoint& key() const noexcept { return key_; }

        /// @brief Pop a healthy available connection or create a new one.
        /// Returns nullptr when the pool is at its ceiling or closed. Stale
        /// idle connections met on the way are closed once and dropped.
        /// @note Non-blocking, does not wait
        ConnectionPtr try_acquire_connection();

        /// @brief Acquire a connection, waiting for capacity if needed.
        /// @note Coroutine that may suspend
        boost::asio::awaitable<Result<ConnectionPtr>> acquire_connection();

        /// @brief Hand a connection back after response finished with it.
        /// It is re-admitted when can_reuse() holds and closed otherwise.
        void release_connection(const ConnectionPtr& conn,
                                const HttpResponse* response);

        /// @brief Reuse policy: the response completed and carried
        /// "Connection: keep-alive".
        bool can_reuse(const Connection& conn,
                       const HttpResponse* response) const;

        /// @brief Forget a connection, whichever set it is in.
        void remove_connection(const ConnectionPtr& conn);

        /// @brief Stop handing out connections and close the idle ones.
        /// In-use connections close once released, or right away with abort,
        /// which also discards buffered writes.
        void close(bool abort = false);

        /// @brief Wait for all in-use connections to go away.
        /// @return false on timeout.
        boost::asio::awaitable<bool> drain(
            std::chrono::steady_clock::duration timeout);

        size_t concurrent_connections() const;
        size_t available_connections() const;
        bool closed() const;

        ///@brief Access metrics for monitoring
        ConnectionPoolMetrics const& metrics() const { return metrics_; }

       private:
        struct Waiter {
            std::shared_ptr<boost::asio::steady_timer> timer;
            bool notified{false};
        };

        void on_connection_lost(const ConnectionPtr& conn, const Error& error);

        bool can_reuse_locked_(const Connection& conn,
                               const HttpResponse* response) const;

        /// @brief Pick the next waiter under lock. Its timer is cancelled by
        /// the caller once the lock is released.
        std::shared_ptr<boost::asio::steady_timer> wake_one_locked_();

        void update_gauges_locked_();

        /// @brief Check internal invariants, only in debug builds
        void check_invariants_locked_() const;

        boost::asio::any_io_executor ex_;
        Endpoint key_;
        ConnectionPoolConfiguration cfg_;
        std::weak_ptr<HttpClient> client_;

        mutable std::mutex mu_;
        std::unordered_map<std::uint64_t, ConnectionPtr> concurrent_;
        std::deque<ConnectionPtr> available_;
        std::list<std::shared_ptr<Waiter>> waiters_;
        bool closing_{false};
        std::uint64_t next_id_{1};

        ConnectionPoolMetrics metrics_;
    };

}  // namespace relay_cpp
