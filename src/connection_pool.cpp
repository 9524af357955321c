#include "relay_cpp/connection/connection_pool.hpp"

#include <algorithm>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cassert>
#include <unordered_set>
#include <vector>

#include "relay_cpp/client.hpp"
#include "relay_cpp/headers.hpp"
#include "relay_cpp/log.hpp"
#include "relay_cpp/response.hpp"

namespace relay_cpp {

    namespace asio = boost::asio;

    namespace {

        // Unlike cancel(), a zero expiry also wakes a waiter that has
        // registered but not reached async_wait yet
        void wake_timer(asio::steady_timer& timer) {
            timer.expires_after(asio::steady_timer::duration::zero());
        }

    }  // namespace

    ConnectionPool::ConnectionPool(asio::any_io_executor ex, Endpoint key,
                                   ConnectionPoolConfiguration cfg,
                                   std::weak_ptr<HttpClient> client)
        : ex_(std::move(ex)),
          key_(std::move(key)),
          cfg_(cfg),
          client_(std::move(client)) {}

    ConnectionPool::ConnectionPtr ConnectionPool::try_acquire_connection() {
        std::vector<ConnectionPtr> stale;
        ConnectionPtr out;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closing_) return nullptr;

            // Ceiling first: a reused connection counts like a new one
            if (concurrent_.size() >= cfg_.max_connections) return nullptr;

            while (!available_.empty()) {
                auto c = std::move(available_.front());
                available_.pop_front();
                if (c->is_stale()) {
                    metrics_.connection_dropped_stale.fetch_add(
                        1, std::memory_order_relaxed);
                    stale.push_back(std::move(c));
                    continue;
                }
                out = std::move(c);
                metrics_.connection_reused.fetch_add(1,
                                                     std::memory_order_relaxed);
                break;
            }

            if (!out) {
                out = std::make_shared<Connection>(ex_, next_id_++);
                out->set_lost_handler(
                    [weak = weak_from_this()](const ConnectionPtr& c,
                                              const Error& e) {
                        if (auto pool = weak.lock()) {
                            pool->on_connection_lost(c, e);
                        } else if (auto cons = c->consumer();
                                   cons && !cons->finished()) {
                            cons->connection_lost(e);
                        }
                    });
                metrics_.connection_created.fetch_add(
                    1, std::memory_order_relaxed);
            }

            concurrent_.emplace(out->id(), out);
            update_gauges_locked_();
            check_invariants_locked_();
        }

        // Transport teardown happens outside the lock
        for (auto& c : stale) {
            logger()->debug("pool {}: evicting stale connection {}",
                            key_.to_string(), c->id());
            c->close(true);
        }
        if (out) {
            logger()->debug("pool {}: acquired connection {}",
                            key_.to_string(), out->id());
        }
        return out;
    }

    asio::awaitable<Result<ConnectionPool::ConnectionPtr>>
    ConnectionPool::acquire_connection() {
        using R = Result<ConnectionPtr>;

        for (;;) {
            // Fast path: try without allocating a waiter
            if (auto c = try_acquire_connection()) {
                metrics_.acquire_success.fetch_add(1,
                                                   std::memory_order_relaxed);
                co_return R::ok(std::move(c));
            }

            auto w = std::make_shared<Waiter>();
            w->timer = std::make_shared<asio::steady_timer>(ex_);
            if (cfg_.acquire_timeout.count() > 0) {
                w->timer->expires_after(cfg_.acquire_timeout);
            } else {
                w->timer->expires_at(
                    std::chrono::steady_clock::time_point::max());
            }

            bool retry = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (closing_) {
                    metrics_.acquire_closed.fetch_add(
                        1, std::memory_order_relaxed);
                    co_return R::err(Error::Code::ClientClosed,
                                     "Connection pool " + key_.to_string() +
                                         " is closed");
                }
                // Close lost-wakeup window
                if (concurrent_.size() < cfg_.max_connections) {
                    retry = true;
                } else {
                    waiters_.push_back(w);
                    metrics_.waiters.fetch_add(1, std::memory_order_relaxed);
                }
            }
            if (retry) continue;

            boost::system::error_code ec;
            co_await w->timer->async_wait(
                asio::redirect_error(asio::use_awaitable, ec));

            // Remove ourselves on ALL exit paths
            {
                std::lock_guard<std::mutex> lk(mu_);
                auto it = std::find(waiters_.begin(), waiters_.end(), w);
                if (it != waiters_.end()) {
                    waiters_.erase(it);
                    metrics_.waiters.fetch_sub(1, std::memory_order_relaxed);
                }
            }

            if (w->notified || closed()) continue;

            if (!ec) {
                metrics_.acquire_timeout.fetch_add(1,
                                                   std::memory_order_relaxed);
                co_return R::err(Error::Code::Timeout,
                                 "Timed out waiting for a connection to " +
                                     key_.to_string());
            }
            // Spurious wake-up: re-check
        }
    }

    bool ConnectionPool::can_reuse(const Connection& conn,
                                   const HttpResponse* response) const {
        std::lock_guard<std::mutex> lk(mu_);
        return can_reuse_locked_(conn, response);
    }

    bool ConnectionPool::can_reuse_locked_(const Connection& conn,
                                           const HttpResponse* response) const {
        if (closing_ || response == nullptr) return false;
        if (response->state() != HttpResponse::State::Complete ||
            response->error())
            return false;
        if (response->request()->method() == HttpMethod::Connect) return false;
        if (conn.upgraded() || !conn.has_transport()) return false;
        if (available_.size() >= cfg_.max_available) return false;
        return headers::has_token(response->raw_headers(), "Connection",
                                  "keep-alive");
    }

    void ConnectionPool::release_connection(const ConnectionPtr& conn,
                                            const HttpResponse* response) {
        if (!conn) return;
        std::shared_ptr<asio::steady_timer> wake;
        bool reused = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = concurrent_.find(conn->id());
            if (it == concurrent_.end() || it->second != conn) {
                metrics_.release_unknown.fetch_add(1,
                                                   std::memory_order_relaxed);
                return;
            }
            concurrent_.erase(it);

            reused = can_reuse_locked_(*conn, response);
            if (reused) {
                available_.push_back(conn);
            } else {
                metrics_.connection_discarded.fetch_add(
                    1, std::memory_order_relaxed);
            }

            update_gauges_locked_();
            wake = wake_one_locked_();
            check_invariants_locked_();
        }

        logger()->debug("pool {}: released connection {} ({})",
                        key_.to_string(), conn->id(),
                        reused ? "kept alive" : "closing");

        // An upgraded connection now belongs to its new protocol
        if (!reused && !conn->upgraded()) conn->close();
        if (wake) wake_timer(*wake);
    }

    void ConnectionPool::remove_connection(const ConnectionPtr& conn) {
        if (!conn) return;
        std::shared_ptr<asio::steady_timer> wake;
        {
            std::lock_guard<std::mutex> lk(mu_);
            bool removed = false;
            auto it = concurrent_.find(conn->id());
            if (it != concurrent_.end() && it->second == conn) {
                concurrent_.erase(it);
                removed = true;
            }
            auto ait = std::find(available_.begin(), available_.end(), conn);
            if (ait != available_.end()) {
                available_.erase(ait);
                removed = true;
            }
            if (!removed) return;
            update_gauges_locked_();
            wake = wake_one_locked_();
            check_invariants_locked_();
        }
        if (wake) wake_timer(*wake);
    }

    void ConnectionPool::on_connection_lost(const ConnectionPtr& conn,
                                            const Error& error) {
        metrics_.connection_lost.fetch_add(1, std::memory_order_relaxed);
        remove_connection(conn);

        auto consumer = conn->consumer();
        // Nothing attached: an idle connection went away
        if (!consumer || consumer->finished()) return;

        auto response = std::dynamic_pointer_cast<HttpResponse>(consumer);
        if (!response) {
            consumer->connection_lost(error);
            return;
        }

        auto client = client_.lock();
        if (!client || client->closed()) {
            response->fail(error);
            return;
        }

        const auto& cfg = client->config();
        size_t retries = response->can_reconnect(
            cfg.max_reconnect, error, cfg.reconnect_non_idempotent);
        if (retries == 0) {
            response->fail(error);
            return;
        }

        conn->clear_consumer(response.get());
        response->detach();
        metrics_.reconnects_scheduled.fetch_add(1, std::memory_order_relaxed);

        auto lag = client->reconnect_time_lag(retries - 1);
        if (lag.count() == 0) {
            logger()->debug("pool {}: reconnecting {} after {}",
                            key_.to_string(), response->request()->first_line(),
                            describe(error));
            client->response(response->request(), response, true);
            return;
        }

        logger()->debug("pool {}: reconnecting {} in {}ms after {}",
                        key_.to_string(), response->request()->first_line(),
                        lag.count(), describe(error));
        auto t = std::make_shared<asio::steady_timer>(ex_, lag);
        t->async_wait([t, weak_client = client_, response,
                       error](const boost::system::error_code& ec) {
            if (auto c = weak_client.lock(); c && !ec) {
                c->response(response->request(), response, true);
            } else {
                response->fail(error);
            }
        });
    }

    void ConnectionPool::close(bool abort) {
        std::vector<ConnectionPtr> conns;
        std::list<std::shared_ptr<Waiter>> to_cancel;
        {
            std::lock_guard<std::mutex> lk(mu_);
            closing_ = true;
            for (auto& c : available_) conns.push_back(c);
            available_.clear();
            // In-use connections finish their response unless aborting
            if (abort) {
                for (auto& [id, c] : concurrent_) conns.push_back(c);
            }
            to_cancel.swap(waiters_);
            metrics_.waiters.store(0, std::memory_order_relaxed);
            update_gauges_locked_();
            check_invariants_locked_();
        }

        for (auto& w : to_cancel) wake_timer(*w->timer);
        for (auto& c : conns) c->close(abort);
    }

    asio::awaitable<bool> ConnectionPool::drain(
        std::chrono::steady_clock::duration timeout) {
        auto deadline = std::chrono::steady_clock::now() + timeout;

        for (;;) {
            {
                std::lock_guard<std::mutex> lk(mu_);
                if (concurrent_.empty()) co_return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) co_return false;

            // Wait a bit before checking again
            asio::steady_timer timer(ex_);
            timer.expires_after(std::min<std::chrono::steady_clock::duration>(
                std::chrono::milliseconds(100),
                deadline - std::chrono::steady_clock::now()));
            boost::system::error_code ec;
            co_await timer.async_wait(
                asio::redirect_error(asio::use_awaitable, ec));
        }
    }

    size_t ConnectionPool::concurrent_connections() const {
        std::lock_guard<std::mutex> lk(mu_);
        return concurrent_.size();
    }

    size_t ConnectionPool::available_connections() const {
        std::lock_guard<std::mutex> lk(mu_);
        return available_.size();
    }

    bool ConnectionPool::closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closing_;
    }

    std::shared_ptr<asio::steady_timer> ConnectionPool::wake_one_locked_() {
        while (!waiters_.empty()) {
            auto w = waiters_.front();
            waiters_.pop_front();
            metrics_.waiters.fetch_sub(1, std::memory_order_relaxed);
            if (w->notified) continue;
            w->notified = true;
            return w->timer;
        }
        return {};
    }

    void ConnectionPool::update_gauges_locked_() {
        metrics_.concurrent.store(concurrent_.size(), std::memory_order_relaxed);
        metrics_.available.store(available_.size(), std::memory_order_relaxed);
    }

    void ConnectionPool::check_invariants_locked_() const {
#ifndef NDEBUG
        std::unordered_set<const Connection*> in_use;
        for (auto const& [id, c] : concurrent_) {
            assert(c && "concurrent connection is null");
            assert(c->id() == id && "concurrent connection id drift");
            in_use.insert(c.get());
        }
        for (auto const& c : available_) {
            assert(c && "available connection is null");
            assert(in_use.find(c.get()) == in_use.end() &&
                   "connection both available and concurrent");
        }
        assert(concurrent_.size() <= cfg_.max_connections &&
               "concurrent connections above the ceiling");
#else
        return;
#endif
    }

}  // namespace relay_cpp
