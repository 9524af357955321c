// tests/test_support.hpp
//
// Shared helpers for the suites that talk to real sockets.
//
// Nothing here is allowed to hang forever:
// - io_context runs on a dedicated thread
// - waits use std::future::wait_for (not Asio timers)
// - on timeout the test fails and aborts to avoid wedging CI.

#pragma once

#include <httplib.h>

#include <atomic>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "gtest/gtest.h"
#include "relay_cpp/client.hpp"
#include "relay_cpp/config.hpp"
#include "relay_cpp/response.hpp"
#include "relay_cpp/result.hpp"

namespace relay_cpp::test {

    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    // ---------------------
    // Hard watchdog (non-Asio)
    // ---------------------
    struct HardWatchdog {
        explicit HardWatchdog(std::chrono::milliseconds timeout)
            : timeout_(timeout), start_(std::chrono::steady_clock::now()) {
            thread_ = std::thread([this] {
                for (;;) {
                    if (done_.load(std::memory_order_relaxed)) return;
                    auto now = std::chrono::steady_clock::now();
                    if (now - start_ >= timeout_) {
                        std::fprintf(
                            stderr,
                            "\n[ WATCHDOG ] test exceeded %lld ms; aborting "
                            "(deadlock or blocking async code)\n",
                            (long long)timeout_.count());
                        std::fflush(stderr);
                        std::abort();
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
            });
        }

        ~HardWatchdog() {
            done_.store(true, std::memory_order_relaxed);
            if (thread_.joinable()) thread_.join();
        }

       private:
        std::chrono::milliseconds timeout_;
        std::chrono::steady_clock::time_point start_;
        std::atomic<bool> done_{false};
        std::thread thread_;
    };

    // ---------------------
    // Test HTTP Server (httplib)
    // ---------------------
    struct HttpTestServer {
        using Handler =
            std::function<void(const httplib::Request&, httplib::Response&)>;

        explicit HttpTestServer(Handler h, bool honor_keep_alive = false)
            : handler_(std::move(h)), honor_keep_alive_(honor_keep_alive) {
            svr_.set_keep_alive_max_count(honor_keep_alive ? 10 : 1);
            svr_.set_keep_alive_timeout(5);

            auto func = [this](const httplib::Request& req,
                               httplib::Response& res) {
                request_count++;
                {
                    std::lock_guard lk(last_req_mu_);
                    last_method = req.method;
                    last_target = req.target;
                    last_body = req.body;
                    last_headers = req.headers;
                }

                int cur = inflight.fetch_add(1) + 1;
                int prev = max_inflight.load();
                while (cur > prev &&
                       !max_inflight.compare_exchange_weak(prev, cur)) {
                }

                handler_(req, res);

                if (!honor_keep_alive_) {
                    res.set_header("Connection", "close");
                }

                inflight.fetch_sub(1);
            };

            svr_.Get(".*", func);
            svr_.Post(".*", func);
            svr_.Put(".*", func);
            svr_.Patch(".*", func);
            svr_.Delete(".*", func);
            svr_.Options(".*", func);

            port_ = svr_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this] { svr_.listen_after_bind(); });
        }

        ~HttpTestServer() {
            svr_.stop();
            if (thread_.joinable()) thread_.join();
        }

        uint16_t port() const noexcept { return static_cast<uint16_t>(port_); }

        std::string url(std::string path) const {
            if (path.empty() || path[0] != '/') path.insert(path.begin(), '/');
            return "http://127.0.0.1:" + std::to_string(port_) + path;
        }

        std::string header(const std::string& name) {
            std::lock_guard lk(last_req_mu_);
            auto it = last_headers.find(name);
            return it == last_headers.end() ? std::string{} : it->second;
        }

        std::atomic<int> request_count{0};
        std::atomic<int> max_inflight{0};
        std::atomic<int> inflight{0};

        std::mutex last_req_mu_;
        std::string last_method;
        std::string last_target;
        std::string last_body;
        httplib::Headers last_headers;

       private:
        httplib::Server svr_;
        Handler handler_;
        bool honor_keep_alive_;
        std::thread thread_;
        int port_;
    };

    // ---------------------
    // Byte-exact server: one scripted session per accepted socket
    // ---------------------
    struct RawServer {
        /// index counts accepted connections from 0
        using Session = std::function<void(tcp::socket&, int index)>;

        explicit RawServer(Session session)
            : session_(std::move(session)),
              acceptor_(ioc_,
                        tcp::endpoint(net::ip::make_address("127.0.0.1"), 0)) {
            port_ = acceptor_.local_endpoint().port();
            thread_ = std::thread([this] { run(); });
        }

        ~RawServer() {
            stopping_.store(true);
            // Wake the blocking accept
            boost::system::error_code ec;
            tcp::socket poke(ioc_);
            poke.connect(
                tcp::endpoint(net::ip::make_address("127.0.0.1"), port_), ec);
            if (thread_.joinable()) thread_.join();
        }

        uint16_t port() const noexcept { return port_; }

        std::string url(const std::string& path = "/") const {
            return "http://127.0.0.1:" + std::to_string(port_) + path;
        }

        std::string authority() const {
            return "127.0.0.1:" + std::to_string(port_);
        }

        std::atomic<int> accepted{0};

       private:
        void run() {
            for (int i = 0;; ++i) {
                tcp::socket sock(ioc_);
                boost::system::error_code ec;
                acceptor_.accept(sock, ec);
                if (ec || stopping_.load()) return;
                accepted.fetch_add(1);
                session_(sock, i);
            }
        }

        Session session_;
        net::io_context ioc_;
        tcp::acceptor acceptor_;
        uint16_t port_{0};
        std::atomic<bool> stopping_{false};
        std::thread thread_;
    };

    /// @brief Read up to and including the blank line. Leftover bytes stay
    /// in buf. Empty on EOF or error.
    inline std::string read_head(tcp::socket& sock, std::string& buf) {
        boost::system::error_code ec;
        std::size_t n =
            net::read_until(sock, net::dynamic_buffer(buf), "\r\n\r\n", ec);
        if (ec) return {};
        std::string head = buf.substr(0, n);
        buf.erase(0, n);
        return head;
    }

    inline std::string read_head(tcp::socket& sock) {
        std::string buf;
        return read_head(sock, buf);
    }

    inline bool write_all(tcp::socket& sock, std::string_view data) {
        boost::system::error_code ec;
        net::write(sock, net::buffer(data.data(), data.size()), ec);
        return !ec;
    }

    /// @brief A port nothing listens on.
    inline uint16_t unused_port() {
        net::io_context ioc;
        tcp::acceptor a(ioc,
                        tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        return a.local_endpoint().port();
    }

    // ---------------------
    // IO runner + await helper
    // ---------------------
    struct IoThreadRunner {
        IoThreadRunner() : ioc_(1) {}

        void start() {
            guard_.emplace(net::make_work_guard(ioc_));
            thread_ = std::thread([this] { ioc_.run(); });
        }

        void stop() {
            if (guard_) guard_.reset();
            ioc_.stop();
            if (thread_.joinable()) thread_.join();
        }

        ~IoThreadRunner() { stop(); }

        net::io_context& ioc() { return ioc_; }

       private:
        net::io_context ioc_;
        std::optional<net::executor_work_guard<net::io_context::executor_type>>
            guard_;
        std::thread thread_;
    };

    template <class T>
    T await_or_abort(net::io_context& ioc, net::awaitable<T> aw,
                     std::chrono::milliseconds timeout) {
        HardWatchdog wd(timeout + std::chrono::milliseconds(1500));

        auto prom = std::make_shared<std::promise<T>>();
        auto fut = prom->get_future();

        net::co_spawn(
            ioc,
            [aw = std::move(aw), prom]() mutable -> net::awaitable<void> {
                try {
                    T v = co_await std::move(aw);
                    prom->set_value(std::move(v));
                } catch (...) {
                    prom->set_exception(std::current_exception());
                }
                co_return;
            },
            net::detached);

        if (fut.wait_for(timeout) != std::future_status::ready) {
            ADD_FAILURE()
                << "Async operation timed out after " << timeout.count()
                << "ms (likely blocking code in async path or pool deadlock).";
            std::abort();
        }

        return fut.get();
    }

    /// @brief Wait for a response handle to settle.
    inline Result<Response> await_response(
        IoThreadRunner& runner, const std::shared_ptr<HttpResponse>& resp,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        return await_or_abort(runner.ioc(), resp->wait(), timeout);
    }

    /// @brief Poll pred until it holds or timeout passes.
    template <class Pred>
    bool eventually(Pred pred, std::chrono::milliseconds timeout =
                                   std::chrono::milliseconds(2000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return pred();
    }

    // ---------------------
    // Config helpers
    // ---------------------
    inline HttpClientConfiguration make_cfg() {
        HttpClientConfiguration cfg{};
        cfg.user_agent = "relay_cpp_gtest";
        cfg.trust_env = false;
        cfg.timeout = std::chrono::milliseconds(2000);
        cfg.pool_config.max_connections = 5;
        cfg.pool_config.max_available = 5;
        return cfg;
    }

}  // namespace relay_cpp::test
