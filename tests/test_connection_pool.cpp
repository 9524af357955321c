#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include "relay_cpp/client.hpp"
#include "relay_cpp/config.hpp"
#include "relay_cpp/connection/connection_pool.hpp"
#include "relay_cpp/endpoint.hpp"
#include "relay_cpp/request.hpp"
#include "relay_cpp/response.hpp"
#include "relay_cpp/url.hpp"
#include "test_support.hpp"

using namespace relay_cpp;
using namespace std::chrono_literals;

namespace {

    using ConnectionPtr = ConnectionPool::ConnectionPtr;

    ConnectionPoolConfiguration default_cfg() {
        ConnectionPoolConfiguration cfg;
        cfg.max_connections = 2;
        cfg.max_available = 2;
        return cfg;
    }

    Endpoint make_ep(std::string host = "localhost", std::string port = "80") {
        Endpoint ep;
        ep.scheme = "http";
        ep.host = std::move(host);
        ep.port = std::move(port);
        return ep;
    }

    std::shared_ptr<ConnectionPool> make_pool(
        boost::asio::io_context& io,
        ConnectionPoolConfiguration cfg = default_cfg()) {
        return std::make_shared<ConnectionPool>(io.get_executor(), make_ep(),
                                                cfg,
                                                std::weak_ptr<HttpClient>{});
    }

    TEST(ConnectionPoolTest, TryAcquireStopsAtTheCeiling) {
        boost::asio::io_context io;
        auto pool = make_pool(io);

        auto c1 = pool->try_acquire_connection();
        auto c2 = pool->try_acquire_connection();
        auto c3 = pool->try_acquire_connection();
        ASSERT_TRUE(c1);
        ASSERT_TRUE(c2);
        EXPECT_FALSE(c3);

        // Never the same connection twice
        EXPECT_NE(c1, c2);
        EXPECT_NE(c1->id(), c2->id());
        EXPECT_EQ(pool->concurrent_connections(), 2u);
        EXPECT_EQ(pool->available_connections(), 0u);
        EXPECT_EQ(pool->metrics().connection_created.load(), 2u);
    }

    TEST(ConnectionPoolTest, ReleaseWithoutResponseDiscards) {
        boost::asio::io_context io;
        auto pool = make_pool(io);

        auto c1 = pool->try_acquire_connection();
        ASSERT_TRUE(c1);
        pool->release_connection(c1, nullptr);

        EXPECT_EQ(pool->concurrent_connections(), 0u);
        EXPECT_EQ(pool->available_connections(), 0u);
        EXPECT_EQ(pool->metrics().connection_discarded.load(), 1u);

        auto c2 = pool->try_acquire_connection();
        ASSERT_TRUE(c2);
        EXPECT_NE(c1->id(), c2->id());
        EXPECT_EQ(pool->metrics().connection_reused.load(), 0u);
    }

    TEST(ConnectionPoolTest, ReleasingAForeignConnectionIsCounted) {
        boost::asio::io_context io;
        auto pool = make_pool(io);

        auto stranger = std::make_shared<Connection>(io.get_executor(), 99);
        pool->release_connection(stranger, nullptr);
        EXPECT_EQ(pool->metrics().release_unknown.load(), 1u);

        // Same id as a pooled one, different object
        auto mine = pool->try_acquire_connection();
        ASSERT_TRUE(mine);
        auto twin = std::make_shared<Connection>(io.get_executor(), mine->id());
        pool->release_connection(twin, nullptr);
        EXPECT_EQ(pool->metrics().release_unknown.load(), 2u);
        EXPECT_EQ(pool->concurrent_connections(), 1u);
    }

    TEST(ConnectionPoolTest, RemoveConnectionFreesCapacity) {
        boost::asio::io_context io;
        auto cfg = default_cfg();
        cfg.max_connections = 1;
        auto pool = make_pool(io, cfg);

        auto c1 = pool->try_acquire_connection();
        ASSERT_TRUE(c1);
        EXPECT_FALSE(pool->try_acquire_connection());

        pool->remove_connection(c1);
        EXPECT_EQ(pool->concurrent_connections(), 0u);
        EXPECT_TRUE(pool->try_acquire_connection());
    }

    TEST(ConnectionPoolTest, AcquireTimesOutAtTheCeiling) {
        boost::asio::io_context io;
        auto cfg = default_cfg();
        cfg.max_connections = 1;
        cfg.acquire_timeout = 30ms;
        auto pool = make_pool(io, cfg);

        auto held = pool->try_acquire_connection();
        ASSERT_TRUE(held);

        std::optional<Result<ConnectionPtr>> got;
        boost::asio::co_spawn(
            io,
            [&]() -> boost::asio::awaitable<void> {
                got.emplace(co_await pool->acquire_connection());
            },
            boost::asio::detached);
        io.run_for(2s);

        ASSERT_TRUE(got.has_value());
        ASSERT_TRUE(got->has_error());
        EXPECT_EQ(got->error().code, Error::Code::Timeout);
        EXPECT_EQ(pool->metrics().acquire_timeout.load(), 1u);
        EXPECT_EQ(pool->metrics().waiters.load(), 0u);
    }

    TEST(ConnectionPoolTest, ReleaseWakesAWaiter) {
        boost::asio::io_context io;
        auto cfg = default_cfg();
        cfg.max_connections = 1;
        auto pool = make_pool(io, cfg);

        auto held = pool->try_acquire_connection();
        ASSERT_TRUE(held);

        std::optional<Result<ConnectionPtr>> got;
        boost::asio::co_spawn(
            io,
            [&]() -> boost::asio::awaitable<void> {
                got.emplace(co_await pool->acquire_connection());
            },
            boost::asio::detached);

        // Runs until the coroutine parks on its timer
        io.poll();
        EXPECT_FALSE(got.has_value());
        EXPECT_EQ(pool->metrics().waiters.load(), 1u);

        pool->release_connection(held, nullptr);
        io.run_for(2s);

        ASSERT_TRUE(got.has_value());
        ASSERT_TRUE(got->has_value()) << got->error().message;
        EXPECT_NE(got->value()->id(), held->id());
        EXPECT_EQ(pool->concurrent_connections(), 1u);
        EXPECT_EQ(pool->metrics().acquire_success.load(), 1u);
    }

    TEST(ConnectionPoolTest, CloseCancelsWaitersAndRefusesNewAcquires) {
        boost::asio::io_context io;
        auto cfg = default_cfg();
        cfg.max_connections = 1;
        auto pool = make_pool(io, cfg);

        auto held = pool->try_acquire_connection();
        ASSERT_TRUE(held);

        std::optional<Result<ConnectionPtr>> got;
        boost::asio::co_spawn(
            io,
            [&]() -> boost::asio::awaitable<void> {
                got.emplace(co_await pool->acquire_connection());
            },
            boost::asio::detached);
        io.poll();
        ASSERT_FALSE(got.has_value());

        pool->close();
        io.run_for(2s);

        ASSERT_TRUE(got.has_value());
        ASSERT_TRUE(got->has_error());
        EXPECT_EQ(got->error().code, Error::Code::ClientClosed);
        EXPECT_EQ(pool->metrics().acquire_closed.load(), 1u);
        EXPECT_TRUE(pool->closed());
        EXPECT_FALSE(pool->try_acquire_connection());

        // The in-use connection still belongs to its response
        EXPECT_EQ(pool->concurrent_connections(), 1u);
    }

    TEST(ConnectionPoolTest, DrainReportsTimeoutThenSuccess) {
        boost::asio::io_context io;
        auto pool = make_pool(io);

        auto held = pool->try_acquire_connection();
        ASSERT_TRUE(held);
        pool->close();

        std::optional<bool> first;
        boost::asio::co_spawn(
            io,
            [&]() -> boost::asio::awaitable<void> {
                first = co_await pool->drain(50ms);
            },
            boost::asio::detached);
        io.run_for(2s);
        ASSERT_TRUE(first.has_value());
        EXPECT_FALSE(*first);

        pool->release_connection(held, nullptr);
        io.restart();
        std::optional<bool> second;
        boost::asio::co_spawn(
            io,
            [&]() -> boost::asio::awaitable<void> {
                second = co_await pool->drain(50ms);
            },
            boost::asio::detached);
        io.run_for(2s);
        ASSERT_TRUE(second.has_value());
        EXPECT_TRUE(*second);
    }

    TEST(ConnectionPoolTest, UnconnectedConnectionIsStale) {
        boost::asio::io_context io;
        Connection conn(io.get_executor(), 1);
        EXPECT_FALSE(conn.has_transport());
        EXPECT_TRUE(conn.is_stale());
    }

    TEST(ConnectionPoolTest, StaleIdleConnectionIsEvictedAtAcquire) {
        namespace net = boost::asio;
        using tcp = net::ip::tcp;

        net::io_context io;
        net::io_context srv_io;
        tcp::acceptor acceptor(srv_io,
                               {net::ip::make_address("127.0.0.1"), 0});

        auto pool = make_pool(io);
        auto conn = pool->try_acquire_connection();
        ASSERT_TRUE(conn);

        ConnectPlan plan;
        plan.host = "127.0.0.1";
        plan.port = std::to_string(acceptor.local_endpoint().port());
        std::optional<std::optional<Error>> connected;
        net::co_spawn(
            io,
            [&]() -> net::awaitable<void> {
                connected = co_await conn->connect(plan);
            },
            net::detached);
        for (int i = 0; i < 50 && !connected; ++i) io.run_one_for(100ms);
        ASSERT_TRUE(connected.has_value());
        ASSERT_FALSE(connected->has_value()) << (*connected)->message;
        tcp::socket peer = acceptor.accept();

        auto url = parse_url("http://127.0.0.1/idle");
        ASSERT_TRUE(url.has_value());
        auto req = std::make_shared<HttpRequest>(
            HttpMethod::Get, std::move(url).value(), std::nullopt, Headers{},
            Headers{}, RequestBody{}, RequestParameters{}, nullptr);
        auto resp = std::make_shared<HttpResponse>(io.get_executor(), req);
        resp->data_received(
            "HTTP/1.1 200 OK\r\nConnection: keep-alive\r\n"
            "Content-Length: 0\r\n\r\n");
        ASSERT_EQ(resp->state(), HttpResponse::State::Complete);

        pool->release_connection(conn, resp.get());
        ASSERT_EQ(pool->available_connections(), 1u);

        // A live idle socket is not stale, and peeking leaves it readable
        EXPECT_FALSE(conn->is_stale());
        EXPECT_FALSE(conn->is_stale());

        // io is not running, so the read loop cannot notice the hang-up
        peer.close();
        ASSERT_TRUE(test::eventually([&] { return conn->is_stale(); }));

        auto fresh = pool->try_acquire_connection();
        ASSERT_TRUE(fresh);
        EXPECT_NE(fresh, conn);
        EXPECT_NE(fresh->id(), conn->id());
        EXPECT_FALSE(conn->has_transport());
        EXPECT_EQ(pool->metrics().connection_dropped_stale.load(), 1u);
        EXPECT_EQ(pool->metrics().connection_reused.load(), 0u);
        EXPECT_EQ(pool->metrics().connection_created.load(), 2u);
        EXPECT_EQ(pool->available_connections(), 0u);
        EXPECT_EQ(pool->concurrent_connections(), 1u);

        // The evicted connection winds down without touching the sets again
        io.run_for(200ms);
        EXPECT_EQ(pool->concurrent_connections(), 1u);
        EXPECT_EQ(pool->available_connections(), 0u);
        EXPECT_EQ(pool->metrics().connection_dropped_stale.load(), 1u);
        EXPECT_LE(pool->metrics().connection_lost.load(), 1u);
    }

    TEST(ConnectionPoolTest, IdleConnectionClosedByPeerIsNotReused) {
        using test::read_head;
        using test::write_all;

        // Promises keep-alive, then hangs up anyway
        test::RawServer srv([](auto& sock, int index) {
            if (read_head(sock).empty()) return;
            write_all(sock, "HTTP/1.1 200 OK\r\nConnection: keep-alive\r\n"
                            "Content-Length: 1\r\n\r\n" +
                                std::to_string(index));
        });

        test::IoThreadRunner runner;
        runner.start();
        auto client =
            HttpClient::create(runner.ioc().get_executor(), test::make_cfg());

        auto first = client->get(srv.url("/a")).value_or(nullptr);
        ASSERT_TRUE(first);
        auto r1 = test::await_response(runner, first);
        ASSERT_FALSE(r1.has_error()) << r1.error().message;
        EXPECT_EQ(r1.value().body, "0");

        auto pool = client->find_pool(first->request()->key());
        ASSERT_TRUE(pool);
        // Either the read loop notices the hang-up, or acquire does
        test::eventually(
            [&] { return pool->available_connections() == 0; }, 300ms);

        auto second = client->get(srv.url("/b")).value_or(nullptr);
        ASSERT_TRUE(second);
        auto r2 = test::await_response(runner, second);
        ASSERT_FALSE(r2.has_error()) << r2.error().message;
        EXPECT_EQ(r2.value().body, "1");

        EXPECT_NE(first->connection_id(), second->connection_id());
        EXPECT_GE(pool->metrics().connection_dropped_stale.load() +
                      pool->metrics().connection_lost.load(),
                  1u);
        EXPECT_EQ(srv.accepted.load(), 2);
    }

}  // namespace
