#pragma once

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

#include "../consumer.hpp"
#include "../endpoint.hpp"
#include "../error.hpp"

namespace relay_cpp {

    /**
     * @brief One transport plus the consumer currently attached to it.
     *
     * Everything a connection reads goes to its consumer. At most one
     * consumer is attached at a time and it is only replaced once finished,
     * so two requests never interleave on one socket.
     *
     * All I/O runs on the executor given at construction. write(), close()
     * and abort_with() may be called from any thread.
     */
    class Connection : public std::enable_shared_from_this<Connection> {
       private:
        using tcp = boost::asio::ip::tcp;
        using HttpStream = boost::beast::tcp_stream;
        using HttpsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;
        using Stream = std::variant<std::monostate,  // "not connected yet"
                                    HttpStream, HttpsStream>;

       public:
        /// @brief Called once when the transport is gone, instead of the
        /// consumer's connection_lost().
        using LostHandler = std::function<void(
            const std::shared_ptr<Connection>&, const Error&)>;

        /**
         * @brief Constructs a Connection without a transport.
         * @param executor The executor all I/O runs on. Should be a strand
         * when the io_context runs on several threads.
         * @param id Identifier, unique within the owning pool.
         */
        Connection(boost::asio::any_io_executor executor, std::uint64_t id);

        /// @brief Wrap an accepted socket (the downstream side of a proxy).
        /// consumer is attached first, then the read loop starts on a fresh
        /// strand.
        static std::shared_ptr<Connection> adopt(
            tcp::socket socket, std::uint64_t id,
            std::shared_ptr<ProtocolConsumer> consumer);

        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;
        Connection(Connection&&) = delete;
        Connection& operator=(Connection&&) = delete;

        ~Connection() noexcept;

        /**
         * @brief Resolve, connect, optionally tunnel through a proxy with
         * CONNECT, optionally handshake TLS, then start reading.
         * @return The error, or nullopt on success.
         */
        boost::asio::awaitable<std::optional<Error>> connect(ConnectPlan plan);

        /// @brief A socket is open and has not been closed.
        bool has_transport() const noexcept;

        /// @brief The peer already closed the socket, or it failed. Only
        /// meaningful for an idle connection.
        /// @note Call on the connection's executor: the socket is peeked
        /// directly and must not be closed concurrently.
        bool is_stale() noexcept;

        /// @brief Queue bytes for writing, in call order.
        void write(std::string bytes);

        /// @brief Close the transport. Queued writes are flushed first unless
        /// abort is set.
        void close(bool abort = false);

        /// @brief Close immediately and report error to whoever observes the
        /// loss of this connection.
        void abort_with(Error error);

        std::shared_ptr<ProtocolConsumer> consumer() const;

        /// @brief Attach a consumer. Refused while another unfinished consumer
        /// is attached.
        bool set_consumer(std::shared_ptr<ProtocolConsumer> consumer);

        /// @brief Detach expected if it is still the attached consumer.
        void clear_consumer(const ProtocolConsumer* expected);

        /// @brief Replace the consumer unconditionally and mark the
        /// connection as taken over by another protocol (raw relay). An
        /// upgraded connection is never pooled again.
        void upgrade(std::shared_ptr<ProtocolConsumer> consumer);

        bool upgraded() const noexcept {
            return upgraded_.load(std::memory_order_acquire);
        }

        void set_lost_handler(LostHandler handler);

        std::uint64_t id() const noexcept { return id_; }

        const boost::asio::any_io_executor& get_executor() const noexcept {
            return ex_;
        }

        /// @brief "ip:port" of the peer, empty when not connected.
        std::string remote_address() const;

       private:
        boost::asio::awaitable<std::optional<Error>> open_tunnel(
            HttpStream& stream, const ConnectPlan& plan);
        void start_reading();
        boost::asio::awaitable<void> read_loop(std::shared_ptr<Connection> self);
        boost::asio::awaitable<void> write_loop(
            std::shared_ptr<Connection> self);
        void close_transport() noexcept;
        tcp::socket* lowest_socket() noexcept;
        const tcp::socket* lowest_socket() const noexcept;

        boost::asio::any_io_executor ex_;
        std::uint64_t id_;

        Stream m_stream;

        mutable std::mutex mu_;  ///< Guards consumer_, lost_handler_
        std::shared_ptr<ProtocolConsumer> consumer_;
        LostHandler lost_handler_;

        // Executor-only state
        std::deque<std::string> write_queue_;
        bool writing_{false};
        bool close_after_flush_{false};
        std::optional<Error> pending_error_;

        std::atomic<bool> open_{false};
        std::atomic<bool> closed_{false};
        std::atomic<bool> upgraded_{false};
    };

}  // namespace relay_cpp
