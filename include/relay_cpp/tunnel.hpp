#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "client.hpp"
#include "connection/connection.hpp"
#include "consumer.hpp"
#include "request.hpp"
#include "response.hpp"

namespace relay_cpp {

    /**
     * @brief Consumer that writes every byte it receives to a peer
     * connection, unchanged.
     *
     * Bytes that arrive before the peer is known are buffered and flushed by
     * set_peer(). When its own connection ends, the peer is closed too.
     */
    class TunnelForwarder : public ProtocolConsumer {
       public:
        explicit TunnelForwarder(std::string name) : name_(std::move(name)) {}

        /// @brief Start forwarding to peer, flushing anything buffered.
        void set_peer(const std::shared_ptr<Connection>& peer);

        /// @brief Queue bytes for the peer as if they had been received.
        void buffer(std::string_view data);

        /// @brief Called once when this leg ends.
        void on_closed(std::function<void()> fn);

        /// @brief Stop forwarding. Buffered bytes are dropped and the
        /// peer is left alone.
        void stop();

        // ProtocolConsumer
        void data_received(std::string_view data) override;
        void eof_received() override;
        void connection_lost(const Error& error) override;
        bool finished() const noexcept override {
            return closed_.load(std::memory_order_acquire);
        }

        size_t bytes_forwarded() const noexcept {
            return forwarded_.load(std::memory_order_relaxed);
        }

       private:
        void shut(bool close_peer);

        std::string name_;
        mutable std::mutex mu_;
        std::weak_ptr<Connection> peer_;
        bool has_peer_{false};
        std::string pending_;
        std::function<void()> on_closed_;
        std::atomic<bool> closed_{false};
        std::atomic<size_t> forwarded_{0};
    };

    /**
     * @brief Turns an accepted CONNECT request into a raw relay.
     *
     * 1. Re-tags the downstream connection with a forwarder that holds its
     *    bytes until the upstream leg exists
     * 2. Issues CONNECT through the client
     * 3. On a 2xx: answers "200 Connection established" downstream, then
     *    re-tags the upstream connection with a forwarder back to downstream
     * 4. On failure: answers 504 downstream and closes it
     *
     * Closing either leg closes the other.
     */
    class TunnelBridge : public std::enable_shared_from_this<TunnelBridge> {
       public:
        enum class State { Connecting, Established, Closed, Failed };

        /**
         * @brief Start bridging.
         * @param client Client used for the upstream CONNECT.
         * @param downstream Connection the CONNECT request arrived on.
         * @param authority "host:port" to tunnel to.
         * @param opts Options for the upstream request.
         * @param early_data Bytes read from downstream after the CONNECT
         * head, forwarded once the tunnel is open.
         */
        static std::shared_ptr<TunnelBridge> start(
            std::shared_ptr<HttpClient> client,
            std::shared_ptr<Connection> downstream, std::string authority,
            RequestOptions opts = {}, std::string early_data = {});

        State state() const noexcept {
            return state_.load(std::memory_order_acquire);
        }

        const std::string& authority() const noexcept { return authority_; }

        /// @brief The upstream CONNECT response, null before it was issued or
        /// when it could not be built.
        std::shared_ptr<HttpResponse> upstream_response() const;

       private:
        TunnelBridge(std::shared_ptr<Connection> downstream,
                     std::string authority);

        void established(HttpResponse& response);
        void failed(const Error& error);
        void leg_closed();

        std::shared_ptr<Connection> downstream_;
        std::string authority_;
        std::atomic<State> state_{State::Connecting};

        mutable std::mutex mu_;
        std::shared_ptr<TunnelForwarder> down_fwd_;
        std::shared_ptr<TunnelForwarder> up_fwd_;
        std::shared_ptr<HttpResponse> upstream_;
        int open_legs_{0};
    };

}  // namespace relay_cpp
