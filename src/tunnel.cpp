#include "relay_cpp/tunnel.hpp"

#include "relay_cpp/log.hpp"

namespace relay_cpp {

    namespace {

        constexpr std::string_view kEstablished =
            "HTTP/1.1 200 Connection established\r\n\r\n";

        bool is_success(int status) { return status >= 200 && status < 300; }

    }  // namespace

    // -------- TunnelForwarder --------

    void TunnelForwarder::set_peer(const std::shared_ptr<Connection>& peer) {
        std::lock_guard<std::mutex> lk(mu_);
        peer_ = peer;
        has_peer_ = true;
        if (!pending_.empty() && !finished() && peer) {
            forwarded_.fetch_add(pending_.size(), std::memory_order_relaxed);
            peer->write(std::move(pending_));
        }
        pending_.clear();
    }

    void TunnelForwarder::buffer(std::string_view data) {
        if (data.empty()) return;
        std::lock_guard<std::mutex> lk(mu_);
        pending_.append(data.data(), data.size());
    }

    void TunnelForwarder::on_closed(std::function<void()> fn) {
        std::lock_guard<std::mutex> lk(mu_);
        on_closed_ = std::move(fn);
    }

    void TunnelForwarder::stop() { shut(false); }

    void TunnelForwarder::data_received(std::string_view data) {
        if (finished()) return;
        bool peer_gone = false;
        {
            // Writes are issued under the lock to keep them in arrival order
            std::lock_guard<std::mutex> lk(mu_);
            if (!has_peer_) {
                pending_.append(data.data(), data.size());
                return;
            }
            if (auto peer = peer_.lock()) {
                forwarded_.fetch_add(data.size(), std::memory_order_relaxed);
                peer->write(std::string(data));
            } else {
                peer_gone = true;
            }
        }
        if (peer_gone) {
            logger()->debug("{}: peer is gone, dropping {} bytes", name_,
                            data.size());
            shut(false);
        }
    }

    void TunnelForwarder::eof_received() { shut(true); }

    void TunnelForwarder::connection_lost(const Error& error) {
        logger()->debug("{}: leg closed ({})", name_, describe(error));
        shut(true);
    }

    void TunnelForwarder::shut(bool close_peer) {
        if (closed_.exchange(true, std::memory_order_acq_rel)) return;

        std::shared_ptr<Connection> peer;
        std::function<void()> fn;
        {
            std::lock_guard<std::mutex> lk(mu_);
            peer = peer_.lock();
            pending_.clear();
            fn = std::move(on_closed_);
            on_closed_ = nullptr;
        }
        // Graceful: bytes already queued to the peer still go out
        if (close_peer && peer) peer->close();
        if (fn) fn();
    }

    // -------- TunnelBridge --------

    TunnelBridge::TunnelBridge(std::shared_ptr<Connection> downstream,
                               std::string authority)
        : downstream_(std::move(downstream)), authority_(std::move(authority)) {}

    std::shared_ptr<TunnelBridge> TunnelBridge::start(
        std::shared_ptr<HttpClient> client,
        std::shared_ptr<Connection> downstream, std::string authority,
        RequestOptions opts, std::string early_data) {
        auto bridge = std::shared_ptr<TunnelBridge>(
            new TunnelBridge(std::move(downstream), std::move(authority)));

        auto down = std::make_shared<TunnelForwarder>("tunnel " +
                                                      bridge->authority_ +
                                                      " downstream");
        down->buffer(early_data);
        // Released once the leg closes, which ends the bridge's lifetime
        down->on_closed([bridge] { bridge->leg_closed(); });
        {
            std::lock_guard<std::mutex> lk(bridge->mu_);
            bridge->down_fwd_ = down;
            bridge->open_legs_ = 1;
        }
        bridge->downstream_->upgrade(down);

        auto res = client->request(HttpMethod::Connect, bridge->authority_,
                                   std::move(opts));
        if (!res) {
            bridge->failed(res.error());
            return bridge;
        }

        auto resp = std::move(res).value();
        {
            std::lock_guard<std::mutex> lk(bridge->mu_);
            bridge->upstream_ = resp;
        }

        std::weak_ptr<TunnelBridge> weak = bridge;
        resp->on_headers([weak](HttpResponse& r) {
            auto self = weak.lock();
            if (self && is_success(r.status_code())) self->established(r);
        });
        resp->on_finished([weak](HttpResponse& r) {
            auto self = weak.lock();
            if (!self) return;
            if (r.error()) {
                self->failed(*r.error());
            } else if (!is_success(r.status_code())) {
                self->failed(Error{Error::Code::TunnelEstablishment,
                                   "Upstream answered CONNECT with " +
                                       std::to_string(r.status_code()),
                                   r.status_code()});
            }
        });
        return bridge;
    }

    std::shared_ptr<HttpResponse> TunnelBridge::upstream_response() const {
        std::lock_guard<std::mutex> lk(mu_);
        return upstream_;
    }

    void TunnelBridge::established(HttpResponse& response) {
        auto upstream = response.connection();
        if (!upstream) {
            failed(Error{Error::Code::InvalidState,
                         "CONNECT answered without a connection"});
            return;
        }

        State expected = State::Connecting;
        // Downstream already went away; the client closes the upstream leg
        if (!state_.compare_exchange_strong(expected, State::Established))
            return;

        auto up = std::make_shared<TunnelForwarder>("tunnel " + authority_ +
                                                    " upstream");
        up->set_peer(downstream_);
        up->on_closed([self = shared_from_this()] { self->leg_closed(); });

        std::shared_ptr<TunnelForwarder> down;
        {
            std::lock_guard<std::mutex> lk(mu_);
            up_fwd_ = up;
            ++open_legs_;
            down = down_fwd_;
        }

        downstream_->write(std::string(kEstablished));
        upstream->upgrade(up);
        down->set_peer(upstream);

        logger()->info("tunnel to {} open (upstream connection {})",
                       authority_, upstream->id());
    }

    void TunnelBridge::failed(const Error& error) {
        State expected = State::Connecting;
        if (!state_.compare_exchange_strong(expected, State::Failed)) return;

        logger()->warn("tunnel to {} failed: {}", authority_, describe(error));

        std::shared_ptr<TunnelForwarder> down;
        {
            std::lock_guard<std::mutex> lk(mu_);
            down = down_fwd_;
        }
        if (down) down->stop();

        std::string body = "Could not open a tunnel to " + authority_ + ": " +
                           error.message + "\n";
        std::string out =
            "HTTP/1.1 504 Gateway Timeout\r\n"
            "Content-Type: text/plain; charset=utf-8\r\n"
            "Content-Length: " +
            std::to_string(body.size()) +
            "\r\n"
            "Connection: close\r\n\r\n" +
            body;
        downstream_->write(std::move(out));
        downstream_->close();
    }

    void TunnelBridge::leg_closed() {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (open_legs_ > 0) --open_legs_;
        }

        State s = state();
        while (s == State::Connecting || s == State::Established) {
            if (state_.compare_exchange_weak(s, State::Closed)) {
                logger()->info("tunnel to {} closed", authority_);
                break;
            }
        }
    }

}  // namespace relay_cpp
