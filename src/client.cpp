#include "relay_cpp/client.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/http/field.hpp>
#include <cmath>

#include "relay_cpp/log.hpp"
#include "relay_cpp/proxy.hpp"
#include "relay_cpp/url.hpp"

namespace asio = boost::asio;
namespace http = boost::beast::http;

namespace relay_cpp {

    namespace {

        bool is_redirect(int status) {
            return status == 301 || status == 302 || status == 303 ||
                   status == 307 || status == 308;
        }

        std::string_view proxy_scheme(HttpMethod method,
                                      const UrlComponents& url) {
            return method == HttpMethod::Connect ? std::string_view("connect")
                                                 : std::string_view(url.scheme);
        }

    }  // namespace

    std::shared_ptr<HttpClient> HttpClient::create(asio::any_io_executor ex,
                                                   HttpClientConfiguration cfg) {
        asio::any_io_executor strand = asio::make_strand(ex);
        return std::shared_ptr<HttpClient>(
            new HttpClient(std::move(strand), std::move(cfg)));
    }

    HttpClient::HttpClient(asio::any_io_executor strand,
                           HttpClientConfiguration cfg)
        : strand_(std::move(strand)),
          cfg_(std::move(cfg)),
          ssl_ctx_(std::make_shared<asio::ssl::context>(
              asio::ssl::context::tls_client)) {
        init_tls_on_ssl_context(*ssl_ctx_, cfg_.tls);

        proxy_info_ = cfg_.proxy_info;
        if (proxy_info_.empty() && cfg_.trust_env) {
            proxy_info_ = proxies_from_environment();
        }

        Headers defaults;
        defaults.set(http::field::connection, "keep-alive");
        defaults.set(http::field::accept_encoding,
                     cfg_.decompress ? "gzip, deflate" : "identity");
        defaults.set(http::field::user_agent, cfg_.user_agent);
        default_headers_ = headers::merge(defaults, cfg_.default_headers);

        boundary_ = cfg_.multipart_boundary ? *cfg_.multipart_boundary
                                            : choose_boundary();
    }

    // -------- building requests --------

    Result<std::shared_ptr<const HttpRequest>> HttpClient::build_request(
        HttpMethod method, std::string_view url, RequestOptions opts) {
        using R = Result<std::shared_ptr<const HttpRequest>>;

        if (closed()) {
            return R::err(Error::Code::ClientClosed, "Client is closed");
        }

        auto parsed = method == HttpMethod::Connect ? parse_authority(url)
                                                    : parse_url(url);
        if (!parsed) return R::err(std::move(parsed).error());
        UrlComponents target = std::move(parsed).value();

        auto proxy =
            select_proxy(proxy_info_, proxy_scheme(method, target), target.host);
        if (!proxy) return R::err(std::move(proxy).error());

        // Per-request headers win over the client defaults
        Headers hdrs = headers::merge(default_headers_, opts.headers);

        std::string given_cookie(hdrs[http::field::cookie]);
        std::string cookie = cookie_header(target, given_cookie, opts.cookies);
        if (!cookie.empty()) hdrs.set(http::field::cookie, cookie);

        apply_middleware(RequestContext{method, target, opts.client_address},
                         hdrs);

        RequestParameters params;
        params.version = opts.version.value_or(cfg_.version);
        params.timeout = opts.timeout.value_or(cfg_.timeout);
        params.allow_redirects =
            opts.allow_redirects.value_or(cfg_.allow_redirects);
        params.max_redirects = opts.max_redirects.value_or(cfg_.max_redirects);
        params.decompress = opts.decompress.value_or(cfg_.decompress);
        params.encode_multipart =
            opts.encode_multipart.value_or(cfg_.encode_multipart);
        params.multipart_boundary =
            opts.multipart_boundary.value_or(boundary_);
        params.max_body_bytes = cfg_.max_body_bytes;
        params.given_cookie = std::move(given_cookie);
        params.cookies = std::move(opts.cookies);

        auto tls = opts.ssl_context ? opts.ssl_context : ssl_ctx_;

        std::shared_ptr<const HttpRequest> req = std::make_shared<HttpRequest>(
            method, std::move(target), std::move(proxy).value(),
            std::move(hdrs), std::move(opts.unredirected_headers),
            std::move(opts.body), std::move(params), std::move(tls));
        return R::ok(std::move(req));
    }

    void HttpClient::apply_middleware(const RequestContext& ctx,
                                      Headers& hdrs) const {
        for (const auto& m : cfg_.header_middleware) {
            if (m) m->apply(ctx, hdrs);
        }
    }

    std::string HttpClient::cookie_header(
        const UrlComponents& url, const std::string& given,
        const std::vector<std::pair<std::string, std::string>>& extra) const {
        std::string out = given;
        if (cfg_.store_cookies) {
            std::string jar = cookies_.cookie_header_for(url);
            if (!jar.empty()) out += (out.empty() ? "" : "; ") + jar;
        }
        for (const auto& [name, value] : extra) {
            if (!out.empty()) out += "; ";
            out += name + "=" + value;
        }
        return out;
    }

    // -------- public request API --------

    Result<std::shared_ptr<HttpResponse>> HttpClient::request(
        HttpMethod method, std::string_view url, RequestOptions opts) {
        using R = Result<std::shared_ptr<HttpResponse>>;

        auto req = build_request(method, url, std::move(opts));
        if (!req) return R::err(std::move(req).error());
        return R::ok(response(std::move(req).value()));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::get(std::string_view url,
                                                          RequestOptions opts) {
        if (!opts.allow_redirects) opts.allow_redirects = true;
        return request(HttpMethod::Get, url, std::move(opts));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::options(
        std::string_view url, RequestOptions opts) {
        if (!opts.allow_redirects) opts.allow_redirects = true;
        return request(HttpMethod::Options, url, std::move(opts));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::head(
        std::string_view url, RequestOptions opts) {
        return request(HttpMethod::Head, url, std::move(opts));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::post(
        std::string_view url, RequestOptions opts) {
        return request(HttpMethod::Post, url, std::move(opts));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::put(std::string_view url,
                                                          RequestOptions opts) {
        return request(HttpMethod::Put, url, std::move(opts));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::patch(
        std::string_view url, RequestOptions opts) {
        return request(HttpMethod::Patch, url, std::move(opts));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::del(std::string_view url,
                                                          RequestOptions opts) {
        return request(HttpMethod::Delete, url, std::move(opts));
    }

    // -------- dispatch --------

    std::shared_ptr<HttpResponse> HttpClient::response(
        std::shared_ptr<const HttpRequest> request,
        std::shared_ptr<HttpResponse> existing, bool new_connection) {
        auto resp = std::move(existing);
        if (!resp) {
            resp = std::make_shared<HttpResponse>(strand_, request);
            install_hooks(resp);
        }

        asio::co_spawn(
            strand_,
            [self = shared_from_this(), request = std::move(request), resp,
             new_connection]() -> asio::awaitable<void> {
                try {
                    co_await self->dispatch(request, resp, new_connection);
                } catch (const std::exception& e) {
                    resp->fail(Error{Error::Code::Unknown,
                                     std::string("Request dispatch failed: ") +
                                         e.what()});
                }
            },
            log_on_exception{"HttpClient::response"});
        return resp;
    }

    asio::awaitable<void> HttpClient::dispatch(
        std::shared_ptr<const HttpRequest> request,
        std::shared_ptr<HttpResponse> resp, bool new_connection) {
        if (resp->finished()) co_return;
        if (closed()) {
            resp->fail(Error{Error::Code::ClientClosed, "Client is closed"});
            co_return;
        }

        auto pool = pool_for(request->key());

        std::shared_ptr<Connection> conn =
            new_connection ? nullptr : resp->connection();
        if (!conn) {
            auto acquired = co_await pool->acquire_connection();
            if (!acquired) {
                resp->fail(std::move(acquired).error());
                co_return;
            }
            conn = std::move(acquired).value();

            // Aborted while waiting for capacity
            if (resp->finished()) {
                pool->release_connection(conn, nullptr);
                co_return;
            }
            if (!conn->set_consumer(resp)) {
                pool->release_connection(conn, nullptr);
                resp->fail(Error{Error::Code::InvalidState,
                                 "Connection is busy with another response"});
                co_return;
            }
            resp->attach(conn);
        }

        if (!conn->has_transport()) {
            auto err = co_await conn->connect(request->connect_plan());
            if (err) {
                // The endpoint refused us outright: no reconnect
                conn->clear_consumer(resp.get());
                resp->detach();
                pool->remove_connection(conn);
                conn->close(true);
                resp->fail(std::move(*err));
                co_return;
            }
        }

        resp->start();
    }

    std::shared_ptr<ConnectionPool> HttpClient::pool_for(const Endpoint& key) {
        std::lock_guard<std::mutex> lk(pools_mu_);
        auto it = pools_.find(key);
        if (it != pools_.end()) return it->second;

        logger()->debug("creating pool for {}", key.to_string());
        auto pool = std::make_shared<ConnectionPool>(
            strand_, key, cfg_.pool_config, weak_from_this());
        pools_.emplace(key, pool);
        return pool;
    }

    std::shared_ptr<ConnectionPool> HttpClient::find_pool(
        const Endpoint& key) const {
        std::lock_guard<std::mutex> lk(pools_mu_);
        auto it = pools_.find(key);
        return it == pools_.end() ? nullptr : it->second;
    }

    // -------- hooks --------

    void HttpClient::install_hooks(const std::shared_ptr<HttpResponse>& resp) {
        std::weak_ptr<HttpClient> weak = weak_from_this();

        if (cfg_.store_cookies) {
            resp->header_hooks_.push_back([weak](HttpResponse& r) {
                if (auto self = weak.lock()) {
                    self->cookies_.store_from(r.request()->url(),
                                              r.raw_headers());
                }
            });
        }

        // Order matters: the redirect decision is taken before the connection
        // goes back to the pool
        resp->post_hooks_.push_back([weak](HttpResponse& r) {
            if (auto self = weak.lock()) self->follow_redirect(r);
        });
        resp->post_hooks_.push_back([weak](HttpResponse& r) {
            if (auto self = weak.lock()) {
                self->release(r);
            } else if (auto conn = r.connection()) {
                conn->clear_consumer(&r);
                r.detach();
                conn->close();
            }
        });
    }

    void HttpClient::follow_redirect(HttpResponse& r) {
        if (r.state() != HttpResponse::State::Complete || r.error_) return;

        const HttpRequest& req = *r.request();
        const auto& params = req.params();
        int status = r.status_code();
        if (!params.allow_redirects || !is_redirect(status)) return;

        auto location = r.raw_headers().find(http::field::location);
        if (location == r.raw_headers().end()) return;

        if (params.redirect_count >= params.max_redirects) {
            r.error_ = Error{Error::Code::TooManyRedirects,
                             "Exceeded " +
                                 std::to_string(params.max_redirects) +
                                 " redirects at " + req.full_url(),
                             status};
            return;
        }

        auto target =
            resolve_reference(req.url(), std::string(location->value()));
        if (!target) {
            Error err = std::move(target).error();
            err.status_code = status;
            r.error_ = std::move(err);
            return;
        }

        AgainOptions next;
        bool to_get = status == 303
                          ? req.method() != HttpMethod::Head
                          : (status == 301 || status == 302) &&
                                req.method() != HttpMethod::Get &&
                                req.method() != HttpMethod::Head;
        if (to_get) {
            next.method = HttpMethod::Get;
            next.drop_body = true;
        }
        next.url = std::move(target).value();

        logger()->debug("redirect {} {} -> {}", status, req.full_url(),
                        next.url->to_string());

        auto hop = again(r.shared_from_this(), std::move(next));
        if (!hop) {
            Error err = std::move(hop).error();
            if (err.status_code == 0) err.status_code = status;
            r.error_ = std::move(err);
        }
    }

    void HttpClient::release(HttpResponse& r) {
        auto conn = r.connection();
        if (!conn) return;

        conn->clear_consumer(&r);
        r.detach();

        auto pool = find_pool(r.request()->key());
        if (!pool) {
            conn->close();
            return;
        }
        if (!conn->has_transport()) {
            pool->remove_connection(conn);
            return;
        }
        pool->release_connection(conn, &r);
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::again(
        const std::shared_ptr<HttpResponse>& prior, AgainOptions overrides) {
        using R = Result<std::shared_ptr<HttpResponse>>;

        if (!prior || !prior->finished()) {
            return R::err(Error::Code::InvalidState,
                          "again() needs a finished response");
        }
        if (closed()) {
            return R::err(Error::Code::ClientClosed, "Client is closed");
        }

        const HttpRequest& old = *prior->request();
        HttpMethod method = overrides.method.value_or(old.method());
        UrlComponents url = overrides.url ? std::move(*overrides.url)
                                          : old.url();

        auto proxy = select_proxy(proxy_info_, proxy_scheme(method, url),
                                  url.host);
        if (!proxy) return R::err(std::move(proxy).error());

        Headers hdrs = headers::merge(old.headers(), overrides.headers);
        if (url.scheme != old.url().scheme ||
            url.authority() != old.url().authority()) {
            // Credentials and Host belong to the old origin
            hdrs.erase(http::field::host);
            hdrs.erase(http::field::authorization);
        }
        RequestParameters params = old.params();
        params.redirect_count += 1;
        if (auto it = overrides.headers.find(http::field::cookie);
            it != overrides.headers.end()) {
            params.given_cookie = std::string(it->value());
        }

        // Jar cookies are picked again for the new URL, the caller's are kept
        hdrs.erase(http::field::cookie);
        if (auto cookie =
                cookie_header(url, params.given_cookie, params.cookies);
            !cookie.empty()) {
            hdrs.set(http::field::cookie, cookie);
        }

        RequestBody body;
        if (overrides.drop_body) {
            hdrs.erase(http::field::content_type);
            hdrs.erase(http::field::content_length);
            hdrs.erase(http::field::transfer_encoding);
        } else {
            body = overrides.body ? std::move(*overrides.body) : old.body();
        }

        std::shared_ptr<const HttpRequest> req = std::make_shared<HttpRequest>(
            method, std::move(url), std::move(proxy).value(), std::move(hdrs),
            old.unredirected_headers(), std::move(body), std::move(params),
            old.tls());

        auto next = std::make_shared<HttpResponse>(strand_, req);
        install_hooks(next);

        if (overrides.history) {
            next->history_ = prior->history_;
            Response snap = prior->snapshot();
            snap.history.clear();
            next->history_.push_back(std::move(snap));
            while (next->history_.size() > cfg_.history_limit) {
                next->history_.erase(next->history_.begin());
            }
        }

        next->predecessors_ = prior->predecessors_;
        next->predecessors_.push_back(prior);
        prior->next_ = next;

        response(std::move(req), next);
        return R::ok(std::move(next));
    }

    Result<std::shared_ptr<HttpResponse>> HttpClient::again(
        const std::shared_ptr<HttpResponse>& prior) {
        return again(prior, AgainOptions{});
    }

    std::chrono::milliseconds HttpClient::reconnect_time_lag(
        size_t attempts_remaining) const {
        if (attempts_remaining == 0) return std::chrono::milliseconds(0);
        double base = static_cast<double>(cfg_.reconnect_time_lag.count());
        double lag =
            base * (std::log(static_cast<double>(attempts_remaining)) + 1.0);
        return std::chrono::milliseconds(std::llround(lag / 100.0) * 100);
    }

    // -------- shutdown --------

    asio::awaitable<bool> HttpClient::close(
        std::chrono::steady_clock::duration drain_timeout, bool abort) {
        closed_.store(true, std::memory_order_release);

        // Pool and connection state is only touched on the strand
        co_return co_await asio::co_spawn(
            strand_,
            [self = shared_from_this(), drain_timeout,
             abort]() -> asio::awaitable<bool> {
                co_return co_await self->close_on_strand(drain_timeout, abort);
            },
            asio::use_awaitable);
    }

    asio::awaitable<bool> HttpClient::close_on_strand(
        std::chrono::steady_clock::duration drain_timeout, bool abort) {
        std::vector<std::shared_ptr<ConnectionPool>> pools;
        {
            std::lock_guard<std::mutex> lk(pools_mu_);
            for (auto& [key, pool] : pools_) pools.push_back(pool);
        }
        logger()->info("closing client: {} pool(s), {} connection(s) in use",
                       pools.size(), concurrent_connections());

        for (auto& pool : pools) pool->close(abort);

        auto deadline = std::chrono::steady_clock::now() + drain_timeout;
        bool drained = true;
        for (auto& pool : pools) {
            auto left = deadline - std::chrono::steady_clock::now();
            if (left < std::chrono::steady_clock::duration::zero()) {
                left = std::chrono::steady_clock::duration::zero();
            }
            if (!co_await pool->drain(left)) drained = false;
        }

        if (!drained) {
            logger()->info("client drain timed out, closing {} connection(s)",
                           concurrent_connections());
        }
        // Whatever is left is not waited for
        for (auto& pool : pools) pool->close(true);
        co_return drained;
    }

    void HttpClient::abort() {
        closed_.store(true, std::memory_order_release);
        asio::dispatch(strand_, [self = shared_from_this()] {
            std::vector<std::shared_ptr<ConnectionPool>> pools;
            {
                std::lock_guard<std::mutex> lk(self->pools_mu_);
                for (auto& [key, pool] : self->pools_) pools.push_back(pool);
            }
            for (auto& pool : pools) pool->close(true);
        });
    }

    size_t HttpClient::concurrent_connections() const {
        std::lock_guard<std::mutex> lk(pools_mu_);
        size_t n = 0;
        for (const auto& [key, pool] : pools_) {
            n += pool->concurrent_connections();
        }
        return n;
    }

    size_t HttpClient::available_connections() const {
        std::lock_guard<std::mutex> lk(pools_mu_);
        size_t n = 0;
        for (const auto& [key, pool] : pools_) {
            n += pool->available_connections();
        }
        return n;
    }

}  // namespace relay_cpp
