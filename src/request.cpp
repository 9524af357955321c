#include "relay_cpp/request.hpp"

#include <boost/beast/core/string.hpp>

namespace relay_cpp {

    HttpRequest::HttpRequest(HttpMethod method, UrlComponents url,
                             std::optional<UrlComponents> proxy,
                             Headers headers, Headers unredirected_headers,
                             RequestBody body, RequestParameters params,
                             std::shared_ptr<boost::asio::ssl::context> tls)
        : method_(method),
          url_(std::move(url)),
          proxy_(std::move(proxy)),
          headers_(std::move(headers)),
          unredirected_(std::move(unredirected_headers)),
          body_(std::move(body)),
          params_(std::move(params)),
          tls_(std::move(tls)) {
        if (method_ == HttpMethod::Connect) {
            body_ = std::monostate{};
            return;
        }

        if (encodes_body_in_url(method_) && !body_empty(body_)) {
            std::string q = query_from_body(body_);
            if (!q.empty()) {
                if (!url_.query.empty()) url_.query += "&";
                url_.query += q;
            }
            body_ = std::monostate{};
            return;
        }

        std::string ct;
        if (auto it = headers_.find(boost::beast::http::field::content_type);
            it != headers_.end()) {
            ct = std::string(it->value());
        } else if (auto it2 = unredirected_.find(
                       boost::beast::http::field::content_type);
                   it2 != unredirected_.end()) {
            ct = std::string(it2->value());
        }
        auto enc = encode_body(body_, ct, params_.encode_multipart,
                               params_.multipart_boundary);
        encoded_ = std::move(enc.bytes);
        content_type_ = std::move(enc.content_type);
    }

    bool HttpRequest::tunnel() const noexcept {
        return proxy_.has_value() &&
               (url_.https() || method_ == HttpMethod::Connect);
    }

    Endpoint HttpRequest::key() const {
        Endpoint ep;
        if (proxy_ && !tunnel()) {
            ep.scheme = proxy_->scheme;
            ep.host = proxy_->host;
            ep.port = proxy_->port;
        } else {
            ep.scheme =
                method_ == HttpMethod::Connect ? "connect" : url_.scheme;
            ep.host = url_.host;
            ep.port = url_.port;
        }
        ep.timeout = params_.timeout;
        ep.normalize_host();
        return ep;
    }

    ConnectPlan HttpRequest::connect_plan() const {
        ConnectPlan plan;
        plan.timeout = params_.timeout;

        if (proxy_) {
            plan.host = proxy_->host;
            plan.port = proxy_->port;
            if (tunnel()) {
                plan.tunnel_authority = url_.authority(true);
                auto range = headers_.equal_range(
                    boost::beast::http::field::proxy_authorization);
                for (auto it = range.first; it != range.second; ++it) {
                    plan.tunnel_headers.insert(it->name_string(), it->value());
                }
            }
        } else {
            plan.host = url_.host;
            plan.port = url_.port;
        }

        if (url_.https() && method_ != HttpMethod::Connect) {
            plan.tls = tls_;
            plan.sni_host = url_.host;
        }
        return plan;
    }

    std::string HttpRequest::request_target() const {
        if (method_ == HttpMethod::Connect) return url_.authority(true);
        if (proxy_ && !tunnel()) return url_.to_string();
        return url_.target();
    }

    std::string HttpRequest::first_line() const {
        std::string out(to_string(method_));
        out += " ";
        out += request_target();
        out += " HTTP/";
        out += std::to_string(params_.version / 10);
        out += ".";
        out += std::to_string(params_.version % 10);
        return out;
    }

    std::string HttpRequest::full_url() const {
        if (method_ == HttpMethod::Connect) return url_.authority(true);
        return url_.to_string();
    }

    std::string HttpRequest::encode() const {
        namespace http = boost::beast::http;

        if (method_ == HttpMethod::Connect) return {};

        Headers all = headers::merge(unredirected_, headers_);

        std::string out = first_line();
        out += "\r\n";

        out += "Host: ";
        if (auto it = all.find(http::field::host); it != all.end()) {
            out.append(it->value().data(), it->value().size());
        } else {
            out += url_.authority();
        }
        out += "\r\n";

        for (const auto& f : all) {
            if (f.name() == http::field::host) continue;
            if (tunnel() && f.name() == http::field::proxy_authorization)
                continue;
            auto name = f.name_string();
            auto value = f.value();
            out.append(name.data(), name.size());
            out += ": ";
            out.append(value.data(), value.size());
            out += "\r\n";
        }

        if (content_type_ && all.find(http::field::content_type) == all.end()) {
            out += "Content-Type: " + *content_type_ + "\r\n";
        }

        bool chunked = all.find(http::field::transfer_encoding) != all.end();
        bool needs_length = !encoded_.empty() || method_ == HttpMethod::Post ||
                            method_ == HttpMethod::Put ||
                            method_ == HttpMethod::Patch;
        if (!chunked && needs_length &&
            all.find(http::field::content_length) == all.end()) {
            out += "Content-Length: " + std::to_string(encoded_.size()) +
                   "\r\n";
        }

        out += "\r\n";
        out += encoded_;
        return out;
    }

}  // namespace relay_cpp
