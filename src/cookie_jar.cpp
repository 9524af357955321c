#include "relay_cpp/cookie_jar.hpp"

#include <algorithm>
#include <boost/beast/core/string.hpp>
#include <cctype>

namespace relay_cpp {

    namespace {

        std::string_view trim(std::string_view s) {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
                s.remove_prefix(1);
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
                s.remove_suffix(1);
            return s;
        }

        std::string lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        /// "a.b" matches "a.b", ".b" and "b"
        bool domain_matches(std::string_view host, std::string_view domain) {
            if (!domain.empty() && domain.front() == '.') domain.remove_prefix(1);
            if (domain.empty() || host.size() < domain.size()) return false;
            if (!boost::beast::iequals(host.substr(host.size() - domain.size()),
                                       domain))
                return false;
            return host.size() == domain.size() ||
                   host[host.size() - domain.size() - 1] == '.';
        }

        bool path_matches(std::string_view request_path,
                          std::string_view cookie_path) {
            if (cookie_path.empty() || cookie_path == "/") return true;
            if (request_path.compare(0, cookie_path.size(), cookie_path) != 0)
                return false;
            return request_path.size() == cookie_path.size() ||
                   cookie_path.back() == '/' ||
                   request_path[cookie_path.size()] == '/';
        }

        std::string default_path(const std::string& path) {
            auto slash = path.rfind('/');
            if (slash == std::string::npos || slash == 0) return "/";
            return path.substr(0, slash);
        }

    }  // namespace

    bool CookieJar::set_cookie(const UrlComponents& url,
                               std::string_view header) {
        auto semi = header.find(';');
        std::string_view pair = trim(header.substr(0, semi));
        auto eq = pair.find('=');
        if (eq == std::string_view::npos) return false;

        Cookie c;
        c.name = std::string(trim(pair.substr(0, eq)));
        c.value = std::string(trim(pair.substr(eq + 1)));
        if (c.name.empty()) return false;
        c.domain = url.host;
        c.path = default_path(url.path);

        bool remove = false;
        auto now = std::chrono::steady_clock::now();

        while (semi != std::string_view::npos) {
            header.remove_prefix(semi + 1);
            semi = header.find(';');
            std::string_view attr = trim(header.substr(0, semi));
            auto aeq = attr.find('=');
            std::string key = lower(trim(attr.substr(0, aeq)));
            std::string_view val =
                aeq == std::string_view::npos ? std::string_view{}
                                              : trim(attr.substr(aeq + 1));

            if (key == "domain" && !val.empty()) {
                std::string d = lower(val);
                if (d.front() == '.') d.erase(0, 1);
                if (!domain_matches(url.host, d)) return false;
                c.domain = d;
                c.host_only = false;
            } else if (key == "path" && !val.empty() && val.front() == '/') {
                c.path = std::string(val);
            } else if (key == "secure") {
                c.secure = true;
            } else if (key == "max-age" && !val.empty()) {
                bool negative = val.front() == '-';
                if (negative) val.remove_prefix(1);
                if (val.empty() ||
                    !std::all_of(val.begin(), val.end(), [](unsigned char ch) {
                        return std::isdigit(ch) != 0;
                    })) {
                    continue;
                }
                long long seconds = negative ? 0 : std::stoll(std::string(val));
                if (seconds <= 0) {
                    remove = true;
                } else {
                    c.expires = now + std::chrono::seconds(seconds);
                }
            }
        }

        std::lock_guard<std::mutex> lk(mu_);
        purge_expired_locked_(now);
        cookies_.erase(std::remove_if(cookies_.begin(), cookies_.end(),
                                      [&](const Cookie& o) {
                                          return o.name == c.name &&
                                                 o.domain == c.domain &&
                                                 o.path == c.path;
                                      }),
                       cookies_.end());
        if (!remove) cookies_.push_back(std::move(c));
        return true;
    }

    void CookieJar::store_from(const UrlComponents& url,
                               const Headers& headers) {
        auto range = headers.equal_range("Set-Cookie");
        for (auto it = range.first; it != range.second; ++it) {
            static_cast<void>(set_cookie(url, it->value()));
        }
    }

    std::string CookieJar::cookie_header_for(const UrlComponents& url) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto now = std::chrono::steady_clock::now();

        std::string out;
        for (const auto& c : cookies_) {
            if (c.expires && *c.expires <= now) continue;
            bool host_ok = c.host_only ? boost::beast::iequals(url.host, c.domain)
                                       : domain_matches(url.host, c.domain);
            if (!host_ok) continue;
            if (!path_matches(url.path, c.path)) continue;
            if (c.secure && !url.https()) continue;
            if (!out.empty()) out += "; ";
            out += c.name;
            out += "=";
            out += c.value;
        }
        return out;
    }

    void CookieJar::purge_expired_locked_(
        std::chrono::steady_clock::time_point now) {
        cookies_.erase(std::remove_if(cookies_.begin(), cookies_.end(),
                                      [&](const Cookie& c) {
                                          return c.expires && *c.expires <= now;
                                      }),
                       cookies_.end());
    }

    void CookieJar::clear() {
        std::lock_guard<std::mutex> lk(mu_);
        cookies_.clear();
    }

    size_t CookieJar::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return cookies_.size();
    }

}  // namespace relay_cpp
