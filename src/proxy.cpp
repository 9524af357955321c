#include "relay_cpp/proxy.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "relay_cpp/headers.hpp"

namespace relay_cpp {

    namespace {

        std::optional<std::string> env_either_case(const std::string& lower) {
            if (const char* v = std::getenv(lower.c_str()); v && *v) return v;
            std::string upper = lower;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return std::toupper(c); });
            if (const char* v = std::getenv(upper.c_str()); v && *v) return v;
            return std::nullopt;
        }

        bool ends_with_ci(std::string_view s, std::string_view suffix) {
            if (suffix.size() > s.size()) return false;
            auto tail = s.substr(s.size() - suffix.size());
            return std::equal(tail.begin(), tail.end(), suffix.begin(),
                              [](unsigned char a, unsigned char b) {
                                  return std::tolower(a) == std::tolower(b);
                              });
        }

    }  // namespace

    std::string default_no_proxy() {
        std::string out = "localhost,127.0.0.1";
        char name[256] = {};
        if (::gethostname(name, sizeof(name) - 1) == 0 && name[0] != '\0') {
            out += ",";
            out += name;
        }
        return out;
    }

    ProxyInfo proxies_from_environment() {
        ProxyInfo info;
        for (const char* scheme : {"http", "https"}) {
            if (auto v = env_either_case(std::string(scheme) + "_proxy")) {
                info[scheme] = *v;
            }
        }
        if (auto v = env_either_case("no_proxy")) {
            info["no"] = *v;
        } else {
            info["no"] = default_no_proxy();
        }
        return info;
    }

    bool bypasses_proxy(std::string_view no_list, std::string_view host) {
        for (auto suffix : headers::split_tokens(no_list)) {
            if (suffix == "*") return true;
            if (ends_with_ci(host, suffix)) return true;
        }
        return false;
    }

    Result<std::optional<UrlComponents>> select_proxy(const ProxyInfo& info,
                                                      std::string_view scheme,
                                                      std::string_view host) {
        using R = Result<std::optional<UrlComponents>>;

        if (auto no = info.find("no"); no != info.end()) {
            if (bypasses_proxy(no->second, host)) return R::ok(std::nullopt);
        }

        std::string key = scheme == "connect" ? "https" : std::string(scheme);
        auto it = info.find(key);
        if (it == info.end() || it->second.empty()) {
            return R::ok(std::nullopt);
        }

        auto parsed = parse_url(it->second);
        if (!parsed) {
            return R::err(Error::Code::ProxyConfiguration,
                          "Could not understand proxy " + it->second);
        }
        return R::ok(std::move(parsed.value()));
    }

}  // namespace relay_cpp
