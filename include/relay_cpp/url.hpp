#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "result.hpp"

namespace relay_cpp {

    struct UrlComponents {
        std::string scheme;  // lower-cased, "http" or "https" for requests
        std::string host;    // lower-cased, IPv6 literals without brackets
        std::string port;    // always set, defaulted from the scheme
        std::string path;    // starts with '/'
        std::string query;   // without the leading '?'
        std::string fragment;

        bool https() const noexcept { return scheme == "https"; }

        bool default_port() const {
            return (scheme == "https" && port == "443") ||
                   (scheme == "http" && port == "80");
        }

        /// @brief host[:port], with brackets around IPv6 literals. The port
        /// is omitted when it is the scheme default.
        std::string authority(bool always_port = false) const {
            std::string out;
            if (host.find(':') != std::string::npos) {
                out = "[" + host + "]";
            } else {
                out = host;
            }
            if (always_port || !default_port()) {
                out += ":";
                out += port;
            }
            return out;
        }

        /// @brief Origin-form request target: path plus optional query.
        std::string target() const {
            std::string out = path.empty() ? std::string("/") : path;
            if (!query.empty()) {
                out += "?";
                out += query;
            }
            return out;
        }

        /// @brief Absolute form without the fragment.
        std::string to_string() const {
            return scheme + "://" + authority() + target();
        }
    };

    namespace url_utils {

        /// @brief Check if a URL is an absolute HTTP or HTTPS URL.
        /// @param s The URL string to check.
        /// @return True if the URL starts with "http://" or "https://".
        inline bool is_absolute_url_with_protocol(std::string_view s) {
            auto starts = [&](std::string_view p) {
                if (s.size() < p.size()) return false;
                for (size_t i = 0; i < p.size(); ++i) {
                    if (std::tolower(static_cast<unsigned char>(s[i])) != p[i])
                        return false;
                }
                return true;
            };
            return starts("https://") || starts("http://");
        }

        /// @brief Percent-encode everything outside the RFC 3986 unreserved
        /// set.
        /// @param plus_for_space Encode ' ' as '+' (form encoding).
        inline std::string url_encode(std::string_view s,
                                      bool plus_for_space = false) {
            static constexpr char hex[] = "0123456789ABCDEF";
            std::string out;
            out.reserve(s.size() * 3);
            for (unsigned char c : s) {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' ||
                    c == '~') {
                    out.push_back(static_cast<char>(c));
                } else if (c == ' ' && plus_for_space) {
                    out.push_back('+');
                } else {
                    out.push_back('%');
                    out.push_back(hex[c >> 4]);
                    out.push_back(hex[c & 0x0F]);
                }
            }
            return out;
        }

        /// @brief application/x-www-form-urlencoded rendering of ordered
        /// key/value pairs.
        inline std::string encode_form(
            const std::vector<std::pair<std::string, std::string>>& fields) {
            std::string out;
            for (const auto& [k, v] : fields) {
                if (!out.empty()) out.push_back('&');
                out += url_encode(k, true);
                out.push_back('=');
                out += url_encode(v, true);
            }
            return out;
        }

        /// @brief Remove "." and ".." segments from an absolute path.
        inline std::string remove_dot_segments(std::string_view path) {
            std::vector<std::string_view> segments;
            size_t pos = 0;
            if (!path.empty() && path.front() == '/') pos = 1;
            bool trailing = false;
            while (pos <= path.size()) {
                size_t next = path.find('/', pos);
                if (next == std::string_view::npos) next = path.size();
                std::string_view seg = path.substr(pos, next - pos);
                trailing = false;
                if (seg == "..") {
                    if (!segments.empty()) segments.pop_back();
                    trailing = true;
                } else if (seg == ".") {
                    trailing = true;
                } else {
                    segments.push_back(seg);
                }
                pos = next + 1;
            }

            std::string out;
            for (const auto& seg : segments) {
                out.push_back('/');
                out.append(seg);
            }
            if (out.empty() || trailing) out.push_back('/');
            return out;
        }

    }  // namespace url_utils

    /// @brief Parse an absolute http(s) URL into its components.
    /// @param url The URL string to parse.
    /// @return A Result containing the UrlComponents on success, or an
    /// InvalidUrl error on failure.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        using R = Result<UrlComponents>;

        UrlComponents out;
        auto sep = url.find("://");
        if (sep == std::string_view::npos || sep == 0) {
            return R::err(Error::Code::InvalidUrl,
                          "URL must start with http:// or https://");
        }
        out.scheme = std::string(url.substr(0, sep));
        std::transform(out.scheme.begin(), out.scheme.end(), out.scheme.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        if (out.scheme != "http" && out.scheme != "https") {
            return R::err(Error::Code::InvalidUrl,
                          "Unsupported URL scheme '" + out.scheme + "'");
        }

        std::string_view s = url.substr(sep + 3);

        if (auto hash = s.find('#'); hash != std::string_view::npos) {
            out.fragment = std::string(s.substr(hash + 1));
            s = s.substr(0, hash);
        }

        // Split authority from path/query
        std::string_view hostport = s;
        std::string_view rest;
        if (auto cut = s.find_first_of("/?"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            rest = s.substr(cut);
        }

        // Credentials are not supported in the authority
        if (hostport.find('@') != std::string_view::npos) {
            return R::err(Error::Code::InvalidUrl,
                          "URL userinfo is not supported");
        }
        if (hostport.empty()) {
            return R::err(Error::Code::InvalidUrl, "URL missing host");
        }

        std::string_view host;
        std::string_view port;
        if (hostport.front() == '[') {
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return R::err(Error::Code::InvalidUrl,
                              "Unterminated IPv6 literal");
            }
            host = hostport.substr(1, close - 1);
            std::string_view after = hostport.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return R::err(Error::Code::InvalidUrl,
                                  "Garbage after IPv6 literal");
                }
                port = after.substr(1);
                if (port.empty()) {
                    return R::err(Error::Code::InvalidUrl, "URL has empty port");
                }
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
            if (port.empty()) {
                return R::err(Error::Code::InvalidUrl, "URL has empty port");
            }
        } else {
            host = hostport;
        }

        if (host.empty()) {
            return R::err(Error::Code::InvalidUrl, "URL has empty host");
        }

        if (!port.empty()) {
            if (port.size() > 5 ||
                !std::all_of(port.begin(), port.end(), [](unsigned char c) {
                    return std::isdigit(c) != 0;
                })) {
                return R::err(Error::Code::InvalidUrl,
                              "Invalid port '" + std::string(port) + "'");
            }
            auto n = std::stoul(std::string(port));
            if (n == 0 || n > 65535) {
                return R::err(Error::Code::InvalidUrl,
                              "Port out of range '" + std::string(port) + "'");
            }
            out.port = std::to_string(n);
        } else {
            out.port = out.https() ? "443" : "80";
        }

        out.host = std::string(host);
        std::transform(out.host.begin(), out.host.end(), out.host.begin(),
                       [](unsigned char c) { return std::tolower(c); });

        if (auto q = rest.find('?'); q != std::string_view::npos) {
            out.query = std::string(rest.substr(q + 1));
            rest = rest.substr(0, q);
        }
        out.path = rest.empty() ? std::string("/") : std::string(rest);
        return R::ok(std::move(out));
    }

    /// @brief Parse a CONNECT authority ("host:port"). The port is required.
    inline Result<UrlComponents> parse_authority(std::string_view authority) {
        using R = Result<UrlComponents>;
        auto colon = authority.rfind(':');
        if (colon == std::string_view::npos || colon + 1 == authority.size()) {
            return R::err(Error::Code::InvalidUrl,
                          "CONNECT target must be host:port, got '" +
                              std::string(authority) + "'");
        }
        auto parsed = parse_url("https://" + std::string(authority));
        if (!parsed) return parsed;
        if (parsed.value().path != "/" || !parsed.value().query.empty()) {
            return R::err(Error::Code::InvalidUrl,
                          "CONNECT target must not carry a path");
        }
        return parsed;
    }

    /// @brief Resolve a reference (such as a Location header value) against
    /// a base URL.
    inline Result<UrlComponents> resolve_reference(const UrlComponents& base,
                                                   std::string_view ref) {
        using R = Result<UrlComponents>;

        if (url_utils::is_absolute_url_with_protocol(ref)) {
            return parse_url(ref);
        }
        if (ref.size() >= 2 && ref[0] == '/' && ref[1] == '/') {
            return parse_url(base.scheme + ":" + std::string(ref));
        }

        UrlComponents out = base;
        out.fragment.clear();

        if (auto hash = ref.find('#'); hash != std::string_view::npos) {
            out.fragment = std::string(ref.substr(hash + 1));
            ref = ref.substr(0, hash);
        }

        if (ref.empty()) return R::ok(std::move(out));

        std::string_view ref_path = ref;
        std::string_view ref_query;
        bool has_query = false;
        if (auto q = ref.find('?'); q != std::string_view::npos) {
            ref_path = ref.substr(0, q);
            ref_query = ref.substr(q + 1);
            has_query = true;
        }

        if (ref_path.empty()) {
            out.query = std::string(ref_query);
            return R::ok(std::move(out));
        }

        if (ref_path.front() == '/') {
            out.path = url_utils::remove_dot_segments(ref_path);
        } else {
            std::string merged = base.path;
            auto slash = merged.rfind('/');
            merged = (slash == std::string::npos) ? "/"
                                                  : merged.substr(0, slash + 1);
            merged.append(ref_path);
            out.path = url_utils::remove_dot_segments(merged);
        }
        out.query = has_query ? std::string(ref_query) : std::string();
        return R::ok(std::move(out));
    }

}  // namespace relay_cpp
