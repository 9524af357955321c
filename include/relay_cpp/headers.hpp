#pragma once

#include <boost/beast/core/string.hpp>
#include <boost/beast/http/fields.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace relay_cpp {

    /// @brief Ordered header set with case-insensitive names. Duplicate names
    /// are kept in insertion order.
    using Headers = boost::beast::http::fields;

    namespace headers {

        inline constexpr std::string_view kHopByHop[] = {
            "Connection", "Keep-Alive",        "Proxy-Authenticate",
            "Proxy-Authorization", "TE",       "Trailer",
            "Transfer-Encoding",   "Upgrade",
        };

        inline bool is_hop_by_hop(std::string_view name) {
            for (auto h : kHopByHop) {
                if (boost::beast::iequals(h, name)) return true;
            }
            return false;
        }

        /// @brief Split a comma separated header value into trimmed tokens.
        inline std::vector<std::string_view> split_tokens(std::string_view v) {
            std::vector<std::string_view> out;
            size_t pos = 0;
            while (pos <= v.size()) {
                size_t comma = v.find(',', pos);
                if (comma == std::string_view::npos) comma = v.size();
                std::string_view tok = v.substr(pos, comma - pos);
                while (!tok.empty() && (tok.front() == ' ' || tok.front() == '\t'))
                    tok.remove_prefix(1);
                while (!tok.empty() && (tok.back() == ' ' || tok.back() == '\t'))
                    tok.remove_suffix(1);
                if (!tok.empty()) out.push_back(tok);
                pos = comma + 1;
            }
            return out;
        }

        /// @brief True when any `name` header lists `token` (case-insensitive).
        inline bool has_token(const Headers& h, std::string_view name,
                              std::string_view token) {
            auto range = h.equal_range(name);
            for (auto it = range.first; it != range.second; ++it) {
                for (auto tok : split_tokens(it->value())) {
                    if (boost::beast::iequals(tok, token)) return true;
                }
            }
            return false;
        }

        /// @brief Copy of h without hop-by-hop headers, including any header
        /// named by a Connection token.
        inline Headers strip_hop_by_hop(const Headers& h) {
            std::vector<std::string> listed;
            auto range = h.equal_range("Connection");
            for (auto it = range.first; it != range.second; ++it) {
                for (auto tok : split_tokens(it->value())) {
                    listed.emplace_back(tok);
                }
            }

            Headers out;
            for (const auto& f : h) {
                auto name = f.name_string();
                if (is_hop_by_hop(name)) continue;
                bool drop = false;
                for (const auto& l : listed) {
                    if (boost::beast::iequals(l, name)) {
                        drop = true;
                        break;
                    }
                }
                if (!drop) out.insert(name, f.value());
            }
            return out;
        }

        /// @brief Merge override into base. A name present in override
        /// replaces every base entry of that name.
        inline Headers merge(const Headers& base, const Headers& override_) {
            Headers out = base;
            for (const auto& f : override_) out.erase(f.name_string());
            for (const auto& f : override_) out.insert(f.name_string(), f.value());
            return out;
        }

        inline Headers make(
            std::initializer_list<std::pair<std::string_view, std::string_view>>
                entries) {
            Headers out;
            for (const auto& [k, v] : entries) out.insert(k, v);
            return out;
        }

    }  // namespace headers

}  // namespace relay_cpp
