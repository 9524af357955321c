#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "headers.hpp"
#include "url.hpp"

namespace relay_cpp {

    /**
     * @brief In-memory cookie store.
     *
     * Records Set-Cookie headers from responses and renders the matching
     * Cookie header for later requests. Thread-safe.
     */
    class CookieJar {
       public:
        struct Cookie {
            std::string name;
            std::string value;
            std::string domain;
            std::string path{"/"};
            bool host_only{true};
            bool secure{false};
            std::optional<std::chrono::steady_clock::time_point> expires;
        };

        /// @brief Parse one Set-Cookie value received from url.
        /// @return false when the cookie was rejected (bad syntax or a
        /// foreign domain).
        bool set_cookie(const UrlComponents& url, std::string_view set_cookie);

        /// @brief Record every Set-Cookie header of a response.
        void store_from(const UrlComponents& url, const Headers& headers);

        /// @brief "a=1; b=2" for the cookies that match url, empty if none.
        std::string cookie_header_for(const UrlComponents& url) const;

        void clear();
        size_t size() const;

       private:
        void purge_expired_locked_(std::chrono::steady_clock::time_point now);

        mutable std::mutex mu_;
        std::vector<Cookie> cookies_;
    };

}  // namespace relay_cpp
