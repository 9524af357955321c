#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "headers.hpp"
#include "http_method.hpp"
#include "url.hpp"

namespace relay_cpp {

    /**
     * @brief What a header middleware may look at: the request being built
     * and, when the request is being relayed, who asked for it.
     */
    struct RequestContext {
        HttpMethod method{HttpMethod::Get};
        const UrlComponents& url;
        /** @brief Address of the downstream peer, when relaying. */
        std::optional<std::string> client_address;
    };

    /**
     * @brief Interface for adjusting outbound headers before a request is
     * sent.
     *
     * Middleware may add or overwrite headers. It never changes the method or
     * the target. The client applies its chain in configuration order.
     */
    class HeaderMiddleware {
       public:
        virtual ~HeaderMiddleware() = default;

        /**
         * @brief Performs modifications on the outgoing headers.
         * @param ctx The request the headers belong to.
         * @param headers The outbound header set to modify.
         */
        virtual void apply(const RequestContext& ctx,
                           Headers& headers) const = 0;
    };

    /**
     * @brief Appends the downstream peer to `X-Forwarded-For`.
     *
     * Does nothing when the request carries no client address.
     */
    class XForwardedFor : public HeaderMiddleware {
       public:
        void apply(const RequestContext& ctx,
                   Headers& headers) const override {
            if (!ctx.client_address || ctx.client_address->empty()) return;

            std::string value(headers["X-Forwarded-For"]);
            if (!value.empty()) value += ", ";
            value += *ctx.client_address;
            headers.set("X-Forwarded-For", value);
        }
    };

    /**
     * @brief Replaces the `User-Agent` header.
     */
    class UserAgentOverride : public HeaderMiddleware {
       public:
        /**
         * @brief Constructs a UserAgentOverride.
         * @param user_agent The value to send.
         */
        explicit UserAgentOverride(std::string user_agent)
            : user_agent_(std::move(user_agent)) {}

        void apply(const RequestContext& /*ctx*/,
                   Headers& headers) const override {
            headers.set(boost::beast::http::field::user_agent, user_agent_);
        }

       private:
        std::string user_agent_;
    };

}  // namespace relay_cpp
