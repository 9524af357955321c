#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "config.hpp"
#include "result.hpp"
#include "url.hpp"

namespace relay_cpp {

    /// @brief Proxy settings from http_proxy, https_proxy and no_proxy (either
    /// case). The "no" entry defaults to default_no_proxy().
    ProxyInfo proxies_from_environment();

    /// @brief "localhost,127.0.0.1," plus the local host name.
    std::string default_no_proxy();

    /// @brief True when host ends with any suffix listed in no_list.
    bool bypasses_proxy(std::string_view no_list, std::string_view host);

    /// @brief Pick the proxy for a request.
    /// @param scheme "http", "https" or "connect". CONNECT uses the https
    /// proxy.
    /// @return nullopt for a direct connection, or a ProxyConfiguration error
    /// when the configured proxy URL cannot be understood.
    Result<std::optional<UrlComponents>> select_proxy(const ProxyInfo& info,
                                                      std::string_view scheme,
                                                      std::string_view host);

}  // namespace relay_cpp
