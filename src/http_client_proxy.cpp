// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "http_client_proxy.hpp"

#include "logger.hpp"

#include <string>

namespace strix {

bool configure_http_client(httplib::Client& client, const ProxyConfig& config,
                           TrafficClass traffic) {
    const auto& proxy = config.effective_proxy_url(traffic);
    if (!proxy) {
        return false;
    }

    if (proxy->scheme != ProxyScheme::Http) {
        throw UnsupportedProxyError("HTTP client cannot use " +
                                    std::string(to_string(*proxy->scheme)) + " proxy " +
                                    proxy->redacted() + " for " +
                                    std::string(to_string(traffic)) + " traffic");
    }

    client.set_proxy(proxy->host, proxy->port);
    if (proxy->username) {
        client.set_proxy_basic_auth(*proxy->username, proxy->password.value_or(""));
    }

    LOG_DEBUG_ENTRY(LogEntry("HTTP client routed through proxy")
                        .component("proxy")
                        .operation("configure_http_client")
                        .proxy({.traffic_class = std::string(to_string(traffic)),
                                .scheme = "http",
                                .host = proxy->host,
                                .port = proxy->port,
                                .url = proxy->redacted()}));
    return true;
}

} // namespace strix
