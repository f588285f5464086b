// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "proxy_config.hpp"

#include <stdexcept>

#include <httplib.h>

namespace strix {

/**
 * @brief The effective proxy cannot be expressed through httplib's proxy
 *        settings (SOCKS, or TLS to the proxy itself).
 */
class UnsupportedProxyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Route an httplib client through the effective proxy for a traffic
 *        class.
 *
 * Sets the proxy host/port and, when the URL embeds credentials, proxy basic
 * auth. httplib speaks plain HTTP to the proxy (CONNECT for https targets), so
 * only http:// proxies are supported.
 *
 * @param client Client to configure. Nothing is sent.
 * @param config Validated proxy configuration.
 * @param traffic Traffic class whose effective proxy is used.
 * @return true if a proxy was applied, false if none is configured.
 *
 * @throws UnsupportedProxyError for socks5/socks5h/https proxies. Falling back
 *         to a direct connection would bypass the configured proxy.
 */
bool configure_http_client(httplib::Client& client, const ProxyConfig& config,
                           TrafficClass traffic);

} // namespace strix
