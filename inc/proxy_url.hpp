// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace strix {

/**
 * @brief Proxy protocols accepted for upstream proxies.
 */
enum class ProxyScheme {
    Http,
    Https,
    Socks5, ///< Hostnames resolved locally
    Socks5h ///< Hostnames resolved by the proxy
};

/**
 * @brief Thrown when a proxy URL cannot be tokenized at all.
 *
 * Missing components (no host, no port, unknown scheme) are not parse errors;
 * they produce a ProxyUrl with the component left empty.
 */
class UrlParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Components of a proxy URL.
 *
 * The original text is kept verbatim in `url` so adapters can hand it to
 * client libraries unchanged.
 */
struct ProxyUrl {
    std::string url;
    std::string scheme_name;           ///< Lower-cased scheme token as written
    std::optional<ProxyScheme> scheme; ///< Unset for unsupported schemes
    std::string host;                  ///< IPv6 literals without brackets
    int port = 0;                      ///< 0 when absent
    std::optional<std::string> username;
    std::optional<std::string> password;

    [[nodiscard]] bool is_socks() const {
        return scheme == ProxyScheme::Socks5 || scheme == ProxyScheme::Socks5h;
    }

    /// URL with the password replaced by "***", safe for logs and reports.
    [[nodiscard]] std::string redacted() const;
};

/**
 * @brief Split a proxy URL into its components.
 *
 * Accepts `scheme://[user[:pass]@]host[:port][/path][?query][#fragment]`.
 * Credentials are percent-decoded.
 *
 * @param text The URL to parse.
 * @return ProxyUrl with missing components left empty/zero.
 *
 * @throws UrlParseError on malformed input (no "://", bad scheme token,
 *         unterminated IPv6 literal, non-numeric or out-of-range port).
 */
ProxyUrl parse_proxy_url(std::string_view text);

/**
 * @brief Canonical scheme token ("http", "https", "socks5", "socks5h").
 */
std::string_view to_string(ProxyScheme scheme);

} // namespace strix
