// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "proxy_url.hpp"

#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace strix {

/**
 * @brief Class of outbound traffic a proxy applies to.
 */
enum class TrafficClass {
    Tools, ///< Requests made by agent/tool execution
    Llm    ///< Requests to the language-model provider API
};

/// Proxy settings keyed by scheme ("http"/"https") or URL prefix ("http://"/"https://")
using ProxyMap = std::map<std::string, std::string>;

/// Key returned by to_scheme_keyed_proxy_map() when the proxy needs a SOCKS transport
constexpr char SOCKS_PROXY_KEY[] = "_socks_proxy";

/**
 * @brief Invalid proxy URL supplied for one of the configuration fields.
 *
 * `field()` is the environment variable name of the field
 * (STRIX_PROXY_TOOLS, STRIX_PROXY_LLM or STRIX_PROXY_ALL), also when the
 * value came from a config file.
 *
 * `cause()` holds the underlying UrlParseError when the URL could not be
 * tokenized; it is null when a component was merely missing or unsupported.
 */
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(std::string field, std::string url, const std::string& reason,
                       std::exception_ptr cause = nullptr);

    [[nodiscard]] const std::string& field() const noexcept { return field_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::string field_;
    std::string url_;
    std::exception_ptr cause_;
};

/// No proxy configured for the traffic class
struct NoProxy {};

/// HTTP(S) proxy usable through a plain URL
struct SimpleProxy {
    std::string url;
};

/// SOCKS proxy; the caller must build a SOCKS-capable transport
struct SocksProxy {
    std::string url;
};

using ProxyRoute = std::variant<NoProxy, SimpleProxy, SocksProxy>;

/**
 * @brief Upstream proxy settings for tool and LLM traffic.
 *
 * Holds three optional proxy URLs and validates each on construction.
 * Class-specific settings take precedence over the catch-all `all_proxy`.
 * Instances are immutable once constructed. Empty strings are treated as
 * absent.
 */
class ProxyConfig {
public:
    ProxyConfig() = default;

    /**
     * @brief Validate and store the proxy URLs.
     *
     * @throws ConfigurationError if any present URL lacks a supported scheme
     *         (http, https, socks5, socks5h), a hostname or a non-zero port.
     */
    ProxyConfig(std::optional<std::string> tools_proxy, std::optional<std::string> llm_proxy,
                std::optional<std::string> all_proxy);

    [[nodiscard]] std::optional<std::string> tools_proxy() const { return raw(tools_); }
    [[nodiscard]] std::optional<std::string> llm_proxy() const { return raw(llm_); }
    [[nodiscard]] std::optional<std::string> all_proxy() const { return raw(all_); }

    /// tools_proxy, falling back to all_proxy
    [[nodiscard]] std::optional<std::string> effective_tools_proxy() const;

    /// llm_proxy, falling back to all_proxy
    [[nodiscard]] std::optional<std::string> effective_llm_proxy() const;

    [[nodiscard]] std::optional<std::string> effective_proxy(TrafficClass traffic) const;

    /// Parsed form of the effective proxy, for callers that need host/port
    [[nodiscard]] const std::optional<ProxyUrl>& effective_proxy_url(TrafficClass traffic) const;

    /**
     * @brief Proxy map for clients taking one URL per request scheme.
     *
     * @return {"http": url, "https": url}, or std::nullopt without a proxy.
     */
    [[nodiscard]] std::optional<ProxyMap>
    to_simple_proxy_map(TrafficClass traffic = TrafficClass::Tools) const;

    /**
     * @brief Proxy map for clients matching on URL prefixes.
     *
     * @return {"http://": url, "https://": url} for HTTP(S) proxies,
     *         {SOCKS_PROXY_KEY: url} for SOCKS proxies,
     *         or std::nullopt without a proxy.
     */
    [[nodiscard]] std::optional<ProxyMap>
    to_scheme_keyed_proxy_map(TrafficClass traffic = TrafficClass::Tools) const;

    /// Same decision as to_scheme_keyed_proxy_map() as a tagged variant
    [[nodiscard]] ProxyRoute route(TrafficClass traffic = TrafficClass::Tools) const;

    /**
     * @brief Environment variables for the LLM client.
     *
     * @return {"HTTP_PROXY": url, "HTTPS_PROXY": url}, or empty without an
     *         effective LLM proxy.
     */
    [[nodiscard]] ProxyMap to_llm_client_env() const;

private:
    static std::optional<std::string> raw(const std::optional<ProxyUrl>& proxy) {
        return proxy ? std::optional<std::string>(proxy->url) : std::nullopt;
    }

    std::optional<ProxyUrl> tools_;
    std::optional<ProxyUrl> llm_;
    std::optional<ProxyUrl> all_;
};

std::string_view to_string(TrafficClass traffic);

} // namespace strix
