// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "proxy_config.hpp"

#include "env_vars.hpp"

#include <utility>

namespace strix {

namespace {

constexpr const char* SUPPORTED_SCHEMES = "http, https, socks5, socks5h";

/**
 * @brief Parse a configured proxy URL and enforce scheme, host and port.
 *
 * @param value The configured value; empty or absent means "not configured".
 * @param field_name Logical field name reported in errors.
 * @throws ConfigurationError on any violation.
 */
std::optional<ProxyUrl> validate_proxy_url(const std::optional<std::string>& value,
                                           const char* field_name) {
    if (!value || value->empty()) {
        return std::nullopt;
    }

    ProxyUrl parsed;
    try {
        parsed = parse_proxy_url(*value);
    } catch (const UrlParseError& e) {
        throw ConfigurationError(field_name, *value, e.what(), std::current_exception());
    }

    if (!parsed.scheme) {
        throw ConfigurationError(field_name, *value,
                                 "unsupported scheme '" + parsed.scheme_name +
                                     "'; supported schemes: " + SUPPORTED_SCHEMES);
    }
    if (parsed.host.empty()) {
        throw ConfigurationError(field_name, *value, "missing hostname");
    }
    if (parsed.port == 0) {
        throw ConfigurationError(field_name, *value, "missing port");
    }
    return parsed;
}

} // namespace

ConfigurationError::ConfigurationError(std::string field, std::string url,
                                       const std::string& reason, std::exception_ptr cause)
    : std::runtime_error("Invalid proxy URL in " + field + ": " + url + " (" + reason + ")"),
      field_(std::move(field)), url_(std::move(url)), cause_(std::move(cause)) {}

ProxyConfig::ProxyConfig(std::optional<std::string> tools_proxy,
                         std::optional<std::string> llm_proxy,
                         std::optional<std::string> all_proxy)
    : tools_(validate_proxy_url(tools_proxy, env::PROXY_TOOLS)),
      llm_(validate_proxy_url(llm_proxy, env::PROXY_LLM)),
      all_(validate_proxy_url(all_proxy, env::PROXY_ALL)) {}

const std::optional<ProxyUrl>& ProxyConfig::effective_proxy_url(TrafficClass traffic) const {
    const auto& specific = traffic == TrafficClass::Tools ? tools_ : llm_;
    return specific ? specific : all_;
}

std::optional<std::string> ProxyConfig::effective_proxy(TrafficClass traffic) const {
    return raw(effective_proxy_url(traffic));
}

std::optional<std::string> ProxyConfig::effective_tools_proxy() const {
    return effective_proxy(TrafficClass::Tools);
}

std::optional<std::string> ProxyConfig::effective_llm_proxy() const {
    return effective_proxy(TrafficClass::Llm);
}

std::optional<ProxyMap> ProxyConfig::to_simple_proxy_map(TrafficClass traffic) const {
    const auto& proxy = effective_proxy_url(traffic);
    if (!proxy) {
        return std::nullopt;
    }
    return ProxyMap{{"http", proxy->url}, {"https", proxy->url}};
}

std::optional<ProxyMap> ProxyConfig::to_scheme_keyed_proxy_map(TrafficClass traffic) const {
    const auto& proxy = effective_proxy_url(traffic);
    if (!proxy) {
        return std::nullopt;
    }
    if (proxy->is_socks()) {
        return ProxyMap{{SOCKS_PROXY_KEY, proxy->url}};
    }
    return ProxyMap{{"http://", proxy->url}, {"https://", proxy->url}};
}

ProxyRoute ProxyConfig::route(TrafficClass traffic) const {
    const auto& proxy = effective_proxy_url(traffic);
    if (!proxy) {
        return NoProxy{};
    }
    if (proxy->is_socks()) {
        return SocksProxy{proxy->url};
    }
    return SimpleProxy{proxy->url};
}

ProxyMap ProxyConfig::to_llm_client_env() const {
    ProxyMap env_vars;
    if (const auto& proxy = effective_proxy_url(TrafficClass::Llm)) {
        env_vars[env::HTTP_PROXY] = proxy->url;
        env_vars[env::HTTPS_PROXY] = proxy->url;
    }
    return env_vars;
}

std::string_view to_string(TrafficClass traffic) {
    return traffic == TrafficClass::Tools ? "tools" : "llm";
}

} // namespace strix
