// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "proxy_env.hpp"

#include "env_vars.hpp"
#include "logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>
#include <system_error>

namespace strix {

namespace {

/**
 * @brief Get optional environment variable value.
 * @note Empty strings are treated as unset
 */
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr && value[0] != '\0') {
        return std::string(value);
    }
    return std::nullopt;
}

void log_effective_proxy(const ProxyConfig& config, TrafficClass traffic) {
    ProxyContext ctx{.traffic_class = std::string(to_string(traffic))};
    const auto& proxy = config.effective_proxy_url(traffic);
    if (!proxy) {
        LOG_DEBUG_ENTRY(LogEntry("No upstream proxy configured").component("proxy").proxy(ctx));
        return;
    }
    ctx.scheme = std::string(to_string(*proxy->scheme));
    ctx.host = proxy->host;
    ctx.port = proxy->port;
    ctx.url = proxy->redacted();
    LOG_INFO_ENTRY(LogEntry("Upstream proxy configured").component("proxy").proxy(ctx));
}

} // namespace

ProxyConfig load_from_environment() {
    return ProxyConfig(get_env(env::PROXY_TOOLS), get_env(env::PROXY_LLM),
                       get_env(env::PROXY_ALL));
}

void apply_llm_client_env(const ProxyConfig& config) {
    for (const auto& [name, value] : config.to_llm_client_env()) {
        if (setenv(name.c_str(), value.c_str(), 1) != 0) {
            throw std::system_error(errno, std::generic_category(),
                                    "Failed to export " + name);
        }
    }
}

void log_effective_proxies(const ProxyConfig& config) {
    log_effective_proxy(config, TrafficClass::Tools);
    log_effective_proxy(config, TrafficClass::Llm);
}

ProxyConfig configure_global_proxies() {
    auto config = load_from_environment();
    apply_llm_client_env(config);

    log_effective_proxies(config);
    return config;
}

const ProxyConfig& get_global_config() {
    // Function-local static: initialized once, thread-safe, retried if it throws
    static const ProxyConfig instance = configure_global_proxies();
    return instance;
}

} // namespace strix
