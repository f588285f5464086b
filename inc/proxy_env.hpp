// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "proxy_config.hpp"

namespace strix {

/**
 * @brief Build a ProxyConfig from STRIX_PROXY_TOOLS, STRIX_PROXY_LLM and
 *        STRIX_PROXY_ALL.
 *
 * Variables that are unset or set to an empty string are treated as absent.
 *
 * @throws ConfigurationError if any configured URL is invalid.
 */
ProxyConfig load_from_environment();

/**
 * @brief Export the effective LLM proxy as HTTP_PROXY and HTTPS_PROXY.
 *
 * Existing values are overwritten. When no LLM proxy is effective the
 * environment is left untouched.
 *
 * @note This modifies the process environment and affects all threads.
 * @throws std::system_error if a variable cannot be set.
 */
void apply_llm_client_env(const ProxyConfig& config);

/**
 * @brief Log the effective proxy of each traffic class (credentials redacted).
 */
void log_effective_proxies(const ProxyConfig& config);

/**
 * @brief Load proxy settings from the environment and export them for the
 *        LLM client.
 *
 * LLM clients that only honor HTTP_PROXY/HTTPS_PROXY read them when they are
 * constructed, so this must run early at startup, before any such client is
 * created. Clients that accept an explicit proxy should instead be given the
 * returned ProxyConfig (see configure_http_client()).
 *
 * @throws ConfigurationError if any configured URL is invalid.
 */
ProxyConfig configure_global_proxies();

/**
 * @brief Process-wide proxy configuration.
 *
 * Built by configure_global_proxies() on the first call; every later call
 * returns the same instance without reading the environment again. The value
 * is fixed for the lifetime of the process. Initialization is thread-safe. If
 * it throws, nothing is cached and the next call retries.
 *
 * @throws ConfigurationError on the initializing call if the environment holds
 *         an invalid proxy URL.
 */
const ProxyConfig& get_global_config();

} // namespace strix
