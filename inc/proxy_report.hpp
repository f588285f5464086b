// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "proxy_config.hpp"

#include <string>
#include <string_view>

namespace strix {

/**
 * @brief Route kind as reported to users: "none", "simple" or "socks".
 */
std::string_view route_kind(const ProxyRoute& route);

/**
 * @brief Resolved proxy configuration as a JSON object.
 *
 * Example:
 *   {"tools":{"proxy":"socks5://h:1080","route":"socks"},
 *    "llm":{"proxy":"http://user:***@h:3128","route":"simple",
 *           "exported_env":["HTTPS_PROXY","HTTP_PROXY"]}}
 *
 * Passwords are redacted; a missing proxy is reported as null.
 */
std::string render_json_report(const ProxyConfig& config);

/**
 * @brief Shell `export` lines for the LLM client environment.
 *
 * Values are emitted verbatim (credentials included) inside single quotes,
 * suitable for `eval "$(strix-proxy env)"`. Empty when no LLM proxy applies.
 */
std::string render_shell_exports(const ProxyConfig& config);

} // namespace strix
