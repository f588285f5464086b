// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Environment variable names read and written by strix-proxy.
//
// These constants provide a single source of truth for environment variable
// names, both the STRIX_ inputs and the standard proxy variables exported for
// the LLM client.
// -----------------------------------------------------------------------------

namespace strix::env {

/// Proxy URL for tool/process traffic
constexpr const char* PROXY_TOOLS = "STRIX_PROXY_TOOLS";

/// Proxy URL for LLM API traffic
constexpr const char* PROXY_LLM = "STRIX_PROXY_LLM";

/// Fallback proxy URL applied to both traffic classes
constexpr const char* PROXY_ALL = "STRIX_PROXY_ALL";

/// Environment variable for overriding log level (trace/debug/info/warn/error)
constexpr const char* LOG_LEVEL = "STRIX_LOG_LEVEL";

/// Standard proxy variable honored by the LLM client for plain HTTP requests
constexpr const char* HTTP_PROXY = "HTTP_PROXY";

/// Standard proxy variable honored by the LLM client for HTTPS requests
constexpr const char* HTTPS_PROXY = "HTTPS_PROXY";

} // namespace strix::env
