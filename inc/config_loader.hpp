// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "proxy_config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace strix {

/**
 * @brief Unvalidated proxy URLs as written in the config file or environment.
 */
struct ProxySettings {
    std::optional<std::string> tools;
    std::optional<std::string> llm;
    std::optional<std::string> all;
};

/**
 * @brief Logging configuration.
 */
struct LoggingConfig {
    std::string level = "info";
};

/**
 * @brief Observability settings.
 */
struct ObservabilityConfig {
    LoggingConfig logging;
};

/**
 * @brief Service configuration loaded from JSON config file.
 *
 * Values can be overridden by environment variables with STRIX_ prefix.
 */
struct ServiceConfig {
    ProxySettings proxy;
    ObservabilityConfig observability;

    /**
     * @brief Validate the proxy settings.
     * @throws ConfigurationError if any proxy URL is invalid
     */
    [[nodiscard]] ProxyConfig proxy_config() const {
        return ProxyConfig(proxy.tools, proxy.llm, proxy.all);
    }
};

/// JSON Pointer paths (RFC6901) for extracting ServiceConfig values
namespace json {
constexpr char PROXY_TOOLS[] = "/proxy/tools";
constexpr char PROXY_LLM[] = "/proxy/llm";
constexpr char PROXY_ALL[] = "/proxy/all";
constexpr char OBSERVABILITY_LOGGING_LEVEL[] = "/observability/logging/level";
} // namespace json

/**
 * @brief Load and validate service configuration from JSON file.
 *
 * Configuration layering (priority: high to low):
 * 1. Environment variables (STRIX_PROXY_TOOLS, STRIX_PROXY_LLM,
 *    STRIX_PROXY_ALL, STRIX_LOG_LEVEL)
 * 2. JSON configuration file
 *
 * Proxy URLs are not validated here; call ServiceConfig::proxy_config().
 *
 * @param config_path Path to the JSON configuration file
 * @param schema_path Path to the JSON schema file
 * @return ServiceConfig Schema-validated configuration
 *
 * @throws std::runtime_error if config file not found, invalid JSON, schema
 *         validation fails, or the log level is invalid
 */
ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path);

/**
 * @brief Configuration from environment variables only (no config file).
 *
 * @throws std::runtime_error if STRIX_LOG_LEVEL is invalid
 */
ServiceConfig load_config_from_env();

} // namespace strix
