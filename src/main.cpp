// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include <cstdlib>
#include <exception>
#include <iostream>
#include <system_error>

#include "cli.hpp"
#include "config_loader.hpp"
#include "logger.hpp"
#include "proxy_env.hpp"
#include "proxy_report.hpp"

namespace {

/// Log and print a check failure; both outputs carry the same message
int report_failure(const char* message, const char* type, const std::exception& e) {
    LOG_ERROR_ENTRY(strix::LogEntry(message).component("proxy").error({type, e.what()}));
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    // Parse command-line arguments (bootstrap only)
    auto cli_config = strix::parse_cli_args(argc, argv);

    // Load service configuration (file + env overrides, or env only)
    strix::ServiceConfig config;
    try {
        config = cli_config.config_path
                     ? strix::load_config(*cli_config.config_path, cli_config.schema_path)
                     : strix::load_config_from_env();
    } catch (const std::exception& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    // show/env write machine-readable output to stdout, so they skip the logger
    if (cli_config.mode != strix::CliConfig::Mode::Check) {
        try {
            const auto proxies = config.proxy_config();
            if (cli_config.mode == strix::CliConfig::Mode::Show) {
                std::cout << strix::render_json_report(proxies) << "\n";
            } else {
                std::cout << strix::render_shell_exports(proxies);
            }
        } catch (const strix::ConfigurationError& e) {
            std::cerr << "Configuration error: " << e.what() << "\n";
            return 1;
        }
        return 0;
    }

    const auto& level =
        cli_config.log_level.empty() ? config.observability.logging.level : cli_config.log_level;
    strix::Logger::init(level);

    int exit_code = 0;
    try {
        if (cli_config.config_path) {
            strix::log_effective_proxies(config.proxy_config());
        } else {
            // Environment only: same path the agent runtime takes at startup
            (void)strix::get_global_config();
        }
        LOG_INFO("Proxy configuration is valid");
    } catch (const strix::ConfigurationError& e) {
        exit_code = report_failure("Invalid proxy configuration", "ConfigurationError", e);
    } catch (const std::system_error& e) {
        exit_code = report_failure("Failed to export proxy environment", "SystemError", e);
    }

    strix::Logger::shutdown();
    return exit_code;
}
