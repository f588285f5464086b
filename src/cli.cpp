// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "cli.hpp"

#include "version.hpp"
#include <CLI/CLI.hpp>

namespace strix {

CliConfig parse_cli_args(int argc, char* argv[]) {
    CliConfig config;

    CLI::App app{"Upstream proxy configuration v" + std::string(SERVICE_VERSION) + " (" +
                 GIT_COMMIT + ")"};

    // Global options
    app.add_option("-l,--log-level", config.log_level, "Log level (trace|debug|info|warn|error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error"}));

    auto* config_opt =
        app.add_option("-c,--config", config.config_path, "JSON configuration file")
            ->check(CLI::ExistingFile);

    app.add_option("--schema", config.schema_path, "JSON schema for the configuration file")
        ->needs(config_opt)
        ->check(CLI::ExistingFile)
        ->default_str(STRIX_DEFAULT_SCHEMA_PATH);

    auto* check_cmd = app.add_subcommand("check", "Validate proxy settings (default)");
    auto* show_cmd = app.add_subcommand("show", "Print resolved proxy settings as JSON");
    auto* env_cmd = app.add_subcommand("env", "Print HTTP_PROXY/HTTPS_PROXY shell exports");
    app.require_subcommand(0, 1);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    // Determine mode
    if (show_cmd->parsed()) {
        config.mode = CliConfig::Mode::Show;
    } else if (env_cmd->parsed()) {
        config.mode = CliConfig::Mode::Env;
    } else if (check_cmd->parsed()) {
        config.mode = CliConfig::Mode::Check;
    }

    return config;
}

} // namespace strix
