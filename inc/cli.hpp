// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#ifndef STRIX_DEFAULT_SCHEMA_PATH
    #error "STRIX_DEFAULT_SCHEMA_PATH must be defined by CMake"
#endif

namespace strix {

/**
 * @brief Command-line interface configuration result.
 */
struct CliConfig {
    enum class Mode {
        Check, ///< Validate proxy settings and log the result
        Show,  ///< Print resolved settings as JSON
        Env    ///< Print shell exports for the LLM client
    };

    Mode mode = Mode::Check;
    std::string log_level; ///< Empty: use STRIX_LOG_LEVEL or the config file
    std::optional<std::filesystem::path> config_path;
    std::filesystem::path schema_path = STRIX_DEFAULT_SCHEMA_PATH;
};

/**
 * @brief Parse command-line arguments.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @return CliConfig Parsed configuration
 *
 * Exits the process with CLI11's exit code on invalid arguments or --help.
 */
CliConfig parse_cli_args(int argc, char* argv[]);

} // namespace strix
