// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "config_loader.hpp"

#include "env_vars.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <utility>

#include <rapidjson/document.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/pointer.h>
#include <rapidjson/schema.h>
#include <rapidjson/stringbuffer.h>

namespace strix {

namespace {

/// Parse a JSON file; `what` names the file in error messages
rapidjson::Document read_json_file(const std::filesystem::path& path, const char* what) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error(std::string("Failed to open ") + what + ": " + path.string());
    }

    rapidjson::IStreamWrapper stream(in);
    rapidjson::Document doc;
    doc.ParseStream(stream);
    if (doc.HasParseError()) {
        throw std::runtime_error(std::string("Failed to parse ") + what + ": " + path.string() +
                                 " at offset " + std::to_string(doc.GetErrorOffset()));
    }
    return doc;
}

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

/**
 * @brief Parse and validate log level from string.
 * @throws std::runtime_error if invalid log level
 */
std::string parse_log_level(const std::string& level, const std::string& source) {
    if (level == "trace" || level == "debug" || level == "info" || level == "warn" ||
        level == "warning" || level == "error") {
        return level;
    }
    throw std::runtime_error("Invalid " + source + ": " + level +
                             " (must be trace|debug|info|warn|error)");
}

/// String at a JSON Pointer, or std::nullopt when absent or empty
std::optional<std::string> get_optional_string(const rapidjson::Document& doc,
                                               const char* pointer) {
    if (auto* value = rapidjson::GetValueByPointer(doc, pointer)) {
        if (value->IsString() && value->GetStringLength() > 0) {
            return std::string(value->GetString(), value->GetStringLength());
        }
    }
    return std::nullopt;
}

/// Non-empty environment values replace file values
void apply_env_overrides(ServiceConfig& config) {
    const std::pair<const char*, std::optional<std::string>*> proxy_vars[] = {
        {env::PROXY_TOOLS, &config.proxy.tools},
        {env::PROXY_LLM, &config.proxy.llm},
        {env::PROXY_ALL, &config.proxy.all},
    };
    for (const auto& [name, field] : proxy_vars) {
        if (auto value = get_env(name)) {
            *field = std::move(value);
        }
    }

    if (auto level = get_env(env::LOG_LEVEL)) {
        config.observability.logging.level = parse_log_level(*level, env::LOG_LEVEL);
    }
}

} // namespace

ServiceConfig load_config(const std::filesystem::path& config_path,
                          const std::filesystem::path& schema_path) {
    const auto doc = read_json_file(config_path, "config file");
    const auto schema_doc = read_json_file(schema_path, "schema file");
    const rapidjson::SchemaDocument schema(schema_doc);

    rapidjson::SchemaValidator validator(schema);
    if (!doc.Accept(validator)) {
        rapidjson::StringBuffer where;
        validator.GetInvalidDocumentPointer().StringifyUriFragment(where);
        throw std::runtime_error("Config validation failed for " + config_path.string() +
                                 " at " + where.GetString() + " (keyword: " +
                                 validator.GetInvalidSchemaKeyword() + ")");
    }

    ServiceConfig config;
    config.proxy.tools = get_optional_string(doc, json::PROXY_TOOLS);
    config.proxy.llm = get_optional_string(doc, json::PROXY_LLM);
    config.proxy.all = get_optional_string(doc, json::PROXY_ALL);
    if (auto level = get_optional_string(doc, json::OBSERVABILITY_LOGGING_LEVEL)) {
        config.observability.logging.level = *level;
    }

    apply_env_overrides(config);
    return config;
}

ServiceConfig load_config_from_env() {
    ServiceConfig config;
    apply_env_overrides(config);
    return config;
}

} // namespace strix
