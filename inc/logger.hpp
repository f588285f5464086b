// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// JSON-lines logging for strix-proxy, backed by Quill.
//
//   Logger::init("debug");          // or Logger::init_from_env()
//   LOG_INFO("Loaded {} proxies", count);
//   LOG_INFO_ENTRY(LogEntry("Upstream proxy configured")
//                      .component("proxy")
//                      .proxy({.traffic_class = "llm", .url = redacted_url}));
//   Logger::shutdown();
//
// Each line:
//   {"timestamp":"2026-01-15T10:30:00.123Z","level":"INFO","msg":"...",
//    "service":"strix-proxy","version":"0.1.0","commit":"abc1234",
//    "component":"proxy","proxy":{...}}
//
// LOG_<LEVEL>(fmt, ...) requires an initialized logger. LOG_<LEVEL>_ENTRY is a
// no-op before init(), so library code uses only the _ENTRY form.
// -----------------------------------------------------------------------------

#include "version.hpp"

#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/Sink.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace strix {

/// Proxy details for a log line. Never put credentials in `url`; use ProxyUrl::redacted().
struct ProxyContext {
    std::string traffic_class; // "tools" | "llm"
    std::string scheme;
    std::string host;
    std::optional<int> port;
    std::string url;
};

struct ErrorContext {
    std::string type;
    std::string message;
};

/**
 * @brief Message plus optional structured fields, rendered into one JSON line.
 */
class LogEntry {
public:
    explicit LogEntry(std::string_view message) : msg_(message) {}

    LogEntry& component(std::string_view comp) {
        component_ = std::string(comp);
        return *this;
    }

    LogEntry& operation(std::string_view op) {
        operation_ = std::string(op);
        return *this;
    }

    LogEntry& proxy(const ProxyContext& ctx) {
        proxy_ = ctx;
        return *this;
    }

    LogEntry& error(const ErrorContext& ctx) {
        error_ = ctx;
        return *this;
    }

    /**
     * @brief Text substituted for %(message) in the JSON pattern.
     *
     * The pattern wraps the message in quotes, so structured fields are
     * appended after a closing quote and a trailing "_" field reopens one.
     */
    [[nodiscard]] std::string build() const;

private:
    std::string msg_;
    std::optional<std::string> component_;
    std::optional<std::string> operation_;
    std::optional<ProxyContext> proxy_;
    std::optional<ErrorContext> error_;
};

/**
 * @brief Process-wide owner of the Quill logger.
 */
class Logger {
public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Create the logger. A second call without shutdown() is a no-op.
     *
     * @param level trace|debug|info|warn|warning|error; anything else means info
     * @param sink Destination, replaced by a capturing sink in tests
     */
    static void init(std::string_view level = "info",
                     std::shared_ptr<quill::Sink> sink =
                         quill::Frontend::create_or_get_sink<quill::ConsoleSink>("console"));

    /// init() with the level from STRIX_LOG_LEVEL, defaulting to info
    static void init_from_env();

    /// Flush pending lines, drop the logger and stop the backend thread
    static void shutdown();

    [[nodiscard]] static bool is_initialized();

    /// Underlying Quill logger, nullptr before init()
    [[nodiscard]] static quill::Logger* get();

    [[nodiscard]] static bool should_log_debug();

    /// Emit a structured entry; dropped before init()
    static void log(quill::LogLevel level, const LogEntry& entry);

    static void log_trace(const LogEntry& entry) { log(quill::LogLevel::TraceL1, entry); }
    static void log_debug(const LogEntry& entry) { log(quill::LogLevel::Debug, entry); }
    static void log_info(const LogEntry& entry) { log(quill::LogLevel::Info, entry); }
    static void log_warn(const LogEntry& entry) { log(quill::LogLevel::Warning, entry); }
    static void log_error(const LogEntry& entry) { log(quill::LogLevel::Error, entry); }

private:
    Logger() = default;
    ~Logger() = default;

    static Logger& instance();

    // Keeps the Quill backend thread alive; type is private to logger.cpp
    std::shared_ptr<void> backend_;
    quill::Logger* logger_ = nullptr;
};

} // namespace strix

// Quill defines LOG_INFO etc. without a logger argument; replace them
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARN
#undef LOG_WARNING
#undef LOG_ERROR

#define LOG_TRACE(fmt, ...) QUILL_LOG_TRACE_L1(strix::Logger::get(), fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) QUILL_LOG_DEBUG(strix::Logger::get(), fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...) QUILL_LOG_INFO(strix::Logger::get(), fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...) QUILL_LOG_WARNING(strix::Logger::get(), fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) QUILL_LOG_ERROR(strix::Logger::get(), fmt, ##__VA_ARGS__)

#define LOG_TRACE_ENTRY(entry) strix::Logger::log_trace(entry)
#define LOG_DEBUG_ENTRY(entry) strix::Logger::log_debug(entry)
#define LOG_INFO_ENTRY(entry) strix::Logger::log_info(entry)
#define LOG_WARN_ENTRY(entry) strix::Logger::log_warn(entry)
#define LOG_ERROR_ENTRY(entry) strix::Logger::log_error(entry)
