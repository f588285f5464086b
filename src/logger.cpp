// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#include "logger.hpp"

#include "env_vars.hpp"

#include <quill/Backend.h>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cctype>
#include <cstdlib>
#include <mutex>

namespace strix {

namespace {

constexpr const char* TIMESTAMP_FORMAT = "%Y-%m-%dT%H:%M:%S.%QmsZ";

// {{ and }} are literal braces in Quill patterns
constexpr const char* LINE_PATTERN =
    "{{\"timestamp\":\"%(time)\",\"level\":\"%(log_level)\",\"msg\":\"%(message)\""
    ",\"service\":\"" STRIX_SERVICE_NAME "\",\"version\":\"" STRIX_SERVICE_VERSION
    "\",\"commit\":\"" STRIX_GIT_COMMIT "\"}}";

/// Starts the Quill backend on first acquire and stops it with the last holder.
class BackendHandle {
public:
    BackendHandle(const BackendHandle&) = delete;
    BackendHandle& operator=(const BackendHandle&) = delete;

    ~BackendHandle() { quill::Backend::stop(); }

    static std::shared_ptr<BackendHandle> acquire() {
        static std::mutex mutex;
        static std::weak_ptr<BackendHandle> current;

        std::lock_guard<std::mutex> lock(mutex);
        auto handle = current.lock();
        if (!handle) {
            handle.reset(new BackendHandle());
            current = handle;
        }
        return handle;
    }

private:
    BackendHandle() { quill::Backend::start(quill::BackendOptions{}); }
};

quill::LogLevel parse_level(std::string_view text) {
    std::string level;
    level.reserve(text.size());
    for (unsigned char c : text) {
        level += static_cast<char>(std::tolower(c));
    }

    if (level == "trace") {
        return quill::LogLevel::TraceL1;
    }
    if (level == "debug") {
        return quill::LogLevel::Debug;
    }
    if (level == "warn" || level == "warning") {
        return quill::LogLevel::Warning;
    }
    if (level == "error") {
        return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, const char* key, const std::string& value) {
    writer.Key(key);
    writer.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_proxy(JsonWriter& writer, const ProxyContext& ctx) {
    writer.Key("proxy");
    writer.StartObject();
    write_string(writer, "traffic_class", ctx.traffic_class);
    if (!ctx.scheme.empty()) {
        write_string(writer, "scheme", ctx.scheme);
    }
    if (!ctx.host.empty()) {
        write_string(writer, "host", ctx.host);
    }
    if (ctx.port) {
        writer.Key("port");
        writer.Int(*ctx.port);
    }
    if (!ctx.url.empty()) {
        write_string(writer, "url", ctx.url);
    }
    writer.EndObject();
}

/// JSON string body of `text`, without the surrounding quotes
std::string escape(const std::string& text) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
    std::string quoted(buffer.GetString(), buffer.GetSize());
    return quoted.substr(1, quoted.size() - 2);
}

} // namespace

std::string LogEntry::build() const {
    if (!component_ && !operation_ && !proxy_ && !error_) {
        return escape(msg_);
    }

    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    if (component_) {
        write_string(writer, "component", *component_);
    }
    if (operation_) {
        write_string(writer, "operation", *operation_);
    }
    if (proxy_) {
        write_proxy(writer, *proxy_);
    }
    if (error_) {
        writer.Key("error");
        writer.StartObject();
        write_string(writer, "type", error_->type);
        write_string(writer, "message", error_->message);
        writer.EndObject();
    }
    writer.EndObject();

    // Splice the object's members between the pattern's quotes: msg","k":v,"_":"
    std::string_view fields(buffer.GetString() + 1, buffer.GetSize() - 2);
    std::string out = escape(msg_);
    out += "\",";
    out += fields;
    out += ",\"_\":\"";
    return out;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(std::string_view level, std::shared_ptr<quill::Sink> sink) {
    auto& self = instance();
    if (self.logger_ != nullptr) {
        return;
    }

    self.backend_ = BackendHandle::acquire();
    self.logger_ = quill::Frontend::create_or_get_logger(
        SERVICE_NAME, std::move(sink),
        quill::PatternFormatterOptions{LINE_PATTERN, TIMESTAMP_FORMAT, quill::Timezone::GmtTime});
    self.logger_->set_log_level(parse_level(level));
}

void Logger::init_from_env() {
    const char* level = std::getenv(env::LOG_LEVEL);
    init(level != nullptr && *level != '\0' ? std::string_view(level) : "info");
}

void Logger::shutdown() {
    auto& self = instance();
    if (self.logger_ != nullptr) {
        self.logger_->flush_log();
        quill::Frontend::remove_logger(self.logger_);
        self.logger_ = nullptr;
    }
    self.backend_.reset();
}

bool Logger::is_initialized() {
    return instance().logger_ != nullptr;
}

quill::Logger* Logger::get() {
    return instance().logger_;
}

bool Logger::should_log_debug() {
    const auto* logger = instance().logger_;
    return logger != nullptr && logger->get_log_level() <= quill::LogLevel::Debug;
}

void Logger::log(quill::LogLevel level, const LogEntry& entry) {
    auto* logger = instance().logger_;
    if (logger == nullptr) {
        return;
    }

    // Quill macros bind the level at compile time
    switch (level) {
        case quill::LogLevel::TraceL3:
        case quill::LogLevel::TraceL2:
        case quill::LogLevel::TraceL1:
            QUILL_LOG_TRACE_L1(logger, "{}", entry.build());
            break;
        case quill::LogLevel::Debug:
            QUILL_LOG_DEBUG(logger, "{}", entry.build());
            break;
        case quill::LogLevel::Warning:
            QUILL_LOG_WARNING(logger, "{}", entry.build());
            break;
        case quill::LogLevel::Error:
        case quill::LogLevel::Critical:
            QUILL_LOG_ERROR(logger, "{}", entry.build());
            break;
        default:
            QUILL_LOG_INFO(logger, "{}", entry.build());
            break;
    }
}

} // namespace strix
