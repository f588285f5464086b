// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#ifndef STRIX_TEST_UTILS_TEST_SINK_HPP
#define STRIX_TEST_UTILS_TEST_SINK_HPP

#include <quill/sinks/Sink.h>

#include <algorithm>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace strix {
namespace test {

/// Quill sink that keeps every formatted line in memory, newline stripped.
class TestSink final : public quill::Sink {
public:
    void write_log(quill::MacroMetadata const* /* log_metadata */, uint64_t /* log_timestamp */,
                   std::string_view /* thread_id */, std::string_view /* thread_name */,
                   std::string const& /* process_id */, std::string_view /* logger_name */,
                   quill::LogLevel /* log_level */, std::string_view /* log_level_description */,
                   std::string_view /* log_level_short_code */,
                   std::vector<std::pair<std::string, std::string>> const* /* named_args */,
                   std::string_view /* log_message */, std::string_view log_statement) override {
        if (log_statement.ends_with('\n')) {
            log_statement.remove_suffix(1);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.emplace_back(log_statement);
    }

    void flush_sink() noexcept override {}

    [[nodiscard]] std::vector<std::string> get_statements() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lines_;
    }

    /// True if some captured line contains `needle`
    [[nodiscard]] bool any_contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(lines_.begin(), lines_.end(), [needle](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

} // namespace test
} // namespace strix

#endif // STRIX_TEST_UTILS_TEST_SINK_HPP
