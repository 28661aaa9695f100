#ifndef BOSHPP_TESTS_MOCKS_CAPTURE_LOGGER_HPP
#define BOSHPP_TESTS_MOCKS_CAPTURE_LOGGER_HPP

#include "boshpp/log/logger.hpp"

#include <algorithm>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace boshpp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// CaptureLogger - Records log output for verification
// ─────────────────────────────────────────────────────────────────────────────
// Sessions log from several threads, so recording is locked.

class CaptureLogger final : public ILogger {
public:
    explicit CaptureLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] bool contains(std::string_view fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(records_.begin(), records_.end(), [fragment](const LogRecord& record) {
            return record.message.find(fragment) != std::string::npos;
        });
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.clear();
    }

private:
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

}  // namespace boshpp::testing

#endif  // BOSHPP_TESTS_MOCKS_CAPTURE_LOGGER_HPP
