#pragma once

#include "toolmux/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

namespace toolmux::test {

// Appends every record at or above its threshold to a vector the test owns
class RecordingLogger final : public ThresholdLogger {
public:
    explicit RecordingLogger(std::vector<LogRecord>& records, LogLevel min_level = LogLevel::Trace)
        : ThresholdLogger(min_level)
        , records_(records)
    {}

    void log(const LogRecord& record) override {
        records_.push_back(record);
    }

private:
    std::vector<LogRecord>& records_;
};

// Installs a RecordingLogger for one test and restores the NullLogger after it
class ScopedRecording {
public:
    explicit ScopedRecording(LogLevel min_level = LogLevel::Trace) {
        set_logger(std::make_unique<RecordingLogger>(records, min_level));
    }
    ~ScopedRecording() { set_logger(nullptr); }

    ScopedRecording(const ScopedRecording&) = delete;
    ScopedRecording& operator=(const ScopedRecording&) = delete;

    [[nodiscard]] bool contains(const std::string& fragment) const {
        for (const auto& record : records) {
            if (record.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::vector<LogRecord> records;
};

}  // namespace toolmux::test
