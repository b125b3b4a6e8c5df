#include "toolmux/log/spdlog_logger.hpp"

#include <spdlog/common.h>
#include <spdlog/sinks/basic_file_sink.h>

namespace toolmux {

namespace {

//   2026-10-19 14:02:11.532 warning [server_connection.cpp:251] server 'git' failed
constexpr const char* kFilePattern = "%Y-%m-%d %H:%M:%S.%e %-7l [%s:%#] %v";

spdlog::level::level_enum backend_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   break;
    }
    return spdlog::level::off;
}

}  // namespace

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> backend, LogLevel min_level)
    : ThresholdLogger(min_level)
    , backend_(std::move(backend))
{
    backend_->set_level(spdlog::level::trace);
}

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    backend_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        backend_level(record.level),
        "{}",
        record.message
    );
}

tl::expected<std::unique_ptr<SpdlogLogger>, std::string> open_log_file(
    const std::string& path,
    LogLevel min_level
) {
    std::shared_ptr<spdlog::sinks::basic_file_sink_mt> sink;
    try {
        sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
    } catch (const spdlog::spdlog_ex& e) {
        return tl::unexpected(std::string("cannot open log file: ") + e.what());
    }

    // Not registered with spdlog, so reopening the same path is fine
    auto backend = std::make_shared<spdlog::logger>("toolmux", std::move(sink));
    backend->set_pattern(kFilePattern);
    backend->flush_on(spdlog::level::warn);
    return std::make_unique<SpdlogLogger>(std::move(backend), min_level);
}

}  // namespace toolmux
