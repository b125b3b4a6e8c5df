#pragma once

#include "toolmux/log/logger.hpp"

#include <memory>
#include <string>

#include <spdlog/logger.h>
#include <tl/expected.hpp>

namespace toolmux {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - what `--log-file` installs
// ─────────────────────────────────────────────────────────────────────────────
// The threshold lives here; the spdlog logger below it passes everything
// so that call sites reach the sinks with their source location.

class SpdlogLogger final : public ThresholdLogger {
public:
    SpdlogLogger(std::shared_ptr<spdlog::logger> backend, LogLevel min_level);

    void log(const LogRecord& record) override;

private:
    std::shared_ptr<spdlog::logger> backend_;
};

/// Append to `path`, creating it if needed. Warnings and worse are flushed
/// as they are written.
[[nodiscard]] tl::expected<std::unique_ptr<SpdlogLogger>, std::string> open_log_file(
    const std::string& path,
    LogLevel min_level
);

}  // namespace toolmux
