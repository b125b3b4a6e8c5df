#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Logging
// ═══════════════════════════════════════════════════════════════════════════
// One process-wide sink behind ILogger. Library code only uses the
// TOOLMUX_LOG_* macros; the front end decides where lines go:
//
//   set_logger(std::make_unique<ConsoleLogger>(LogLevel::Debug));
//   TOOLMUX_LOG_INFO("server '" + name + "' ready");
//
// The default is NullLogger, so an embedding program that installs nothing
// pays for one virtual call per macro and never formats a message.

#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace toolmux {

enum class LogLevel : std::uint8_t {
    Trace,  // Wire traffic
    Debug,  // Per-call detail, permission decisions
    Info,   // Server lifecycle
    Warn,   // A server or call failed; the session continues
    Error,  // A front-end operation failed
    Off
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// "debug", "WARN", "warning", ...
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

struct LogRecord {
    LogLevel level{LogLevel::Info};
    std::string message;
    std::source_location location;
};

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string message,
               std::source_location location = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord{level, std::move(message), location});
        }
    }
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord&) override {}

    [[nodiscard]] bool should_log(LogLevel) const noexcept override { return false; }
};

// ─────────────────────────────────────────────────────────────────────────────
// ThresholdLogger - drops everything below a minimum level
// ─────────────────────────────────────────────────────────────────────────────

class ThresholdLogger : public ILogger {
public:
    explicit ThresholdLogger(LogLevel min_level) : min_level_(min_level) {}

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level != LogLevel::Off && level >= min_level_;
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

private:
    LogLevel min_level_;
};

/// stderr, which the tool servers share, so lines carry a "toolmux" tag
class ConsoleLogger final : public ThresholdLogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Warn, bool colors = true)
        : ThresholdLogger(min_level)
        , colors_(colors)
    {}

    void log(const LogRecord& record) override;

    /// The line `log` writes, without the trailing newline
    [[nodiscard]] std::string format(const LogRecord& record) const;

private:
    bool colors_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────
// Installed once by the front end before the io_context runs.

[[nodiscard]] ILogger& get_logger() noexcept;

/// nullptr restores the NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define TOOLMUX_LOG(level, msg) \
    do { \
        auto& toolmux_logger_ = ::toolmux::get_logger(); \
        if (toolmux_logger_.should_log(level)) { \
            toolmux_logger_.write(level, msg); \
        } \
    } while (false)

#define TOOLMUX_LOG_TRACE(msg) TOOLMUX_LOG(::toolmux::LogLevel::Trace, msg)
#define TOOLMUX_LOG_DEBUG(msg) TOOLMUX_LOG(::toolmux::LogLevel::Debug, msg)
#define TOOLMUX_LOG_INFO(msg)  TOOLMUX_LOG(::toolmux::LogLevel::Info, msg)
#define TOOLMUX_LOG_WARN(msg)  TOOLMUX_LOG(::toolmux::LogLevel::Warn, msg)
#define TOOLMUX_LOG_ERROR(msg) TOOLMUX_LOG(::toolmux::LogLevel::Error, msg)

}  // namespace toolmux
