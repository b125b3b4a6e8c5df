#include "toolmux/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace toolmux {

namespace {

std::string_view color_of(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Off:   break;
    }
    return "";
}

std::string_view basename(std::string_view path) noexcept {
    auto slash = path.find_last_of('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

std::unique_ptr<ILogger>& installed() {
    static std::unique_ptr<ILogger> logger = std::make_unique<NullLogger>();
    return logger;
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (to_string(level) == upper) {
            return level;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────
//   toolmux WARN  server 'git' failed: I/O error (server_connection.cpp:251)

std::string ConsoleLogger::format(const LogRecord& record) const {
    std::string level(to_string(record.level));
    level.resize(5, ' ');

    std::string line = "toolmux ";
    if (colors_) {
        line += color_of(record.level);
        line += level;
        line += "\033[0m";
    } else {
        line += level;
    }
    line += ' ';
    line += record.message;
    line += " (";
    line += basename(record.location.file_name());
    line += ':';
    line += std::to_string(record.location.line());
    line += ')';
    return line;
}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    std::cerr << format(record) << '\n';
}

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────

ILogger& get_logger() noexcept {
    return *installed();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    installed() = logger ? std::move(logger) : std::make_unique<NullLogger>();
}

}  // namespace toolmux
