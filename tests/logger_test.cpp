#include <catch2/catch_test_macros.hpp>

#include "toolmux/log/logger.hpp"
#include "mocks/recording_logger.hpp"

#include <vector>

using namespace toolmux;
using toolmux::test::RecordingLogger;
using toolmux::test::ScopedRecording;

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level is case-insensitive", "[log]") {
    REQUIRE(parse_log_level("debug") == LogLevel::Debug);
    REQUIRE(parse_log_level("WARN") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("Off") == LogLevel::Off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;
    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Error) == false);
}

TEST_CASE("ConsoleLogger defaults to warnings", "[log]") {
    ConsoleLogger logger;
    REQUIRE(logger.level() == LogLevel::Warn);
    REQUIRE_FALSE(logger.should_log(LogLevel::Info));
    REQUIRE(logger.should_log(LogLevel::Warn));
    REQUIRE(logger.should_log(LogLevel::Error));
    REQUIRE_FALSE(logger.should_log(LogLevel::Off));

    logger.set_level(LogLevel::Debug);
    REQUIRE(logger.should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger.should_log(LogLevel::Trace));
}

TEST_CASE("ConsoleLogger tags lines with level and call site", "[log]") {
    LogRecord record{LogLevel::Warn, "server 'git' failed", std::source_location::current()};

    auto plain = ConsoleLogger(LogLevel::Warn, false).format(record);
    REQUIRE(plain.rfind("toolmux WARN  server 'git' failed (logger_test.cpp:", 0) == 0);
    REQUIRE(plain.back() == ')');

    auto colored = ConsoleLogger(LogLevel::Warn, true).format(record);
    REQUIRE(colored.find("\033[33mWARN ") != std::string::npos);
    REQUIRE(colored.find("\033[0m") != std::string::npos);
}

TEST_CASE("ILogger write filters by level", "[log]") {
    std::vector<LogRecord> records;
    RecordingLogger logger(records, LogLevel::Info);

    logger.write(LogLevel::Debug, "hidden");
    logger.write(LogLevel::Info, "server started");
    logger.write(LogLevel::Error, "server failed");

    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Info);
    REQUIRE(records[0].message == "server started");
    REQUIRE(records[1].level == LogLevel::Error);
}

TEST_CASE("Log records capture the call site", "[log]") {
    ScopedRecording recording;

    TOOLMUX_LOG_WARN("here");

    REQUIRE(recording.records.size() == 1);
    REQUIRE(std::string(recording.records[0].location.file_name()).find("logger_test") != std::string::npos);
    REQUIRE(recording.records[0].location.line() > 0);
}

TEST_CASE("Global logger macros route to the installed logger", "[log]") {
    ScopedRecording recording(LogLevel::Debug);

    TOOLMUX_LOG_TRACE("too quiet");
    TOOLMUX_LOG_DEBUG("debug " + std::to_string(1));
    TOOLMUX_LOG_WARN("warn");

    REQUIRE(recording.records.size() == 2);
    REQUIRE(recording.records[0].message == "debug 1");
    REQUIRE(recording.records[1].level == LogLevel::Warn);
}

TEST_CASE("set_logger(nullptr) restores the null logger", "[log]") {
    std::vector<LogRecord> records;
    set_logger(std::make_unique<RecordingLogger>(records));
    set_logger(nullptr);

    TOOLMUX_LOG_ERROR("dropped");

    REQUIRE(records.empty());
    REQUIRE_FALSE(get_logger().should_log(LogLevel::Error));
}
