#include <catch2/catch_test_macros.hpp>

#include "toolmux/log/logger.hpp"
#include "toolmux/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace toolmux;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::filesystem::path temp_log(const char* name) {
    auto path = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove(path);
    return path;
}

}  // namespace

TEST_CASE("SpdlogLogger applies its own threshold", "[log][spdlog]") {
    std::ostringstream out;
    auto backend = std::make_shared<spdlog::logger>(
        "toolmux-test", std::make_shared<spdlog::sinks::ostream_sink_st>(out));
    backend->set_pattern("%l|%s|%v");

    SpdlogLogger logger(backend, LogLevel::Info);
    REQUIRE(logger.level() == LogLevel::Info);
    REQUIRE_FALSE(logger.should_log(LogLevel::Debug));

    logger.write(LogLevel::Debug, "not written");
    logger.write(LogLevel::Info, "server git ready");
    logger.write(LogLevel::Error, "server fs failed");

    logger.set_level(LogLevel::Trace);
    logger.write(LogLevel::Trace, "wire line");

    auto text = out.str();
    REQUIRE(text.find("not written") == std::string::npos);
    REQUIRE(text.find("info|spdlog_logger_test.cpp|server git ready") != std::string::npos);
    REQUIRE(text.find("error|spdlog_logger_test.cpp|server fs failed") != std::string::npos);
    REQUIRE(text.find("trace|spdlog_logger_test.cpp|wire line") != std::string::npos);
}

TEST_CASE("open_log_file appends to a file", "[log][spdlog][file]") {
    auto path = temp_log("toolmux_spdlog_file_test.log");
    {
        auto logger = open_log_file(path.string(), LogLevel::Debug);
        REQUIRE(logger.has_value());
        (*logger)->write(LogLevel::Trace, "trace line");
        (*logger)->write(LogLevel::Debug, "debug line");
        (*logger)->write(LogLevel::Warn, "warn line");
    }
    {
        auto reopened = open_log_file(path.string(), LogLevel::Debug);
        REQUIRE(reopened.has_value());
        (*reopened)->write(LogLevel::Warn, "second run");
    }

    auto text = read_file(path);
    REQUIRE(text.find("trace line") == std::string::npos);
    REQUIRE(text.find("debug line") != std::string::npos);
    REQUIRE(text.find("warning [spdlog_logger_test.cpp:") != std::string::npos);
    REQUIRE(text.find("second run") != std::string::npos);
    REQUIRE(text.find("warn line") < text.find("second run"));
    std::filesystem::remove(path);
}

TEST_CASE("open_log_file reports a path it cannot open", "[log][spdlog][file][error]") {
    auto dir = std::filesystem::temp_directory_path();

    auto logger = open_log_file(dir.string(), LogLevel::Info);

    REQUIRE_FALSE(logger.has_value());
    REQUIRE(logger.error().rfind("cannot open log file: ", 0) == 0);
}

TEST_CASE("A log file can be the global logger", "[log][spdlog][integration]") {
    auto path = temp_log("toolmux_spdlog_global_test.log");

    auto logger = open_log_file(path.string(), LogLevel::Info);
    REQUIRE(logger.has_value());
    set_logger(std::move(*logger));
    TOOLMUX_LOG_DEBUG("below the threshold");
    TOOLMUX_LOG_INFO("routed through the global logger");
    TOOLMUX_LOG_WARN("flushed on warn");
    set_logger(nullptr);

    auto text = read_file(path);
    REQUIRE(text.find("below the threshold") == std::string::npos);
    REQUIRE(text.find("routed through the global logger") != std::string::npos);
    REQUIRE(text.find("flushed on warn") != std::string::npos);
    std::filesystem::remove(path);
}
