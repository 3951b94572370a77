// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "meshgate/log/logger.hpp"
#include "meshgate/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace meshgate;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Functionality Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
}

TEST_CASE("SpdlogLogger level conversion round-trips", "[log][spdlog]") {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
}

TEST_CASE("SpdlogLogger appends structured fields to the message", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);

    SpdlogLogger logger(std::vector<spdlog::sink_ptr>{sink}, LogLevel::Debug);
    logger.set_pattern("%l %v");

    logger.warn("Degraded dispatch", {{"service", "users"}, {"endpoint", "/u1"}});
    logger.debug("Retry scheduled", {{"delay_ms", "200"}});
    logger.trace("filtered");
    logger.flush();

    const auto text = out.str();
    REQUIRE(text.find("warning Degraded dispatch service=users endpoint=/u1") != std::string::npos);
    REQUIRE(text.find("debug Retry scheduled delay_ms=200") != std::string::npos);
    REQUIRE(text.find("filtered") == std::string::npos);
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// File Logging Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger file logger respects log level", "[log][spdlog][file]") {
    const std::string test_file = "test_meshgate_level.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Warn);
        logger->info("This should not appear");
        logger->warn("This should appear");
        logger->flush();
    }

    const auto content = read_file(test_file);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("This should appear") != std::string::npos);

    std::filesystem::remove(test_file);
}

TEST_CASE("SpdlogLogger console+file logger writes the file", "[log][spdlog][file]") {
    const std::string test_file = "test_meshgate_console_file.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_console_file_logger(test_file, LogLevel::Info);
        logger->error("Circuit opened", {{"service", "payments"}});
        logger->flush();
    }

    const auto content = read_file(test_file);
    REQUIRE(content.find("Circuit opened service=payments") != std::string::npos);

    std::filesystem::remove(test_file);
}

TEST_CASE("make_spdlog_logger rotates files when sized", "[log][spdlog][file]") {
    const std::string test_file = "test_meshgate_rotating.log";
    std::filesystem::remove(test_file);

    {
        LoggingConfig config;
        config.console = false;
        config.file = test_file;
        config.max_file_size = 64 * 1024;
        config.max_files = 2;
        config.pattern = "%l %v";

        auto logger = make_spdlog_logger(config);
        logger->info("Endpoint weights updated", {{"service", "users"}, {"count", "2"}});
        logger->flush();
    }

    REQUIRE(read_file(test_file) == "info Endpoint weights updated service=users count=2\n");
    std::filesystem::remove(test_file);
}

TEST_CASE("make_spdlog_logger needs a sink", "[log][spdlog]") {
    LoggingConfig config;
    config.console = false;
    REQUIRE_THROWS_AS(make_spdlog_logger(config), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Async Logging Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger async console logger works", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Info);
    REQUIRE(logger != nullptr);

    for (int i = 0; i < 10; ++i) {
        logger->info_fmt("Async message {}", i);
    }
    logger->flush();

    REQUIRE(logger->should_log(LogLevel::Info));
}

// ═══════════════════════════════════════════════════════════════════════════
// Integration with Global Logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger can be set as global logger", "[log][spdlog][integration]") {
    const std::string test_file = "test_meshgate_global.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Info);
        auto* spdlog_ptr = logger.get();
        set_logger(std::move(logger));

        MESHGATE_LOG_INFO("Global logger test");
        spdlog_ptr->flush();
    }

    REQUIRE(read_file(test_file).find("Global logger test") != std::string::npos);

    set_logger(nullptr);
    std::filesystem::remove(test_file);
}
