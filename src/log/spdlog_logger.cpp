#include "meshgate/log/spdlog_logger.hpp"

#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace meshgate {

namespace {

// spdlog keeps a global registry keyed by name; every gateway logger gets its own
std::string next_logger_name() {
    static std::atomic<std::uint64_t> counter{0};
    return "meshgate_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

// One worker thread shared by every async gateway logger. The queue size of
// the first caller wins.
std::shared_ptr<spdlog::details::thread_pool> shared_async_pool(std::size_t queue_size) {
    static std::once_flag once;
    static std::shared_ptr<spdlog::details::thread_pool> pool;
    std::call_once(once, [queue_size]() {
        pool = std::make_shared<spdlog::details::thread_pool>(queue_size, 1);
    });
    return pool;
}

std::vector<spdlog::sink_ptr> build_sinks(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    if (config.file.has_value()) {
        const bool rotating = (config.max_file_size > 0);
        if (rotating) {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                *config.file, config.max_file_size, std::max<std::size_t>(1, config.max_files)));
        } else {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*config.file));
        }
    }
    return sinks;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Level Conversion
// ─────────────────────────────────────────────────────────────────────────────

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level, const std::string& pattern)
    : logger_(std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end()))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(pattern);
}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Implementation
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "{}{}",
        record.message,
        format_fields(record.fields)
    );

    // Error records are flushed immediately
    if (record.level >= LogLevel::Error) {
        logger_->flush();
    }
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_logger(const LoggingConfig& config) {
    auto sinks = build_sinks(config);
    if (sinks.empty()) {
        throw std::invalid_argument("logging: at least one of console or file must be enabled");
    }

    if (config.async == false) {
        return std::make_unique<SpdlogLogger>(std::move(sinks), config.level, config.pattern);
    }

    auto logger = std::make_shared<spdlog::async_logger>(
        next_logger_name(),
        sinks.begin(),
        sinks.end(),
        shared_async_pool(config.async_queue_size),
        spdlog::async_overflow_policy::block
    );
    logger->set_level(SpdlogLogger::to_spdlog_level(config.level));
    logger->set_pattern(config.pattern);
    return std::make_unique<SpdlogLogger>(std::move(logger));
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    LoggingConfig config;
    config.level = min_level;
    return make_spdlog_logger(config);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    LoggingConfig config;
    config.level = min_level;
    config.console = false;
    config.file = filename;
    return make_spdlog_logger(config);
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(const std::string& filename, LogLevel min_level) {
    LoggingConfig config;
    config.level = min_level;
    config.file = filename;
    return make_spdlog_logger(config);
}

std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(LogLevel min_level, std::size_t queue_size) {
    LoggingConfig config;
    config.level = min_level;
    config.async = true;
    config.async_queue_size = queue_size;
    return make_spdlog_logger(config);
}

}  // namespace meshgate
