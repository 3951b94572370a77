#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace meshgate {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Very detailed debugging
    Debug = 1,  // Debugging information
    Info  = 2,  // General information
    Warn  = 3,  // Warnings (recoverable issues)
    Error = 4,  // Errors (operation failed)
    Fatal = 5,  // Fatal errors (unrecoverable)
    Off   = 6   // Disable all logging
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "WARN", ...). Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Structured Fields
// ─────────────────────────────────────────────────────────────────────────────
// Ordered key/value context attached to a record, e.g.
//   logger.warn("Retry scheduled", {{"service", name}, {"delay_ms", "200"}});

struct LogField {
    std::string key;
    std::string value;
};

using LogFields = std::vector<LogField>;

/// Render fields as " key=value key=value" (empty string when no fields).
[[nodiscard]] std::string format_fields(const LogFields& fields);

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    LogFields fields;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        LogFields flds = {},
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , fields(std::move(flds))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    // Core logging method
    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    // Convenience methods with structured fields and source location capture
    void trace(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Trace, msg, std::move(fields), loc);
    }

    void debug(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Debug, msg, std::move(fields), loc);
    }

    void info(std::string_view msg, LogFields fields = {},
              std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Info, msg, std::move(fields), loc);
    }

    void warn(std::string_view msg, LogFields fields = {},
              std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Warn, msg, std::move(fields), loc);
    }

    void error(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Error, msg, std::move(fields), loc);
    }

    void fatal(std::string_view msg, LogFields fields = {},
               std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Fatal, msg, std::move(fields), loc);
    }

    // Templated formatting helpers (C++20 std::format)
    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

private:
    void emit(LogLevel level, std::string_view msg, LogFields fields, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), std::move(fields), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (zero overhead when disabled)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - Outputs to stderr with colors
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept {
        min_level_ = level;
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_;
    }

    void set_colors_enabled(bool enabled) noexcept {
        colors_enabled_ = enabled;
    }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership). nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// These check should_log() before evaluating arguments

#define MESHGATE_LOG_TRACE(msg) \
    do { if (::meshgate::get_logger().should_log(::meshgate::LogLevel::Trace)) \
         ::meshgate::get_logger().trace(msg); } while(false)

#define MESHGATE_LOG_DEBUG(msg) \
    do { if (::meshgate::get_logger().should_log(::meshgate::LogLevel::Debug)) \
         ::meshgate::get_logger().debug(msg); } while(false)

#define MESHGATE_LOG_INFO(msg) \
    do { if (::meshgate::get_logger().should_log(::meshgate::LogLevel::Info)) \
         ::meshgate::get_logger().info(msg); } while(false)

#define MESHGATE_LOG_WARN(msg) \
    do { if (::meshgate::get_logger().should_log(::meshgate::LogLevel::Warn)) \
         ::meshgate::get_logger().warn(msg); } while(false)

#define MESHGATE_LOG_ERROR(msg) \
    do { if (::meshgate::get_logger().should_log(::meshgate::LogLevel::Error)) \
         ::meshgate::get_logger().error(msg); } while(false)

}  // namespace meshgate
