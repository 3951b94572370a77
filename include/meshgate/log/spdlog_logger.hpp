#pragma once

#include "meshgate/log/logger.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <spdlog/logger.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace meshgate {

/// Timestamp, level, source location, then message and key=value fields
inline constexpr const char* kDefaultLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

// ─────────────────────────────────────────────────────────────────────────────
// LoggingConfig
// ─────────────────────────────────────────────────────────────────────────────
// Sink layout for the gateway's spdlog backend. Console output goes to stderr
// so tools can keep stdout for their JSON reports.

struct LoggingConfig {
    LogLevel level{LogLevel::Info};

    bool console{true};

    /// Also write to this file
    std::optional<std::string> file;

    /// Rotate the file at this size in bytes. 0 = never rotate.
    std::size_t max_file_size{0};
    std::size_t max_files{3};

    /// Format on spdlog's shared worker thread instead of the caller's
    bool async{false};
    std::size_t async_queue_size{8192};

    std::string pattern{kDefaultLogPattern};
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Record fields are appended to the message as key=value pairs, so a gateway
// line reads e.g.
//   [2026-10-17 12:00:01.123] [warning] [request_router.cpp:212] Degraded dispatch service=users endpoint=/u1

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger; the minimum level is taken from it.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level,
                 const std::string& pattern = kDefaultLogPattern);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    /// Set pattern format (spdlog pattern syntax)
    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

/// Build a logger from a sink layout. Throws std::invalid_argument when the
/// layout has no sink, spdlog::spdlog_ex when the file cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(const LoggingConfig& config);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console and file sinks together (what meshgate-cli uses with --log-file)
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Non-blocking console logger backed by spdlog's async thread pool
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_console_logger(
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192
);

}  // namespace meshgate
