#pragma once

#include "wirelink/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace wirelink {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Install it process-wide with set_logger(), or hand a shared instance to a
// ListenerConfig / ConnectionOptions to route one component's output to its
// own sinks.

class SpdlogLogger final : public ILogger {
public:
    /// Colored stdout sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger (level taken from it)
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Basic file sink
    SpdlogLogger(const std::string& filename, LogLevel min_level);

    /// Arbitrary sinks
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

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

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console and file at once
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace wirelink
