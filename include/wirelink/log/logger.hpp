#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace wirelink {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-read / per-frame detail
    Debug = 1,  // Connection state transitions
    Info  = 2,  // Listening, accepted, closed
    Warn  = 3,  // Recoverable issues (accept errors, failed handshakes)
    Error = 4,  // Latched transport / decompression errors
    Fatal = 5,
    Off   = 6
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

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - the logger capability injected into connections and listeners
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Lets callers skip building expensive messages
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Fatal, msg, loc);
    }

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
    void emit(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - Plain text to stderr, optionally colored
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
// TaggedLogger - Prefixes every message with an owner tag
// ─────────────────────────────────────────────────────────────────────────────
// Connections and listeners log through one of these so that lines read
// "Connection_127.0.0.1:50432: read 4 bytes". The target is either the
// injected per-instance logger or, when none was given, the process-wide
// default returned by get_logger() at the time of each call.

class TaggedLogger final : public ILogger {
public:
    TaggedLogger(std::string tag, std::shared_ptr<ILogger> target)
        : tag_(std::move(tag))
        , target_(std::move(target))
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_tag(std::string tag) {
        tag_ = std::move(tag);
    }

    [[nodiscard]] const std::string& tag() const noexcept {
        return tag_;
    }

private:
    [[nodiscard]] ILogger& target() const noexcept;

    std::string tag_;
    std::shared_ptr<ILogger> target_;  // null = process-wide default
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide default logger
// ─────────────────────────────────────────────────────────────────────────────
// Used by every component that was not given its own logger. The default is a
// ConsoleLogger at Warn level; pass nullptr to set_logger() to restore it.

[[nodiscard]] ILogger& get_logger() noexcept;

void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define WIRELINK_LOG_TRACE(msg) \
    do { if (::wirelink::get_logger().should_log(::wirelink::LogLevel::Trace)) \
         ::wirelink::get_logger().trace(msg); } while(false)

#define WIRELINK_LOG_DEBUG(msg) \
    do { if (::wirelink::get_logger().should_log(::wirelink::LogLevel::Debug)) \
         ::wirelink::get_logger().debug(msg); } while(false)

#define WIRELINK_LOG_INFO(msg) \
    do { if (::wirelink::get_logger().should_log(::wirelink::LogLevel::Info)) \
         ::wirelink::get_logger().info(msg); } while(false)

#define WIRELINK_LOG_WARN(msg) \
    do { if (::wirelink::get_logger().should_log(::wirelink::LogLevel::Warn)) \
         ::wirelink::get_logger().warn(msg); } while(false)

#define WIRELINK_LOG_ERROR(msg) \
    do { if (::wirelink::get_logger().should_log(::wirelink::LogLevel::Error)) \
         ::wirelink::get_logger().error(msg); } while(false)

}  // namespace wirelink
