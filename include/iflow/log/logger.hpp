#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace iflow {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Raw frames
    Debug = 1,  // Control tokens, ignored chatter, poll timeouts
    Info  = 2,  // Lifecycle: process start/stop, handshake progress
    Warn  = 3,  // Recoverable: send retries, auth method mismatch
    Error = 4,  // Operation failed
    Fatal = 5,  // Unrecoverable
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

/// Case-insensitive; accepts "warning" as an alias of "warn".
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
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
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
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
// stdout is left alone: in stdio mode it may carry agent traffic.

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

/// The process-wide logger (a NullLogger until set_logger() is called)
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the process-wide logger; nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// These check should_log() before evaluating `msg`, so std::format arguments
// cost nothing when the level is disabled.

#define IFLOW_LOG_TRACE(msg) \
    do { if (::iflow::get_logger().should_log(::iflow::LogLevel::Trace)) \
         ::iflow::get_logger().trace(msg); } while(false)

#define IFLOW_LOG_DEBUG(msg) \
    do { if (::iflow::get_logger().should_log(::iflow::LogLevel::Debug)) \
         ::iflow::get_logger().debug(msg); } while(false)

#define IFLOW_LOG_INFO(msg) \
    do { if (::iflow::get_logger().should_log(::iflow::LogLevel::Info)) \
         ::iflow::get_logger().info(msg); } while(false)

#define IFLOW_LOG_WARN(msg) \
    do { if (::iflow::get_logger().should_log(::iflow::LogLevel::Warn)) \
         ::iflow::get_logger().warn(msg); } while(false)

#define IFLOW_LOG_ERROR(msg) \
    do { if (::iflow::get_logger().should_log(::iflow::LogLevel::Error)) \
         ::iflow::get_logger().error(msg); } while(false)

#define IFLOW_LOG_FATAL(msg) \
    do { if (::iflow::get_logger().should_log(::iflow::LogLevel::Fatal)) \
         ::iflow::get_logger().fatal(msg); } while(false)

}  // namespace iflow
