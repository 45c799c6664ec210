#include "iflow/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace iflow {

namespace {

constexpr std::string_view kReset   = "\033[0m";
constexpr std::string_view kGray    = "\033[90m";
constexpr std::string_view kCyan    = "\033[36m";
constexpr std::string_view kGreen   = "\033[32m";
constexpr std::string_view kYellow  = "\033[33m";
constexpr std::string_view kRed     = "\033[31m";
constexpr std::string_view kMagenta = "\033[35m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return kGray;
        case LogLevel::Debug: return kCyan;
        case LogLevel::Info:  return kGreen;
        case LogLevel::Warn:  return kYellow;
        case LogLevel::Error: return kRed;
        case LogLevel::Fatal: return kMagenta;
        case LogLevel::Off:   return kReset;
    }
    return kReset;
}

[[nodiscard]] std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    const std::string_view sv(path);
    const auto last_slash = sv.find_last_of('/');
    return (last_slash == std::string_view::npos) ? sv : sv.substr(last_slash + 1);
}

}  // namespace

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if ((lowered == "warn") || (lowered == "warning")) return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal") return LogLevel::Fatal;
    if (lowered == "off") return LogLevel::Off;
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    std::ostringstream oss;
    const bool use_colors = colors_enabled_;

    if (use_colors) {
        oss << kGray << format_timestamp(record.timestamp) << kReset
            << ' ' << level_color(record.level);
    } else {
        oss << format_timestamp(record.timestamp) << ' ';
    }
    oss << std::setw(5) << std::left << to_string(record.level);
    if (use_colors) {
        oss << kReset << ' ' << kGray;
    } else {
        oss << ' ';
    }
    oss << basename_of(record.location.file_name()) << ':' << record.location.line();
    if (use_colors) {
        oss << kReset;
    }
    oss << ' ' << record.message << '\n';

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Singleton
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger != nullptr) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace iflow
