#pragma once

#include "iflow/config/options.hpp"
#include "iflow/protocol/events.hpp"

#include <tl/expected.hpp>

#include <spdlog/logger.h>

#include <memory>
#include <string>

namespace iflow {

// ─────────────────────────────────────────────────────────────────────────────
// MessageLogger - Size-rotated record of consumed events
// ─────────────────────────────────────────────────────────────────────────────
// One JSON object per line. Error events are written at error level, all
// others at info; LoggingConfig::level filters them.

class MessageLogger {
public:
    /// Opens (or creates) the log file; fails when the file cannot be opened.
    [[nodiscard]] static tl::expected<std::unique_ptr<MessageLogger>, std::string> create(const LoggingConfig& config);

    explicit MessageLogger(std::shared_ptr<spdlog::logger> logger);

    MessageLogger(const MessageLogger&) = delete;
    MessageLogger& operator=(const MessageLogger&) = delete;

    void log_event(const Event& event);

    void flush();

    [[nodiscard]] std::size_t logged_count() const noexcept {
        return logged_count_;
    }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::size_t logged_count_{0};
};

}  // namespace iflow
