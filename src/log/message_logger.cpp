#include "iflow/log/message_logger.hpp"
#include "iflow/log/logger.hpp"
#include "iflow/log/spdlog_logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>

#include <stdexcept>

namespace iflow {

namespace {

constexpr const char* kMessagePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

}  // namespace

tl::expected<std::unique_ptr<MessageLogger>, std::string> MessageLogger::create(const LoggingConfig& config) {
    std::shared_ptr<spdlog::logger> logger;
    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size, config.max_files);
        logger = std::make_shared<spdlog::logger>("iflow_messages", std::move(sink));
    } catch (const spdlog::spdlog_ex& e) {
        return tl::unexpected(std::string("Failed to open message log ") + config.log_file + ": " + e.what());
    }

    logger->set_pattern(kMessagePattern);
    logger->set_level(SpdlogLogger::to_spdlog_level(config.level));
    logger->flush_on(spdlog::level::info);
    return std::make_unique<MessageLogger>(std::move(logger));
}

MessageLogger::MessageLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("MessageLogger requires a non-null spdlog logger");
    }
}

void MessageLogger::log_event(const Event& event) {
    const auto level = is_error(event) ? spdlog::level::err : spdlog::level::info;
    if (logger_->should_log(level) == false) {
        return;
    }

    // Replace invalid UTF-8 instead of throwing on agent-supplied text
    logger_->log(level, to_json(event).dump(-1, ' ', false, Json::error_handler_t::replace));
    ++logged_count_;
}

void MessageLogger::flush() {
    logger_->flush();
}

}  // namespace iflow
