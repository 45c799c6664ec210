// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "iflow/log/logger.hpp"
#include "iflow/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace iflow;

namespace {

std::filesystem::path temp_log_path(const std::string& name) {
    auto path = std::filesystem::temp_directory_path() / ("iflowpp_" + name);
    std::filesystem::remove(path);
    return path;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger console factory honors the minimum level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);
    REQUIRE(logger != nullptr);

    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    logger->set_level(LogLevel::Debug);
    REQUIRE(logger->should_log(LogLevel::Debug));
}

TEST_CASE("SpdlogLogger level mapping round-trips", "[log][spdlog]") {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warn, LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// Sinks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger writes through caller-supplied sinks", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);

    SpdlogLogger logger({sink}, LogLevel::Info);
    logger.set_pattern("%l|%v");

    logger.debug("hidden");
    logger.info("session created");
    logger.fatal("agent vanished");
    logger.flush();

    const auto text = out.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("info|session created") != std::string::npos);
    REQUIRE(text.find("critical|agent vanished") != std::string::npos);
}

TEST_CASE("SpdlogLogger file factory writes filtered records", "[log][spdlog][file]") {
    const auto path = temp_log_path("file.log");

    {
        auto logger = make_spdlog_file_logger(path.string(), LogLevel::Warn);
        logger->info("This should not appear");
        logger->warn("This should appear");
        logger->flush();
    }

    const auto content = read_file(path);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("This should appear") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("SpdlogLogger rotating factory creates the base file", "[log][spdlog][file]") {
    const auto path = temp_log_path("rotating.log");

    {
        auto logger = make_spdlog_rotating_logger(path.string(), 64 * 1024, 2, LogLevel::Info);
        logger->info("rotated record");
        logger->flush();
    }

    REQUIRE(std::filesystem::exists(path));
    REQUIRE(read_file(path).find("rotated record") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("SpdlogLogger console+file factory mirrors to the file", "[log][spdlog][file]") {
    const auto path = temp_log_path("console_file.log");

    {
        auto logger = make_spdlog_console_file_logger(path.string(), LogLevel::Error);
        logger->error("mirrored");
        logger->flush();
    }

    REQUIRE(read_file(path).find("mirrored") != std::string::npos);
    std::filesystem::remove(path);
}

// ═══════════════════════════════════════════════════════════════════════════
// Global logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger serves IFLOW_LOG macros as the global logger", "[log][spdlog][integration]") {
    const auto path = temp_log_path("global.log");

    {
        auto logger = make_spdlog_file_logger(path.string(), LogLevel::Info);
        auto* raw = logger.get();
        set_logger(std::move(logger));

        IFLOW_LOG_INFO("Global logger test");
        raw->flush();
        set_logger(nullptr);
    }

    REQUIRE(read_file(path).find("Global logger test") != std::string::npos);
    std::filesystem::remove(path);
}
