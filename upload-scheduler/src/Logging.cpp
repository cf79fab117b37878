/**
 * @file Logging.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/Logging.hpp>

// Standard Library Includes
#include <filesystem>
#include <memory>
#include <string>

// Third Party Library Includes
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/WallClock.hpp>

namespace automation::upload_scheduler
{
auto init_logging(const std::filesystem::path& logsDirectory, LocalTime startedAt)
    -> void
{
    std::filesystem::create_directories(logsDirectory);

    const auto logFile
        = logsDirectory
        / fmt::format("scheduler_{}.log", format_run_stamp(startedAt));

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink    = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        logFile.string()
    );

    auto logger = std::make_shared<spdlog::logger>(
        "upload-scheduler",
        spdlog::sinks_init_list { consoleSink, fileSink }
    );

    // Levels are written out in full so the file reads as an audit trail
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
    spdlog::info("Logging to {}", logFile.string());
}
} // namespace automation::upload_scheduler
