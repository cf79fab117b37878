/**
 * @file Logging.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <filesystem>

// Project Includes
#include <automation/upload_scheduler/WallClock.hpp>

namespace automation::upload_scheduler
{
/**
 * @brief Installs the default logger: colored console plus
 * `<logsDirectory>/scheduler_<YYYYmmdd_HHMMSS>.log`
 *
 * The log file is the operator's audit trail of every trigger, skip,
 * backup and upload.
 */
auto init_logging(const std::filesystem::path& logsDirectory, LocalTime startedAt)
    -> void;
} // namespace automation::upload_scheduler
