/**
 * @file WallClock.hpp
 * @brief Local wall-clock helpers. Schedules are expressed in the operator's
 * local time, never in UTC.
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace automation::upload_scheduler
{
using LocalTime = std::chrono::local_seconds;

[[nodiscard]]
auto current_local_time() -> LocalTime;

[[nodiscard]]
auto make_local_time(
    const std::chrono::year_month_day& date,
    int                                hour,
    int                                minute,
    int                                second = 0
) -> LocalTime;

/**
 * @brief The de-duplication key of a task firing
 *
 * @return `now` truncated to the minute, formatted as "YYYY-MM-DD HH:MM"
 */
[[nodiscard]]
auto format_stamp_minute(LocalTime now) -> std::string;

// "YYYYmmdd_HHMMSS", used for backup folders and log file names
[[nodiscard]]
auto format_run_stamp(LocalTime now) -> std::string;

[[nodiscard]]
auto is_stamp_minute(std::string_view stamp) -> bool;

[[nodiscard]]
auto weekday_name(std::chrono::weekday day) -> std::string_view;

[[nodiscard]]
auto parse_weekday(std::string_view name) -> std::optional<std::chrono::weekday>;
} // namespace automation::upload_scheduler
