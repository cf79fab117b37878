/**
 * @file Task.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/Task.hpp>

// Standard Library Includes
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/Errors.hpp>
#include <automation/upload_scheduler/WallClock.hpp>

namespace automation::upload_scheduler
{
namespace
{
auto optional_string(const nlohmann::json& json, const char* key)
    -> std::string
{
    if (!json.contains(key) || json.at(key).is_null())
    {
        return {};
    }

    return json.at(key).get<std::string>();
}
} // namespace

auto Task::runs_on(std::chrono::weekday day) const -> bool
{
    return std::ranges::find(days, day) != days.end();
}

auto from_json(const nlohmann::json& json, Task& task) -> void
{
    task.name    = json.value("name", "Task");
    task.enabled = json.value("enabled", true);
    task.profile = optional_string(json, "profile");
    task.preset  = optional_string(json, "preset");
    task.hour    = json.value("hour", 0);
    task.minute  = json.value("minute", 0);
    task.dryRun  = json.value("dry_run", false);
    task.lastRun = optional_string(json, "last_run");

    if (task.hour < 0 || task.hour > 23)
    {
        throw configuration_error(
            fmt::format(
                "Task '{}' has an invalid hour {}! Expected 0-23",
                task.name,
                task.hour
            )
        );
    }

    if (task.minute < 0 || task.minute > 59)
    {
        throw configuration_error(
            fmt::format(
                "Task '{}' has an invalid minute {}! Expected 0-59",
                task.name,
                task.minute
            )
        );
    }

    task.days.clear();
    for (const std::string dayName : json.value("days", nlohmann::json::array()))
    {
        const auto day = parse_weekday(dayName);

        if (!day.has_value())
        {
            throw configuration_error(
                fmt::format("Task '{}' has an unknown day '{}'", task.name, dayName)
            );
        }

        if (!task.runs_on(*day))
        {
            task.days.emplace_back(*day);
        }
    }

    const std::string mode = json.value("mapping_mode", "enabled");

    if (mode == "enabled")
    {
        task.mappingMode = MappingMode::ENABLED;
    }
    else if (mode == "selected")
    {
        task.mappingMode = MappingMode::SELECTED;
    }
    else
    {
        throw configuration_error(
            fmt::format(
                "Task '{}' has an unknown mapping mode '{}'",
                task.name,
                mode
            )
        );
    }

    task.mappings = json.value("mappings", std::vector<std::string> {});

    if (!task.lastRun.empty() && !is_stamp_minute(task.lastRun))
    {
        throw configuration_error(
            fmt::format(
                "Task '{}' has a malformed last_run '{}'",
                task.name,
                task.lastRun
            )
        );
    }
}

auto to_json(nlohmann::json& json, const Task& task) -> void
{
    auto dayNames = nlohmann::json::array();
    for (const auto day : task.days)
    {
        dayNames.emplace_back(std::string(weekday_name(day)));
    }

    const std::string mode
        = (task.mappingMode == MappingMode::SELECTED) ? "selected" : "enabled";

    json = nlohmann::json {
        {         "name",      task.name },
        {      "enabled",   task.enabled },
        {      "profile",   task.profile },
        {       "preset",    task.preset },
        {         "days",       dayNames },
        {         "hour",      task.hour },
        {       "minute",    task.minute },
        {      "dry_run",    task.dryRun },
        { "mapping_mode",           mode },
        {     "mappings",  task.mappings },
        {     "last_run",   task.lastRun },
    };
}
} // namespace automation::upload_scheduler
