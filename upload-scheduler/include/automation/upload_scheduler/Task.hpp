/**
 * @file Task.hpp
 * @brief A weekly upload job bound to a profile, a preset and a mapping
 * selection
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace automation::upload_scheduler
{
enum class MappingMode : std::uint8_t
{
    ENABLED,
    SELECTED,
};

struct Task
{
    std::string                         name;
    bool                                enabled = true;
    std::string                         profile;
    std::string                         preset;
    std::vector<std::chrono::weekday>   days;
    int                                 hour    = 0;
    int                                 minute  = 0;
    bool                                dryRun  = false;
    MappingMode                         mappingMode = MappingMode::ENABLED;
    std::vector<std::string>            mappings;
    // "YYYY-MM-DD HH:MM" of the last successful firing, empty if never
    std::string                         lastRun;

    [[nodiscard]]
    auto runs_on(std::chrono::weekday day) const -> bool;
};

// Throws configuration_error naming the task when a field is out of range
auto from_json(const nlohmann::json& json, Task& task) -> void;
auto to_json(nlohmann::json& json, const Task& task) -> void;
} // namespace automation::upload_scheduler
