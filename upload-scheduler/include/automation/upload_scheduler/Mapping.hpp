/**
 * @file Mapping.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace automation::upload_scheduler
{
struct Mapping
{
    std::string name;
    bool        enabled = true;
    std::string localRelativePath;
    std::string remotePath;
    bool        backupBeforeOverwrite = true;
};

auto from_json(const nlohmann::json& json, Mapping& mapping) -> void;
auto to_json(nlohmann::json& json, const Mapping& mapping) -> void;
} // namespace automation::upload_scheduler
