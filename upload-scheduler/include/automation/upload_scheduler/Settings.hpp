/**
 * @file Settings.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <filesystem>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace automation::upload_scheduler
{
struct Settings
{
    std::chrono::seconds  transferTimeout { 20 };
    // Triggers match on the exact minute, so anything >= 60s can miss one
    std::chrono::seconds  tickInterval { 20 };
    std::filesystem::path presetsDirectory { "presets" };
    std::filesystem::path logsDirectory { "logs" };
    bool                  autoStart   = false;
    bool                  forceDryRun = false;
};

// Reads the "app" block of settings.json
auto from_json(const nlohmann::json& json, Settings& settings) -> void;
} // namespace automation::upload_scheduler
