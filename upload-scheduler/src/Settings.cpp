/**
 * @file Settings.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/Settings.hpp>

// Standard Library Includes
#include <chrono>
#include <string>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/Errors.hpp>

namespace automation::upload_scheduler
{
auto from_json(const nlohmann::json& json, Settings& settings) -> void
{
    const int timeoutSeconds = json.value("timeout_seconds", 20);
    const int tickSeconds    = json.value("tick_seconds", 20);

    if (timeoutSeconds <= 0)
    {
        throw configuration_error(
            fmt::format(
                "timeout_seconds must be positive, got {}",
                timeoutSeconds
            )
        );
    }

    if (tickSeconds <= 0)
    {
        throw configuration_error(
            fmt::format("tick_seconds must be positive, got {}", tickSeconds)
        );
    }

    settings.transferTimeout  = std::chrono::seconds(timeoutSeconds);
    settings.tickInterval     = std::chrono::seconds(tickSeconds);
    settings.presetsDirectory = json.value("presets_dir", std::string("presets"));
    settings.logsDirectory    = json.value("logs_dir", std::string("logs"));
    settings.autoStart        = json.value("auto_start", false);
}
} // namespace automation::upload_scheduler
