/**
 * @file Profile.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/Profile.hpp>

// Standard Library Includes
#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/Errors.hpp>

namespace automation::upload_scheduler
{
auto from_json(const nlohmann::json& json, Profile& profile) -> void
{
    profile.name     = json.value("name", "Unnamed");
    profile.host     = json.value("host", "");
    profile.username = json.value("username", "");
    profile.password = json.value("password", "");
    profile.tls      = json.value("tls", false);
    profile.root     = json.value("root", "/dayzstandalone");

    const int port = json.value("port", 21);

    if (port <= 0 || port > std::numeric_limits<std::uint16_t>::max())
    {
        throw configuration_error(
            fmt::format("Profile '{}' has an invalid port {}", profile.name, port)
        );
    }

    profile.port = static_cast<std::uint16_t>(port);
}

auto to_json(nlohmann::json& json, const Profile& profile) -> void
{
    json = nlohmann::json {
        {     "name",     profile.name },
        {     "host",     profile.host },
        {     "port",     profile.port },
        { "username", profile.username },
        { "password", profile.password },
        {      "tls",      profile.tls },
        {     "root",     profile.root },
    };
}

auto find_profile(const std::vector<Profile>& profiles, std::string_view name)
    -> std::optional<Profile>
{
    const auto found = std::ranges::find(profiles, name, &Profile::name);

    if (found == profiles.end())
    {
        return std::nullopt;
    }

    return *found;
}
} // namespace automation::upload_scheduler
