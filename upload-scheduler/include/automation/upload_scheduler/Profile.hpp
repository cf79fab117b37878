/**
 * @file Profile.hpp
 * @brief A remote endpoint and the credentials used to reach it
 */

#pragma once

// Standard Library Includes
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace automation::upload_scheduler
{
struct Profile
{
    std::string   name;
    std::string   host;
    std::uint16_t port = 21;
    std::string   username;
    std::string   password;
    bool          tls  = false;
    std::string   root = "/dayzstandalone";
};

auto from_json(const nlohmann::json& json, Profile& profile) -> void;
auto to_json(nlohmann::json& json, const Profile& profile) -> void;

// Profiles are referenced by name and may dangle
[[nodiscard]]
auto find_profile(const std::vector<Profile>& profiles, std::string_view name)
    -> std::optional<Profile>;
} // namespace automation::upload_scheduler
