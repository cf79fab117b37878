/**
 * @file ConfigStore.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/ConfigStore.hpp>

// Standard Library Includes
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/Errors.hpp>

namespace automation::upload_scheduler
{
namespace
{
auto entry_name(const nlohmann::json& entry, std::size_t index) -> std::string
{
    if (entry.is_object() && entry.contains("name") && entry.at("name").is_string())
    {
        return entry.at("name").get<std::string>();
    }

    return fmt::format("#{}", index + 1);
}
} // namespace

ConfigStore::ConfigStore(std::filesystem::path directory)
    : m_Directory(std::move(directory))
{
}

auto ConfigStore::load_json_config(const std::filesystem::path& file)
    -> nlohmann::json
{
    if (!std::filesystem::exists(file))
    {
        spdlog::warn(
            "Config file {} does not exist. Using defaults.",
            file.string()
        );
        return nlohmann::json::object();
    }

    std::ifstream configFile(file);

    if (!configFile.good())
    {
        std::string errorMessage(BUFSIZ, '\0');

        throw configuration_error(
            fmt::format(
                "Failed to load config file {}! OS Error: {}",
                file.filename().string(),
                // NOLINTNEXTLINE(*-include-cleaner)
                ::strerror_r(errno, errorMessage.data(), errorMessage.size())
            )
        );
    }

    try
    {
        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& pe)
    {
        throw configuration_error(
            fmt::format(
                "Config file {} is not valid JSON! {}",
                file.filename().string(),
                pe.what()
            )
        );
    }
}

auto ConfigStore::save_json_config(
    const std::filesystem::path& file,
    const nlohmann::json&        json
) -> void
{
    std::filesystem::create_directories(file.parent_path());

    // Written beside the target and renamed over it, so a crash mid-write
    // never leaves a truncated file behind
    auto temporaryFile = file;
    temporaryFile += ".tmp";

    {
        std::ofstream output(temporaryFile, std::ios::trunc);

        if (!output.good())
        {
            std::string errorMessage(BUFSIZ, '\0');

            throw std::runtime_error(
                fmt::format(
                    "Failed to open {} for writing! OS Error: {}",
                    temporaryFile.string(),
                    // NOLINTNEXTLINE(*-include-cleaner)
                    ::strerror_r(errno, errorMessage.data(), errorMessage.size())
                )
            );
        }

        constexpr int INDENT = 4;
        output << json.dump(INDENT) << '\n';
        output.flush();

        if (!output.good())
        {
            throw std::runtime_error(
                fmt::format("Failed to write {}", temporaryFile.string())
            );
        }
    }

    std::filesystem::rename(temporaryFile, file);
}

template <typename Record>
auto ConfigStore::load_records(const std::string& fileName, const std::string& key)
    const -> std::vector<Record>
{
    const auto json = ConfigStore::load_json_config(m_Directory / fileName);

    try
    {
        return json.value(key, nlohmann::json::array()).template get<std::vector<Record>>();
    }
    catch (const nlohmann::json::exception& je)
    {
        throw configuration_error(
            fmt::format("Malformed entry in {}! {}", fileName, je.what())
        );
    }
}

auto ConfigStore::load_settings() const -> Settings
{
    const auto json = ConfigStore::load_json_config(m_Directory / "settings.json");

    try
    {
        return json.value("app", nlohmann::json::object()).get<Settings>();
    }
    catch (const nlohmann::json::exception& je)
    {
        throw configuration_error(
            fmt::format("Malformed settings.json! {}", je.what())
        );
    }
}

auto ConfigStore::load_profiles() const -> std::vector<Profile>
{
    auto profiles = this->load_records<Profile>("profiles.json", "profiles");
    spdlog::debug("Loaded {} profiles", profiles.size());

    return profiles;
}

auto ConfigStore::load_mappings() const -> std::vector<Mapping>
{
    auto mappings = this->load_records<Mapping>("mappings.json", "mappings");
    spdlog::debug("Loaded {} mappings", mappings.size());

    return mappings;
}

auto ConfigStore::load_catalogue() const -> Catalogue
{
    return Catalogue { .profiles = this->load_profiles(),
                       .mappings = this->load_mappings() };
}

auto ConfigStore::load_tasks() -> std::vector<Task>
{
    const auto json = ConfigStore::load_json_config(m_Directory / "tasks.json");

    if (!json.is_object())
    {
        throw configuration_error("tasks.json must hold a JSON object!");
    }

    const auto entries = json.value("tasks", nlohmann::json::array());

    if (!entries.is_array())
    {
        throw configuration_error("\"tasks\" in tasks.json must be an array!");
    }

    std::vector<Task>           tasks;
    std::vector<nlohmann::json> unparsed;

    for (std::size_t index = 0; index < entries.size(); ++index)
    {
        const auto& entry = entries.at(index);

        try
        {
            tasks.emplace_back(entry.get<Task>());
            spdlog::trace("Loaded task {}", tasks.back().name);
        }
        catch (const configuration_error& ce)
        {
            spdlog::error("[TASK] Left out of scheduling! {}", ce.what());
            unparsed.emplace_back(entry);
        }
        catch (const nlohmann::json::exception& je)
        {
            spdlog::error(
                "[TASK] Left out of scheduling! Task '{}' is malformed: {}",
                entry_name(entry, index),
                je.what()
            );
            unparsed.emplace_back(entry);
        }
    }

    m_UnparsedTasks = std::move(unparsed);
    spdlog::debug(
        "Loaded {} tasks, {} left out",
        tasks.size(),
        m_UnparsedTasks.size()
    );

    return tasks;
}

auto ConfigStore::save_tasks(const std::vector<Task>& tasks) const -> void
{
    nlohmann::json records = tasks;

    // Entries that could not be parsed go back out untouched
    for (const auto& entry : m_UnparsedTasks)
    {
        records.push_back(entry);
    }

    ConfigStore::save_json_config(
        m_Directory / "tasks.json",
        nlohmann::json { { "tasks", records } }
    );
    spdlog::trace("Saved {} tasks", tasks.size());
}
} // namespace automation::upload_scheduler
