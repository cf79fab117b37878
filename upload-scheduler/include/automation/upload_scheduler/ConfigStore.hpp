/**
 * @file ConfigStore.hpp
 * @brief Reads and writes the JSON files in the configuration directory
 */

#pragma once

// Standard Library Includes
#include <filesystem>
#include <string>
#include <vector>

// Third Party Library Includes
#include <nlohmann/json.hpp>

// Project Includes
#include <automation/upload_scheduler/Catalogue.hpp>
#include <automation/upload_scheduler/Mapping.hpp>
#include <automation/upload_scheduler/Profile.hpp>
#include <automation/upload_scheduler/Settings.hpp>
#include <automation/upload_scheduler/Task.hpp>

namespace automation::upload_scheduler
{
class ConfigStore
{
  public: // Constructors
    explicit ConfigStore(std::filesystem::path directory);

  public: // Methods
    [[nodiscard]]
    auto load_settings() const -> Settings;

    [[nodiscard]]
    auto load_profiles() const -> std::vector<Profile>;

    [[nodiscard]]
    auto load_mappings() const -> std::vector<Mapping>;

    [[nodiscard]]
    auto load_catalogue() const -> Catalogue;

    /**
     * @brief Loads tasks.json entry by entry
     *
     * An entry that fails to parse is logged and left out of the result. Its
     * raw JSON is kept and written back by save_tasks().
     */
    [[nodiscard]]
    auto load_tasks() -> std::vector<Task>;

    auto save_tasks(const std::vector<Task>& tasks) const -> void;

    [[nodiscard]]
    auto get_directory() const -> const std::filesystem::path&
    {
        return m_Directory;
    }

  private: // Methods
    template <typename Record>
    auto load_records(const std::string& fileName, const std::string& key)
        const -> std::vector<Record>;

  private: // Static Methods
    static auto load_json_config(const std::filesystem::path& file)
        -> nlohmann::json;
    static auto save_json_config(
        const std::filesystem::path& file,
        const nlohmann::json&        json
    ) -> void;

  private: // Members
    std::filesystem::path       m_Directory;
    std::vector<nlohmann::json> m_UnparsedTasks;
};
} // namespace automation::upload_scheduler
