/**
 * @file Mapping.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/Mapping.hpp>

// Third Party Library Includes
#include <nlohmann/json.hpp>

namespace automation::upload_scheduler
{
auto from_json(const nlohmann::json& json, Mapping& mapping) -> void
{
    mapping.name                  = json.value("name", "Unnamed Mapping");
    mapping.enabled               = json.value("enabled", true);
    mapping.localRelativePath     = json.value("local_relpath", "");
    mapping.remotePath            = json.value("remote_path", "");
    mapping.backupBeforeOverwrite = json.value("backup_before_overwrite", true);
}

auto to_json(nlohmann::json& json, const Mapping& mapping) -> void
{
    json = nlohmann::json {
        {                    "name",                  mapping.name },
        {                 "enabled",               mapping.enabled },
        {           "local_relpath",     mapping.localRelativePath },
        {             "remote_path",            mapping.remotePath },
        { "backup_before_overwrite", mapping.backupBeforeOverwrite },
    };
}
} // namespace automation::upload_scheduler
