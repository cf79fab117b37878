/**
 * @file MappingResolver.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/MappingResolver.hpp>

// Standard Library Includes
#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

// Project Includes
#include <automation/upload_scheduler/Mapping.hpp>
#include <automation/upload_scheduler/Task.hpp>

namespace automation::upload_scheduler
{
auto resolve_mappings(
    MappingMode                     mode,
    const std::vector<std::string>& selectedNames,
    const std::vector<Mapping>&     allMappings
) -> std::vector<Mapping>
{
    std::vector<Mapping> resolved;

    if (mode == MappingMode::SELECTED)
    {
        std::ranges::copy_if(
            allMappings,
            std::back_inserter(resolved),
            [&selectedNames](const Mapping& mapping) -> bool
            { return std::ranges::find(selectedNames, mapping.name) != selectedNames.end(); }
        );
    }
    else
    {
        std::ranges::copy_if(
            allMappings,
            std::back_inserter(resolved),
            &Mapping::enabled
        );
    }

    return resolved;
}
} // namespace automation::upload_scheduler
