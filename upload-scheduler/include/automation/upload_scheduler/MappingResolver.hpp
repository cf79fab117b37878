/**
 * @file MappingResolver.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <string>
#include <vector>

// Project Includes
#include <automation/upload_scheduler/Mapping.hpp>
#include <automation/upload_scheduler/Task.hpp>

namespace automation::upload_scheduler
{
/**
 * @brief Resolves the mappings a task transfers
 *
 * ENABLED selects every mapping whose `enabled` flag is set. SELECTED selects
 * the mappings named in `selectedNames`; names without a mapping are dropped.
 * Either way the result keeps the order of `allMappings`.
 *
 * @return The ordered mapping list. Empty means there is nothing to run and
 * the caller must treat the run as failed.
 */
[[nodiscard]]
auto resolve_mappings(
    MappingMode                     mode,
    const std::vector<std::string>& selectedNames,
    const std::vector<Mapping>&     allMappings
) -> std::vector<Mapping>;
} // namespace automation::upload_scheduler
