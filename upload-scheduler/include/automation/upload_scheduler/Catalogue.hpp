/**
 * @file Catalogue.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <vector>

// Project Includes
#include <automation/upload_scheduler/Mapping.hpp>
#include <automation/upload_scheduler/Profile.hpp>

namespace automation::upload_scheduler
{
// Read-only during a run, replaced wholesale on reload
struct Catalogue
{
    std::vector<Profile> profiles;
    std::vector<Mapping> mappings;
};
} // namespace automation::upload_scheduler
