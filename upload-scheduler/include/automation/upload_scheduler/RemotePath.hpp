/**
 * @file RemotePath.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <string>
#include <string_view>

namespace automation::upload_scheduler
{
// Converts backslashes to slashes and strips leading slashes
[[nodiscard]]
auto normalize_remote(std::string_view path) -> std::string;

/**
 * @brief Joins a profile root and a mapping's remote path
 *
 * The result always has exactly one leading slash and never contains an
 * empty path segment, however the operator typed either half.
 *
 * @param root e.g. "/dayzstandalone/"
 * @param remotePath e.g. "\\configs\\loot.xml"
 *
 * @return e.g. "/dayzstandalone/configs/loot.xml"
 */
[[nodiscard]]
auto compose_remote_path(std::string_view root, std::string_view remotePath)
    -> std::string;
} // namespace automation::upload_scheduler
