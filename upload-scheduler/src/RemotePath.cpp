/**
 * @file RemotePath.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/RemotePath.hpp>

// Standard Library Includes
#include <algorithm>
#include <string>
#include <string_view>

namespace automation::upload_scheduler
{
auto normalize_remote(std::string_view path) -> std::string
{
    std::string normalized(path);
    std::ranges::replace(normalized, '\\', '/');

    const auto firstNonSlash = normalized.find_first_not_of('/');

    if (firstNonSlash == std::string::npos)
    {
        return {};
    }

    return normalized.substr(firstNonSlash);
}

auto compose_remote_path(std::string_view root, std::string_view remotePath)
    -> std::string
{
    const std::string joined
        = normalize_remote(root) + '/' + normalize_remote(remotePath);

    std::string composed = "/";

    for (const char character : joined)
    {
        if (character == '/' && composed.back() == '/')
        {
            continue;
        }

        composed += character;
    }

    if (composed.size() > 1 && composed.back() == '/')
    {
        composed.pop_back();
    }

    return composed;
}
} // namespace automation::upload_scheduler
