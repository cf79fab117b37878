/**
 * @file FtpUrl.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/FtpUrl.hpp>

// Standard Library Includes
#include <cstddef>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <curl/curl.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/Errors.hpp>

namespace automation::upload_scheduler
{
namespace
{
auto escape_segment(std::string_view segment) -> std::string
{
    // The handle argument is ignored by libcurl
    char* escaped = ::curl_easy_escape(
        nullptr,
        segment.data(),
        static_cast<int>(segment.size())
    );

    if (escaped == nullptr)
    {
        throw transfer_error(
            fmt::format("Failed to escape path segment {}", segment)
        );
    }

    std::string result(escaped);
    ::curl_free(escaped);

    return result;
}
} // namespace

auto compose_ftp_url(
    std::string_view host,
    std::string_view remotePath,
    bool             isDirectory
) -> std::string
{
    std::string escapedPath;
    std::size_t segmentStart = 0;

    // Segments are escaped one by one, the separators are kept
    while (segmentStart <= remotePath.size())
    {
        auto segmentEnd = remotePath.find('/', segmentStart);
        if (segmentEnd == std::string_view::npos)
        {
            segmentEnd = remotePath.size();
        }

        const auto segment
            = remotePath.substr(segmentStart, segmentEnd - segmentStart);

        if (!segment.empty())
        {
            if (!escapedPath.empty())
            {
                escapedPath += '/';
            }
            escapedPath += escape_segment(segment);
        }

        segmentStart = segmentEnd + 1;
    }

    const bool isIpv6Literal = host.find(':') != std::string_view::npos
                            && !host.starts_with('[');

    std::string url = isIpv6Literal
                        ? fmt::format("ftp://[{}]//{}", host, escapedPath)
                        : fmt::format("ftp://{}//{}", host, escapedPath);

    if (isDirectory && !url.ends_with('/'))
    {
        url += '/';
    }

    return url;
}
} // namespace automation::upload_scheduler
