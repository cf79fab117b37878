/**
 * @file FtpUrl.hpp
 * @brief Builds the libcurl URL for a path on an FTP server
 */

#pragma once

// Standard Library Includes
#include <string>
#include <string_view>

namespace automation::upload_scheduler
{
/**
 * @brief Produces `ftp://host//segment/segment` with every segment escaped
 *
 * The double slash makes libcurl start from `CWD /` instead of the login
 * directory. Directory URLs end in `/`. IPv6 literals are bracketed.
 */
[[nodiscard]]
auto compose_ftp_url(
    std::string_view host,
    std::string_view remotePath,
    bool             isDirectory
) -> std::string;
} // namespace automation::upload_scheduler
