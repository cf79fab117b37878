/**
 * @file FtpClient.hpp
 * @brief libcurl backed FTP/FTPS transfer client
 */

#pragma once

// Standard Library Includes
#include <array>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

// Third Party Library Includes
#include <curl/curl.h>

// Project Includes
#include <automation/upload_scheduler/Profile.hpp>
#include <automation/upload_scheduler/TransferClient.hpp>

namespace automation::upload_scheduler
{
class FtpClient : public TransferClient
{
  public: // Constructors
    FtpClient(Profile profile, std::chrono::seconds timeout);
    FtpClient(FtpClient&) = delete;
    FtpClient(FtpClient&&) = delete;
    auto operator=(FtpClient&) -> FtpClient = delete;
    auto operator=(FtpClient&&) -> FtpClient = delete;

    ~FtpClient() override;

  public: // Methods
    auto connect() -> void override;
    auto close() noexcept -> void override;

    auto upload(
        const std::filesystem::path& localPath,
        const std::string&           remotePath
    ) -> void override;

    [[nodiscard]]
    auto download(
        const std::string&           remotePath,
        const std::filesystem::path& localPath
    ) -> bool override;

    [[nodiscard]]
    auto current_remote_directory() -> std::string override;

  public: // Static Methods
    [[nodiscard]]
    static auto make_factory() -> TransferClientFactory;

    /**
     * @brief CURLOPT_WRITEFUNCTION writing into the std::ofstream in userData
     *
     * Returns 0 once the stream fails, which aborts the transfer.
     */
    static auto on_bytes_received(
        char*       buffer,
        std::size_t size,
        std::size_t count,
        void*       userData
    ) -> std::size_t;

    /**
     * @brief CURLOPT_READFUNCTION reading from the std::ifstream in userData
     */
    static auto on_bytes_requested(
        char*       buffer,
        std::size_t size,
        std::size_t count,
        void*       userData
    ) -> std::size_t;

  private: // Methods
    auto prepare_handle(const std::string& remotePath, bool isDirectory)
        -> void;
    auto set_option(CURLoption option, auto value) -> void;
    [[nodiscard]]
    auto perform() -> CURLcode;
    [[nodiscard]]
    auto describe_failure(CURLcode code) const -> std::string;

  private: // Members
    Profile                              m_Profile;
    std::chrono::seconds                 m_Timeout;
    CURL*                                m_Handle;
    bool                                 m_Connected;
    std::array<char, CURL_ERROR_SIZE>    m_ErrorBuffer;
};

/**
 * @brief Owns libcurl's process wide state for the lifetime of the program
 */
class CurlGlobal
{
  public: // Constructors
    CurlGlobal();
    CurlGlobal(CurlGlobal&) = delete;
    CurlGlobal(CurlGlobal&&) = delete;
    auto operator=(CurlGlobal&) -> CurlGlobal = delete;
    auto operator=(CurlGlobal&&) -> CurlGlobal = delete;

    ~CurlGlobal();
};
} // namespace automation::upload_scheduler
