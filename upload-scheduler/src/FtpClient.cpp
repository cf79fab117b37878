/**
 * @file FtpClient.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/FtpClient.hpp>

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

// Third Party Library Includes
#include <curl/curl.h>
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/Errors.hpp>
#include <automation/upload_scheduler/FtpUrl.hpp>
#include <automation/upload_scheduler/Profile.hpp>
#include <automation/upload_scheduler/TransferClient.hpp>

namespace automation::upload_scheduler
{
FtpClient::FtpClient(Profile profile, std::chrono::seconds timeout)
    : m_Profile(std::move(profile)),
      m_Timeout(timeout),
      m_Handle(nullptr),
      m_Connected(false),
      m_ErrorBuffer {}
{
}

FtpClient::~FtpClient()
{
    this->close();
}

auto FtpClient::make_factory() -> TransferClientFactory
{
    return [](const Profile& profile, std::chrono::seconds timeout)
               -> std::unique_ptr<TransferClient>
    { return std::make_unique<FtpClient>(profile, timeout); };
}

auto FtpClient::set_option(CURLoption option, auto value) -> void
{
    // NOLINTNEXTLINE(*-vararg)
    if (const CURLcode code = ::curl_easy_setopt(m_Handle, option, value);
        code != CURLE_OK)
    {
        throw connection_error(
            fmt::format(
                "curl_easy_setopt({}) failed: {}",
                static_cast<int>(option),
                ::curl_easy_strerror(code)
            )
        );
    }
}

auto FtpClient::prepare_handle(const std::string& remotePath, bool isDirectory)
    -> void
{
    if (m_Handle == nullptr)
    {
        m_Handle = ::curl_easy_init();

        if (m_Handle == nullptr)
        {
            throw connection_error("curl_easy_init() failed!");
        }
    }
    else
    {
        // Keeps the live control connection, drops the per-request options
        ::curl_easy_reset(m_Handle);
    }

    m_ErrorBuffer.fill('\0');

    const long timeoutSeconds = static_cast<long>(m_Timeout.count());

    this->set_option(CURLOPT_ERRORBUFFER, m_ErrorBuffer.data());
    this->set_option(
        CURLOPT_URL,
        compose_ftp_url(m_Profile.host, remotePath, isDirectory).c_str()
    );
    this->set_option(CURLOPT_PORT, static_cast<long>(m_Profile.port));
    this->set_option(CURLOPT_NOSIGNAL, 1L);
    this->set_option(CURLOPT_CONNECTTIMEOUT, timeoutSeconds);
    this->set_option(CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSeconds);
    this->set_option(CURLOPT_LOW_SPEED_TIME, timeoutSeconds);
    this->set_option(CURLOPT_LOW_SPEED_LIMIT, 1L);
    this->set_option(CURLOPT_TCP_KEEPALIVE, 1L);

    if (!m_Profile.username.empty())
    {
        this->set_option(CURLOPT_USERNAME, m_Profile.username.c_str());
        this->set_option(CURLOPT_PASSWORD, m_Profile.password.c_str());
    }

    if (m_Profile.tls)
    {
        // Explicit FTPS, control and data channel both protected
        this->set_option(CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        this->set_option(CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
        // Self-signed certificates are accepted
        this->set_option(CURLOPT_SSL_VERIFYPEER, 0L);
        this->set_option(CURLOPT_SSL_VERIFYHOST, 0L);
    }
}

auto FtpClient::perform() -> CURLcode
{
    return ::curl_easy_perform(m_Handle);
}

auto FtpClient::describe_failure(CURLcode code) const -> std::string
{
    long responseCode = 0;
    // NOLINTNEXTLINE(*-vararg)
    ::curl_easy_getinfo(m_Handle, CURLINFO_RESPONSE_CODE, &responseCode);

    const std::string detail = (m_ErrorBuffer.front() != '\0')
                                 ? std::string(m_ErrorBuffer.data())
                                 : std::string(::curl_easy_strerror(code));

    if (responseCode != 0)
    {
        return fmt::format("{} (FTP status {})", detail, responseCode);
    }

    return detail;
}

auto FtpClient::connect() -> void
{
    spdlog::debug(
        "Connecting to {}:{} as {} (TLS: {})",
        m_Profile.host,
        m_Profile.port,
        m_Profile.username.empty() ? "anonymous" : m_Profile.username,
        m_Profile.tls
    );

    this->prepare_handle("", true);
    this->set_option(CURLOPT_NOBODY, 1L);

    if (const CURLcode code = this->perform(); code != CURLE_OK)
    {
        const auto reason = this->describe_failure(code);
        this->close();

        throw connection_error(
            fmt::format(
                "Failed to connect to {}:{}! {}",
                m_Profile.host,
                m_Profile.port,
                reason
            )
        );
    }

    m_Connected = true;
    spdlog::debug("Connected to {}:{}", m_Profile.host, m_Profile.port);
}

auto FtpClient::close() noexcept -> void
{
    if (m_Handle != nullptr)
    {
        // Sends QUIT on the cached control connection
        ::curl_easy_cleanup(m_Handle);
        m_Handle = nullptr;
    }

    m_Connected = false;
}

auto FtpClient::upload(
    const std::filesystem::path& localPath,
    const std::string&           remotePath
) -> void
{
    if (!m_Connected)
    {
        throw transfer_error(
            fmt::format("Cannot upload {}: not connected", remotePath)
        );
    }

    std::ifstream localFile(localPath, std::ios::binary);

    if (!localFile.good())
    {
        throw transfer_error(
            fmt::format("Failed to open {} for reading", localPath.string())
        );
    }

    std::error_code errorCode;
    const auto      fileSize = std::filesystem::file_size(localPath, errorCode);

    if (errorCode)
    {
        throw transfer_error(
            fmt::format(
                "Failed to determine size of {}: {}",
                localPath.string(),
                errorCode.message()
            )
        );
    }

    this->prepare_handle(remotePath, false);
    this->set_option(CURLOPT_UPLOAD, 1L);
    this->set_option(CURLOPT_READFUNCTION, &FtpClient::on_bytes_requested);
    this->set_option(CURLOPT_READDATA, &localFile);
    this->set_option(
        CURLOPT_INFILESIZE_LARGE,
        static_cast<curl_off_t>(fileSize)
    );
    this->set_option(
        CURLOPT_FTP_CREATE_MISSING_DIRS,
        static_cast<long>(CURLFTP_CREATE_DIR_RETRY)
    );

    if (const CURLcode code = this->perform(); code != CURLE_OK)
    {
        throw transfer_error(
            fmt::format(
                "Failed to upload {} to {}! {}",
                localPath.string(),
                remotePath,
                this->describe_failure(code)
            )
        );
    }
}

auto FtpClient::download(
    const std::string&           remotePath,
    const std::filesystem::path& localPath
) -> bool
{
    if (!m_Connected)
    {
        spdlog::debug("Cannot download {}: not connected", remotePath);
        return false;
    }

    std::error_code errorCode;
    std::filesystem::create_directories(localPath.parent_path(), errorCode);

    if (errorCode)
    {
        spdlog::debug(
            "Failed to create {}: {}",
            localPath.parent_path().string(),
            errorCode.message()
        );
        return false;
    }

    CURLcode code = CURLE_OK;

    {
        std::ofstream localFile(localPath, std::ios::binary | std::ios::trunc);

        if (!localFile.good())
        {
            spdlog::debug("Failed to open {} for writing", localPath.string());
            return false;
        }

        try
        {
            this->prepare_handle(remotePath, false);
            this->set_option(
                CURLOPT_WRITEFUNCTION,
                &FtpClient::on_bytes_received
            );
            this->set_option(CURLOPT_WRITEDATA, &localFile);

            code = this->perform();
        }
        catch (const std::runtime_error& re)
        {
            spdlog::debug("Download of {} failed: {}", remotePath, re.what());
            code = CURLE_FAILED_INIT;
        }
    }

    if (code != CURLE_OK)
    {
        spdlog::debug(
            "Download of {} failed: {}",
            remotePath,
            this->describe_failure(code)
        );

        std::filesystem::remove(localPath, errorCode);
        return false;
    }

    return true;
}

auto FtpClient::current_remote_directory() -> std::string
{
    if (!m_Connected)
    {
        throw connection_error("Not connected");
    }

    const char* entryPath = nullptr;
    // NOLINTNEXTLINE(*-vararg)
    ::curl_easy_getinfo(m_Handle, CURLINFO_FTP_ENTRY_PATH, &entryPath);

    return (entryPath != nullptr) ? std::string(entryPath) : std::string("/");
}

auto FtpClient::on_bytes_received(
    char*       buffer,
    std::size_t size,
    std::size_t count,
    void*       userData
) -> std::size_t
{
    auto* stream = static_cast<std::ofstream*>(userData);

    stream->write(buffer, static_cast<std::streamsize>(size * count));

    // Anything short of the full block makes libcurl abort the transfer
    return stream->good() ? size * count : 0;
}

auto FtpClient::on_bytes_requested(
    char*       buffer,
    std::size_t size,
    std::size_t count,
    void*       userData
) -> std::size_t
{
    auto* stream = static_cast<std::ifstream*>(userData);

    stream->read(buffer, static_cast<std::streamsize>(size * count));

    if (stream->bad())
    {
        return CURL_READFUNC_ABORT;
    }

    return static_cast<std::size_t>(stream->gcount());
}

CurlGlobal::CurlGlobal()
{
    if (const CURLcode code = ::curl_global_init(CURL_GLOBAL_DEFAULT);
        code != CURLE_OK)
    {
        throw std::runtime_error(
            fmt::format(
                "curl_global_init() failed: {}",
                ::curl_easy_strerror(code)
            )
        );
    }
}

CurlGlobal::~CurlGlobal()
{
    ::curl_global_cleanup();
}
} // namespace automation::upload_scheduler
