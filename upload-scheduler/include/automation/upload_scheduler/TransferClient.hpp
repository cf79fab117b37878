/**
 * @file TransferClient.hpp
 * @brief The transport capability the task runner depends on
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

// Project Includes
#include <automation/upload_scheduler/Profile.hpp>

namespace automation::upload_scheduler
{
class TransferClient
{
  public: // Constructors
    TransferClient() = default;
    TransferClient(TransferClient&) = delete;
    TransferClient(TransferClient&&) = delete;
    auto operator=(TransferClient&) -> TransferClient = delete;
    auto operator=(TransferClient&&) -> TransferClient = delete;

    virtual ~TransferClient() = default;

  public: // Methods
    // Throws connection_error
    virtual auto connect() -> void = 0;

    // Idempotent. Never throws.
    virtual auto close() noexcept -> void = 0;

    // Throws transfer_error
    virtual auto upload(
        const std::filesystem::path& localPath,
        const std::string&           remotePath
    ) -> void = 0;

    // Returns false instead of throwing; leaves no partial file behind
    [[nodiscard]]
    virtual auto download(
        const std::string&           remotePath,
        const std::filesystem::path& localPath
    ) -> bool = 0;

    [[nodiscard]]
    virtual auto current_remote_directory() -> std::string = 0;
};

/**
 * @brief Holds one connection open for the duration of a task
 *
 * Connects on construction and closes on destruction, so the connection is
 * released on every exit path including a throwing upload.
 */
class ScopedConnection
{
  public: // Constructors
    explicit ScopedConnection(TransferClient& client);
    ScopedConnection(ScopedConnection&) = delete;
    ScopedConnection(ScopedConnection&&) = delete;
    auto operator=(ScopedConnection&) -> ScopedConnection = delete;
    auto operator=(ScopedConnection&&) -> ScopedConnection = delete;

    ~ScopedConnection();

  private: // Members
    TransferClient& m_Client;
};

using TransferClientFactory
    = std::function<std::unique_ptr<TransferClient>(
        const Profile&,
        std::chrono::seconds
    )>;
} // namespace automation::upload_scheduler
