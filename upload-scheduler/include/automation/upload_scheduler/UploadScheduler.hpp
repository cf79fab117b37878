/**
 * @file UploadScheduler.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <expected>
#include <filesystem>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

// Project Includes
#include <automation/upload_scheduler/Catalogue.hpp>
#include <automation/upload_scheduler/ConfigStore.hpp>
#include <automation/upload_scheduler/ControlRequest.hpp>
#include <automation/upload_scheduler/Scheduler.hpp>
#include <automation/upload_scheduler/Settings.hpp>
#include <automation/upload_scheduler/TaskRunner.hpp>
#include <automation/upload_scheduler/TaskStore.hpp>
#include <automation/upload_scheduler/TransferClient.hpp>
#include <automation/upload_scheduler/WallClock.hpp>

namespace automation::upload_scheduler
{
class UploadScheduler
{
  public: // Constructors
    UploadScheduler(
        ConfigStore           configStore,
        Settings              settings,
        TransferClientFactory clientFactory,
        TaskRunner::Clock     clock = current_local_time
    );
    UploadScheduler(UploadScheduler&) = delete;
    UploadScheduler(UploadScheduler&&) = delete;
    auto operator=(UploadScheduler&) -> UploadScheduler = delete;
    auto operator=(UploadScheduler&&) -> UploadScheduler = delete;

  public: // Methods
    auto run(const std::stop_token& stopToken) -> void;

    auto start_scheduler() -> void;
    auto stop_scheduler() -> void;
    auto tick(LocalTime now) -> void;

    // Runs a task regardless of its schedule. Does not touch last_run.
    auto run_task_now(std::string_view taskName) -> bool;

    [[nodiscard]]
    auto test_connection(std::string_view profileName)
        -> std::expected<std::string, std::string>;

    auto reload() -> bool;

    [[nodiscard]]
    auto status() -> std::string;

    // Returns the reply sent back over the control socket
    [[nodiscard]]
    auto handle_request(std::string_view message) -> std::string;

  private: // Methods
    auto control_loop(const std::stop_token& stopToken) -> void;

  private: // Members
    ConfigStore           m_ConfigStore;
    Settings              m_Settings;
    TransferClientFactory m_ClientFactory;
    Catalogue             m_Catalogue;
    TaskStore             m_TaskStore;
    TaskRunner            m_TaskRunner;
    Scheduler             m_Scheduler;
    std::mutex            m_TickMutex;
    std::jthread          m_ControlThread;
};
} // namespace automation::upload_scheduler
