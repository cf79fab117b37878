/**
 * @file TaskRunner.hpp
 * @brief Executes a single task: validation, optional backup, upload
 */

#pragma once

// Standard Library Includes
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

// Project Includes
#include <automation/upload_scheduler/Catalogue.hpp>
#include <automation/upload_scheduler/Errors.hpp>
#include <automation/upload_scheduler/Mapping.hpp>
#include <automation/upload_scheduler/Profile.hpp>
#include <automation/upload_scheduler/Settings.hpp>
#include <automation/upload_scheduler/Task.hpp>
#include <automation/upload_scheduler/TransferClient.hpp>
#include <automation/upload_scheduler/WallClock.hpp>

namespace automation::upload_scheduler
{
struct PlannedTransfer
{
    Mapping               mapping;
    std::filesystem::path localPath;
    std::string           remotePath;
};

struct RunPlan
{
    Profile                      profile;
    std::filesystem::path        presetDirectory;
    std::vector<PlannedTransfer> transfers;
};

class TaskRunner
{
  public: // Types
    using Clock = std::function<LocalTime()>;

  public: // Constructors
    TaskRunner(
        const Settings&       settings,
        TransferClientFactory clientFactory,
        Clock                 clock = current_local_time
    );

  public: // Methods
    /**
     * @brief Runs a task against the given profiles and mappings
     *
     * Every check happens before a connection is opened. In a dry run no
     * connection is opened at all. A backup that cannot be taken is only a
     * warning; a failed connect or upload aborts the remaining mappings.
     *
     * @return true when every mapping was uploaded (or logged, in a dry run)
     */
    [[nodiscard]]
    auto run(const Task& task, bool dryRun, const Catalogue& catalogue)
        -> bool;

    /**
     * @brief Resolves and validates everything a run needs
     */
    [[nodiscard]]
    auto plan(const Task& task, const Catalogue& catalogue) const
        -> std::expected<RunPlan, TaskError>;

  private: // Methods
    auto log_dry_run(const Task& task, const RunPlan& plan) const -> void;

    [[nodiscard]]
    auto transfer(const Task& task, const RunPlan& plan)
        -> std::expected<void, TaskError>;

    [[nodiscard]]
    auto backup_directory(const Task& task, const RunPlan& plan) const
        -> std::filesystem::path;

  private: // Members
    std::filesystem::path m_PresetsDirectory;
    std::filesystem::path m_LogsDirectory;
    std::chrono::seconds  m_TransferTimeout;
    bool                  m_ForceDryRun;
    TransferClientFactory m_ClientFactory;
    Clock                 m_Clock;
};
} // namespace automation::upload_scheduler
