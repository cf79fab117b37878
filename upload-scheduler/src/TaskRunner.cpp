/**
 * @file TaskRunner.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/TaskRunner.hpp>

// Standard Library Includes
#include <chrono>
#include <exception>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <spdlog/spdlog.h>
// NOLINTNEXTLINE(misc-include-cleaner) Required to print a range in a log
#include <spdlog/fmt/ranges.h>

// Project Includes
#include <automation/upload_scheduler/Errors.hpp>
#include <automation/upload_scheduler/MappingResolver.hpp>
#include <automation/upload_scheduler/RemotePath.hpp>
#include <automation/upload_scheduler/TransferClient.hpp>

namespace automation::upload_scheduler
{
namespace
{
auto fail(ErrorKind kind, std::string message) -> std::unexpected<TaskError>
{
    return std::unexpected(TaskError { kind, std::move(message) });
}
} // namespace

TaskRunner::TaskRunner(
    const Settings&       settings,
    TransferClientFactory clientFactory,
    Clock                 clock
)
    : m_PresetsDirectory(settings.presetsDirectory),
      m_LogsDirectory(settings.logsDirectory),
      m_TransferTimeout(settings.transferTimeout),
      m_ForceDryRun(settings.forceDryRun),
      m_ClientFactory(std::move(clientFactory)),
      m_Clock(std::move(clock))
{
}

auto TaskRunner::plan(const Task& task, const Catalogue& catalogue) const
    -> std::expected<RunPlan, TaskError>
{
    const auto profile = find_profile(catalogue.profiles, task.profile);

    if (!profile.has_value())
    {
        return fail(
            ErrorKind::CONFIGURATION,
            fmt::format("Profile not found: {}", task.profile)
        );
    }

    const auto presetDirectory = m_PresetsDirectory / task.preset;

    std::error_code errorCode;
    if (task.preset.empty()
        || !std::filesystem::is_directory(presetDirectory, errorCode))
    {
        return fail(
            ErrorKind::CONFIGURATION,
            fmt::format("Preset not found: {}", presetDirectory.string())
        );
    }

    const auto mappings = resolve_mappings(
        task.mappingMode,
        task.mappings,
        catalogue.mappings
    );

    if (mappings.empty())
    {
        return fail(
            ErrorKind::CONFIGURATION,
            "No mappings to run (check enabled/selected mappings)"
        );
    }

    RunPlan runPlan { .profile         = *profile,
                      .presetDirectory = presetDirectory,
                      .transfers       = {} };
    runPlan.transfers.reserve(mappings.size());

    std::vector<std::string> missingFiles;

    for (const auto& mapping : mappings)
    {
        auto localPath = presetDirectory / mapping.localRelativePath;

        if (!std::filesystem::is_regular_file(localPath, errorCode))
        {
            missingFiles.emplace_back(mapping.localRelativePath);
            continue;
        }

        runPlan.transfers.emplace_back(PlannedTransfer {
            .mapping    = mapping,
            .localPath  = std::move(localPath),
            .remotePath = compose_remote_path(profile->root, mapping.remotePath),
        });
    }

    // All or nothing: one missing file and nothing gets uploaded
    if (!missingFiles.empty())
    {
        return fail(
            ErrorKind::PRECONDITION,
            fmt::format(
                "Missing files in preset {}: {}",
                task.preset,
                fmt::join(missingFiles, ", ")
            )
        );
    }

    return runPlan;
}

auto TaskRunner::run(const Task& task, bool dryRun, const Catalogue& catalogue)
    -> bool
{
    const auto runPlan = this->plan(task, catalogue);

    if (!runPlan.has_value())
    {
        spdlog::error(
            "[TASK] {} aborted, {}: {}",
            task.name,
            to_string(runPlan.error().kind),
            runPlan.error().message
        );
        return false;
    }

    if (dryRun || m_ForceDryRun)
    {
        this->log_dry_run(task, *runPlan);
        return true;
    }

    const auto outcome = this->transfer(task, *runPlan);

    if (!outcome.has_value())
    {
        spdlog::error(
            "[TASK] {} failed, {}: {}",
            task.name,
            to_string(outcome.error().kind),
            outcome.error().message
        );
        return false;
    }

    return true;
}

auto TaskRunner::log_dry_run(const Task& task, const RunPlan& plan) const
    -> void
{
    for (const auto& planned : plan.transfers)
    {
        spdlog::info(
            "[TASK][DRY] {}: Would upload {} -> {}",
            task.name,
            planned.localPath.string(),
            planned.remotePath
        );
    }
}

auto TaskRunner::backup_directory(const Task& task, const RunPlan& plan) const
    -> std::filesystem::path
{
    return m_LogsDirectory / "backups" / plan.profile.name / task.preset
         / format_run_stamp(m_Clock());
}

auto TaskRunner::transfer(const Task& task, const RunPlan& plan)
    -> std::expected<void, TaskError>
{
    const auto backupDirectory = this->backup_directory(task, plan);

    try
    {
        const auto client = m_ClientFactory(plan.profile, m_TransferTimeout);

        if (!client)
        {
            return fail(
                ErrorKind::CONNECTION,
                fmt::format("No transfer client for {}", plan.profile.name)
            );
        }

        const ScopedConnection connection(*client);
        spdlog::debug(
            "[TASK] {}: connected to {}:{}",
            task.name,
            plan.profile.host,
            plan.profile.port
        );

        for (const auto& planned : plan.transfers)
        {
            if (planned.mapping.backupBeforeOverwrite)
            {
                const auto backupPath
                    = backupDirectory / planned.mapping.localRelativePath;

                if (client->download(planned.remotePath, backupPath))
                {
                    spdlog::info(
                        "[TASK] {}: Backup OK: {} -> {}",
                        task.name,
                        planned.remotePath,
                        backupPath.string()
                    );
                }
                else
                {
                    spdlog::warn(
                        "[TASK] {}: Backup skipped/failed: {}",
                        task.name,
                        planned.remotePath
                    );
                }
            }

            client->upload(planned.localPath, planned.remotePath);
            spdlog::info(
                "[TASK] {}: Uploaded {} -> {}",
                task.name,
                planned.localPath.string(),
                planned.remotePath
            );
        }
    }
    catch (const connection_error& ce)
    {
        return fail(ErrorKind::CONNECTION, ce.what());
    }
    catch (const transfer_error& te)
    {
        return fail(ErrorKind::TRANSFER, te.what());
    }
    catch (const std::exception& e)
    {
        return fail(ErrorKind::TRANSFER, e.what());
    }

    return {};
}
} // namespace automation::upload_scheduler
