/**
 * @file Scheduler.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/Scheduler.hpp>

// Standard Library Includes
#include <chrono>
#include <cstddef>
#include <exception>
#include <string>

// Third Party Library Includes
#include <spdlog/spdlog.h>

// Project Includes
#include <automation/upload_scheduler/WallClock.hpp>

namespace automation::upload_scheduler
{
Scheduler::Scheduler(
    TaskStore&       tasks,
    TaskRunner&      runner,
    const Catalogue& catalogue
)
    : m_Tasks(tasks),
      m_Runner(runner),
      m_Catalogue(catalogue),
      m_State(State::STOPPED)
{
}

auto Scheduler::start() -> void
{
    m_State = State::RUNNING;
    spdlog::info("Scheduler started.");
}

auto Scheduler::stop() -> void
{
    m_State = State::STOPPED;
    spdlog::warn("Scheduler stopped.");
}

auto Scheduler::is_due(
    const Task&        task,
    LocalTime          now,
    const std::string& stampMinute
) const -> bool
{
    const auto midnight = std::chrono::floor<std::chrono::days>(now);
    const std::chrono::hh_mm_ss timeOfDay { now - midnight };

    if (!task.runs_on(std::chrono::weekday { midnight }))
    {
        return false;
    }

    if (timeOfDay.hours().count() != task.hour
        || timeOfDay.minutes().count() != task.minute)
    {
        return false;
    }

    if (task.lastRun == stampMinute)
    {
        spdlog::info(
            "[TASK] {} already ran at {}, skipping",
            task.name,
            stampMinute
        );
        return false;
    }

    return true;
}

auto Scheduler::tick(LocalTime now) -> void
{
    if (m_State != State::RUNNING)
    {
        return;
    }

    const auto today       = std::chrono::weekday {
        std::chrono::floor<std::chrono::days>(now)
    };
    const auto stampMinute = format_stamp_minute(now);

    spdlog::trace("Tick at {} ({})", stampMinute, weekday_name(today));

    // Stored order, addressed by index since that is what mark_fired takes
    for (std::size_t index = 0; index < m_Tasks.get_tasks().size(); ++index)
    {
        const auto& task = m_Tasks.get_tasks().at(index);

        if (!task.enabled)
        {
            continue;
        }

        try
        {
            if (!this->is_due(task, now, stampMinute))
            {
                continue;
            }

            spdlog::info(
                "[TASK] Trigger: {} ({} {})",
                task.name,
                weekday_name(today),
                stampMinute.substr(stampMinute.size() - 5)
            );

            this->fire(index, stampMinute);
        }
        catch (const std::exception& e)
        {
            spdlog::error(
                "[TASK] {} failed with an unexpected error: {}",
                task.name,
                e.what()
            );
        }
    }
}

auto Scheduler::fire(std::size_t index, const std::string& stampMinute)
    -> void
{
    const auto task = m_Tasks.get_tasks().at(index);

    if (!m_Runner.run(task, task.dryRun, m_Catalogue))
    {
        spdlog::warn("[TASK] Failed: {}", task.name);
        return;
    }

    m_Tasks.mark_fired(index, stampMinute);

    try
    {
        m_Tasks.persist();
    }
    catch (const std::exception& e)
    {
        spdlog::error(
            "[TASK] {} ran but its last run could not be saved: {}",
            task.name,
            e.what()
        );
    }

    spdlog::info("[TASK] Completed: {}", task.name);
}
} // namespace automation::upload_scheduler
