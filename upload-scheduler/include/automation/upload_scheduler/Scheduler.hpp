/**
 * @file Scheduler.hpp
 * @brief
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <cstdint>
#include <string>

// Project Includes
#include <automation/upload_scheduler/Catalogue.hpp>
#include <automation/upload_scheduler/TaskRunner.hpp>
#include <automation/upload_scheduler/TaskStore.hpp>
#include <automation/upload_scheduler/WallClock.hpp>

namespace automation::upload_scheduler
{
class Scheduler
{
  public: // Enums
    enum class State : std::uint8_t
    {
        STOPPED,
        RUNNING,
    };

  public: // Constructors
    Scheduler(TaskStore& tasks, TaskRunner& runner, const Catalogue& catalogue);
    Scheduler(Scheduler&) = delete;
    Scheduler(Scheduler&&) = delete;
    auto operator=(Scheduler&) -> Scheduler = delete;
    auto operator=(Scheduler&&) -> Scheduler = delete;

  public: // Methods
    auto start() -> void;
    auto stop() -> void;

    [[nodiscard]]
    auto get_state() const -> State
    {
        return m_State;
    }

    /**
     * @brief Fires every enabled task due at `now`
     *
     * A task is due when `now` falls on one of its days at exactly its hour
     * and minute and it has not already fired in this minute. A no-op while
     * the scheduler is stopped. Not reentrant; callers serialize ticks.
     */
    auto tick(LocalTime now) -> void;

  private: // Methods
    [[nodiscard]]
    auto is_due(
        const Task&        task,
        LocalTime          now,
        const std::string& stampMinute
    ) const -> bool;

    auto fire(std::size_t index, const std::string& stampMinute) -> void;

  private: // Members
    TaskStore&       m_Tasks;
    TaskRunner&      m_Runner;
    const Catalogue& m_Catalogue;
    State            m_State;
};
} // namespace automation::upload_scheduler
