/**
 * @file TaskStore.cpp
 * @brief
 */

// Header Being Defined
#include <automation/upload_scheduler/TaskStore.hpp>

// Standard Library Includes
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace automation::upload_scheduler
{
TaskStore::TaskStore(std::vector<Task> tasks, SaveHook saveHook)
    : m_Tasks(std::move(tasks)),
      m_SaveHook(std::move(saveHook))
{
}

auto TaskStore::find(std::string_view name) const -> std::optional<std::size_t>
{
    const auto found = std::ranges::find(m_Tasks, name, &Task::name);

    if (found == m_Tasks.end())
    {
        return std::nullopt;
    }

    return static_cast<std::size_t>(std::distance(m_Tasks.begin(), found));
}

auto TaskStore::mark_fired(std::size_t index, const std::string& stampMinute)
    -> void
{
    m_Tasks.at(index).lastRun = stampMinute;
}

auto TaskStore::persist() const -> void
{
    if (m_SaveHook)
    {
        m_SaveHook(m_Tasks);
    }
}

auto TaskStore::replace(std::vector<Task> tasks) -> void
{
    m_Tasks = std::move(tasks);
}
} // namespace automation::upload_scheduler
