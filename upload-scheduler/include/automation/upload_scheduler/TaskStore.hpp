/**
 * @file TaskStore.hpp
 * @brief The task collection and the hook that persists it
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Project Includes
#include <automation/upload_scheduler/Task.hpp>

namespace automation::upload_scheduler
{
class TaskStore
{
  public: // Types
    using SaveHook = std::function<void(const std::vector<Task>&)>;

  public: // Constructors
    TaskStore(std::vector<Task> tasks, SaveHook saveHook);

  public: // Methods
    [[nodiscard]]
    auto get_tasks() const -> const std::vector<Task>&
    {
        return m_Tasks;
    }

    [[nodiscard]]
    auto find(std::string_view name) const -> std::optional<std::size_t>;

    auto mark_fired(std::size_t index, const std::string& stampMinute) -> void;

    // Throws whatever the save hook throws
    auto persist() const -> void;

    auto replace(std::vector<Task> tasks) -> void;

  private: // Members
    std::vector<Task> m_Tasks;
    SaveHook          m_SaveHook;
};
} // namespace automation::upload_scheduler
