/**
 * @file Task.hpp
 * @brief Entity representing a tracked unit of work.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../value_objects/Lifecycle.hpp"
#include "../value_objects/Timestamp.hpp"

namespace taskwalker::domain {

/**
 * @struct TaskDetails
 * @brief Descriptive attributes. Orthogonal to queue, timer and handoff facts.
 */
struct TaskDetails {
    std::string description;
    std::optional<std::string> project;
    std::vector<std::string> tags;
    std::optional<Timestamp> dueTs;
    std::optional<Timestamp> scheduledTs;
    std::optional<Timestamp> waitTs;
    std::optional<std::int64_t> allocSecs; ///< Allocation estimate in seconds.
};

/**
 * @struct Task
 * @brief A task row of the fact store.
 */
struct Task {
    TaskId id = 0;
    Lifecycle lifecycle = Lifecycle::Open;
    std::optional<int> queuePosition; ///< nullopt = not queued; dense 0..n-1 across queued tasks.
    TaskDetails details;
    Timestamp createdTs = 0;
    Timestamp modifiedTs = 0;

    bool isQueued() const { return queuePosition.has_value(); }
};

} // namespace taskwalker::domain
