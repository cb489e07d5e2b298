/**
 * @file QueueEngine.hpp
 * @brief Maintains the ordered ready-list of tasks (the queue).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "domain/FactSet.hpp"
#include "domain/events/TaskEvents.hpp"

namespace taskwalker::domain {

/** @brief A position in the queue, 0 = front. Out-of-range values are clamped. */
struct QueueIndex {
    int value = 0;
};

/** @brief Addresses a queue entry either by position or by task id. */
using QueueRef = std::variant<QueueIndex, TaskId>;

/**
 * @class QueueEngine
 * @brief Queue mutations over a transaction's working FactSet.
 *
 * Positions are stored as an explicit ordinal on each task and rewritten by
 * applyOrder() after every mutation, so queued ordinals are always 0..n-1.
 * Cross-fact rules (timer at front, handed-off tasks out of the queue) are
 * checked by the InvariantGuard before commit, not here.
 */
class QueueEngine {
public:
    QueueEngine(FactSet& facts, EventLog& events, Timestamp now);

    /** @brief Appends a task, or bumps an already queued task to the end. */
    void enqueue(TaskId id);

    /** @brief Task at a clamped position. Throws EmptyQueue on an empty queue. */
    TaskId selectAt(int index) const;

    /** @brief Makes the task position 0, keeping the relative order of the rest. */
    void promoteToFront(TaskId id);

    /** @brief Inserts or moves a task to a clamped position (0..size). */
    void moveTo(TaskId id, int position);

    /** @brief Moves the front n tasks to the back. Negative n rotates the other way. */
    void rotate(int n = 1);

    /**
     * @brief Removes an entry and closes the gap.
     * @return The removed task, or nullopt when a task id was given that is not queued.
     */
    std::optional<TaskId> remove(const QueueRef& ref);

    /** @brief Unqueues every task. */
    void clear();

    /** @brief Removes the task if it is queued. Used by timer, handoff and lifecycle paths. */
    bool dequeue(TaskId id);

    /** @brief Clamps an index into 0..size-1 (negative values clamp to 0). */
    static std::size_t ClampIndex(int index, std::size_t size);

    /** @brief Narrows a parsed index or count to int, saturating at the int limits. */
    static int SaturateIndex(std::int64_t value);

private:
    void applyOrder(const std::vector<TaskId>& order);
    void requireOpen(TaskId id, const char* action) const;

    FactSet& m_facts;
    EventLog& m_events;
    Timestamp m_now;
};

} // namespace taskwalker::domain
