/**
 * @file HandoffManager.hpp
 * @brief Send/recall transitions for tasks delegated to a third party.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/FactSet.hpp"
#include "domain/events/TaskEvents.hpp"

namespace taskwalker::domain {

/**
 * @class HandoffManager
 * @brief Keeps external records and queue membership consistent.
 */
class HandoffManager {
public:
    HandoffManager(FactSet& facts, EventLog& events, Timestamp now);

    /**
     * @brief Records a Waiting handoff and takes the task out of the queue.
     *
     * A task being timed keeps its queue slot until the timer stops.
     */
    const ExternalRecord& send(TaskId id, const std::string& recipient, const std::optional<std::string>& note);

    /** @brief Marks the waiting record returned and re-queues the task at @p position (clamped). */
    void recall(TaskId id, int position = 0);

private:
    FactSet& m_facts;
    EventLog& m_events;
    Timestamp m_now;
};

} // namespace taskwalker::domain
