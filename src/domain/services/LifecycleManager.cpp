/**
 * @file LifecycleManager.cpp
 * @brief Implementation of LifecycleManager.
 */

#include "domain/services/LifecycleManager.hpp"

#include <string>

#include "domain/TaskError.hpp"
#include "domain/services/QueueEngine.hpp"

namespace taskwalker::domain {

LifecycleManager::LifecycleManager(FactSet& facts, EventLog& events, MicroSessionPolicy policy)
    : m_facts(facts), m_events(events), m_policy(policy) {}

TimerOutcome LifecycleManager::complete(TaskId id, Timestamp ts) {
    return finish(id, Lifecycle::Closed, ts);
}

TimerOutcome LifecycleManager::cancel(TaskId id, Timestamp ts) {
    return finish(id, Lifecycle::Cancelled, ts);
}

TimerOutcome LifecycleManager::completeCurrent(bool startNext, Timestamp ts) {
    const WorkSession* open = m_facts.openSession();
    if (!open) {
        throw TaskError(ErrorKind::NotRunning, "No session is running. Cannot complete the current task.");
    }

    TimerOutcome outcome = finish(open->taskId, Lifecycle::Closed, ts);
    if (startNext && !m_facts.queue().empty()) {
        TimerOutcome next = TimerEngine(m_facts, m_events, m_policy).startDefault(ts);
        outcome.opened = next.opened;
        outcome.notices.insert(outcome.notices.end(), next.notices.begin(), next.notices.end());
    }
    return outcome;
}

TimerOutcome LifecycleManager::finish(TaskId id, Lifecycle target, Timestamp ts) {
    Task& t = m_facts.task(id);
    if (IsTerminal(t.lifecycle)) {
        throw TaskError(ErrorKind::TerminalLifecycle,
            "Task " + std::to_string(id) + " is already " + LifecycleToString(t.lifecycle));
    }

    TimerOutcome outcome;
    if (m_facts.timerOn(id)) {
        TimerEngine(m_facts, m_events, m_policy).closeFinal(ts, outcome);
    }
    // The last stopped session of a finished task is no longer open to merge or purge.
    if (m_facts.lastBoundary && m_facts.lastBoundary->taskId == id) {
        m_facts.lastBoundary.reset();
    }

    QueueEngine(m_facts, m_events, ts).dequeue(id);

    if (ExternalRecord* record = m_facts.waitingRecord(id)) {
        record->status = ExternalStatus::Returned;
        record->returnedAt = ts;
        m_events.push_back(ExternalReturned{id, record->recipient, ts});
    }

    const Lifecycle old = t.lifecycle;
    t.lifecycle = target;
    t.modifiedTs = ts;
    m_events.push_back(LifecycleChanged{id, old, target, ts});
    return outcome;
}

} // namespace taskwalker::domain
