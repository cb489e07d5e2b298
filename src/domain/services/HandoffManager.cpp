/**
 * @file HandoffManager.cpp
 * @brief Implementation of HandoffManager.
 */

#include "domain/services/HandoffManager.hpp"

#include "domain/TaskError.hpp"
#include "domain/services/QueueEngine.hpp"

namespace taskwalker::domain {

HandoffManager::HandoffManager(FactSet& facts, EventLog& events, Timestamp now)
    : m_facts(facts), m_events(events), m_now(now) {}

const ExternalRecord& HandoffManager::send(TaskId id, const std::string& recipient,
                                           const std::optional<std::string>& note) {
    const Task& t = m_facts.task(id);
    if (IsTerminal(t.lifecycle)) {
        throw TaskError(ErrorKind::TerminalLifecycle,
            "Cannot send task " + std::to_string(id) + ": status is " + LifecycleToString(t.lifecycle));
    }
    if (recipient.empty()) {
        throw TaskError(ErrorKind::InvariantViolation, "A recipient is required to send a task.");
    }
    if (const ExternalRecord* existing = m_facts.waitingRecord(id)) {
        throw TaskError(ErrorKind::InvariantViolation,
            "Task " + std::to_string(id) + " is already waiting on " + existing->recipient + ".");
    }

    ExternalRecord record;
    record.id = m_facts.nextExternalId++;
    record.taskId = id;
    record.recipient = recipient;
    record.note = note;
    record.sentAt = m_now;
    auto it = m_facts.externals.emplace(record.id, record).first;

    if (!m_facts.timerOn(id)) {
        QueueEngine(m_facts, m_events, m_now).dequeue(id);
    }

    m_events.push_back(ExternalSent{id, recipient, note, m_now});
    return it->second;
}

void HandoffManager::recall(TaskId id, int position) {
    m_facts.task(id);
    ExternalRecord* record = m_facts.waitingRecord(id);
    if (!record) {
        throw TaskError(ErrorKind::NoWaitingRecord,
            "Task " + std::to_string(id) + " is not waiting on an external party.");
    }

    record->status = ExternalStatus::Returned;
    record->returnedAt = m_now;
    m_events.push_back(ExternalReturned{id, record->recipient, m_now});

    QueueEngine(m_facts, m_events, m_now).moveTo(id, position);
}

} // namespace taskwalker::domain
