/**
 * @file FactSet.hpp
 * @brief In-memory image of the three fact tables (plus annotations) read and written by one transaction.
 */

#pragma once

#include <map>
#include <optional>
#include <vector>

#include "entities/Annotation.hpp"
#include "entities/ExternalRecord.hpp"
#include "entities/Task.hpp"
#include "entities/WorkSession.hpp"

namespace taskwalker::domain {

/**
 * @struct SessionBoundary
 * @brief The most recent open-to-closed transition still eligible for micro-session correction.
 */
struct SessionBoundary {
    SessionId sessionId = 0;
    TaskId taskId = 0;
    Timestamp closedAt = 0;
};

/**
 * @struct TaskFacts
 * @brief The orthogonal facts about one task that classification is derived from.
 */
struct TaskFacts {
    Lifecycle lifecycle = Lifecycle::Open;
    bool queued = false;
    bool hasHistory = false;      ///< Work history: Initiated when true, Pending otherwise.
    bool timerOn = false;
    bool externalWaiting = false;
};

/**
 * @class FactSet
 * @brief Arena of tasks, sessions, external records and annotations keyed by integer identity.
 *
 * Derived facts (work history, timer state) are always answered by querying the tables,
 * never cached.
 */
class FactSet {
public:
    std::map<TaskId, Task> tasks;
    std::map<SessionId, WorkSession> sessions;
    std::map<std::int64_t, ExternalRecord> externals;
    std::map<std::int64_t, Annotation> annotations;
    std::optional<SessionBoundary> lastBoundary;

    TaskId nextTaskId = 1;
    SessionId nextSessionId = 1;
    std::int64_t nextExternalId = 1;
    std::int64_t nextAnnotationId = 1;

    bool hasTask(TaskId id) const { return tasks.count(id) > 0; }

    /** @brief Throws TaskError(NoSuchTask) for unknown ids. */
    Task& task(TaskId id);
    const Task& task(TaskId id) const;

    /** @brief The single running session, if any. */
    WorkSession* openSession();
    const WorkSession* openSession() const;

    bool hasHistory(TaskId id) const;
    bool timerOn(TaskId id) const;

    ExternalRecord* waitingRecord(TaskId id);
    const ExternalRecord* waitingRecord(TaskId id) const;

    /** @brief Queued task ids ordered front to back. */
    std::vector<TaskId> queue() const;

    /** @brief Sessions of one task, newest start first. */
    std::vector<WorkSession> sessionsFor(TaskId id) const;

    TaskFacts factsFor(TaskId id) const;
};

} // namespace taskwalker::domain
