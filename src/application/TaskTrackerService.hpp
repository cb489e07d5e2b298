/**
 * @file TaskTrackerService.hpp
 * @brief Application service exposing the tracker operations, one transaction each.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "application/UnitOfWork.hpp"
#include "domain/repositories/FactStore.hpp"
#include "domain/services/Classification.hpp"
#include "domain/services/MicroSessionPolicy.hpp"
#include "domain/services/QueueEngine.hpp"
#include "domain/services/TimerEngine.hpp"

namespace taskwalker::application {

using namespace taskwalker::domain;

/**
 * @struct TaskView
 * @brief A task with its derived facts, as shown by display layers.
 */
struct TaskView {
    Task task;
    TaskFacts facts;
    Classification classification;
    std::optional<WorkSession> openSession;
    std::optional<ExternalRecord> waiting;
};

/**
 * @struct TrackerSnapshot
 * @brief Ordered queue plus derived state for every task, read at one instant.
 */
struct TrackerSnapshot {
    std::vector<TaskView> queue;         ///< Front first.
    std::vector<TaskView> tasks;         ///< All tasks by id.
    std::optional<WorkSession> running;
};

class TaskTrackerService {
public:
    TaskTrackerService(std::shared_ptr<FactStore> store,
                       MicroSessionPolicy policy,
                       ClassificationTable table);

    // Tasks
    TaskId createTask(const TaskDetails& details, Timestamp ts);
    void updateDetails(TaskId id, const TaskDetails& details, Timestamp ts);
    std::int64_t annotate(TaskId id, const std::string& note, Timestamp ts);

    // Queue
    void enqueue(TaskId id, Timestamp ts);
    TaskId select(int index) const;
    void promoteToFront(TaskId id, Timestamp ts);
    TaskId pick(int index, Timestamp ts);
    void rotate(int n, Timestamp ts);
    std::optional<TaskId> remove(const QueueRef& ref, Timestamp ts);
    void clear(Timestamp ts);

    // Queue changes that also settle the timer on the new front, in one transaction
    TimerOutcome pickWithClock(int index, QueueClock clock, Timestamp ts);
    TimerOutcome rotateWithClock(int n, QueueClock clock, Timestamp ts);
    TimerOutcome removeWithClock(const QueueRef& ref, QueueClock clock, Timestamp ts);
    TimerOutcome clearWithClock(QueueClock clock, Timestamp ts);

    // Timer
    TimerOutcome startDefault(Timestamp ts);
    TimerOutcome startFor(TaskId id, Timestamp ts);
    TimerOutcome stop(Timestamp ts);
    TimerOutcome next(int n, Timestamp ts);
    WorkSession interval(TaskId id, Timestamp start, Timestamp end, Timestamp ts);

    // Handoff
    ExternalRecord send(TaskId id, const std::string& recipient, const std::optional<std::string>& note, Timestamp ts);
    void recall(TaskId id, int position, Timestamp ts);

    // Lifecycle
    TimerOutcome complete(TaskId id, Timestamp ts);
    TimerOutcome cancel(TaskId id, Timestamp ts);
    TimerOutcome completeCurrent(bool startNext, Timestamp ts);

    // Reads
    Classification classify(TaskId id) const;
    TrackerSnapshot snapshot() const;
    std::vector<WorkSession> sessions(std::optional<TaskId> id = std::nullopt) const;
    std::vector<ExternalRecord> waitingExternals() const;
    std::vector<Annotation> annotations(TaskId id) const;
    Task task(TaskId id) const;

    const ClassificationTable& classificationTable() const { return m_table; }
    const MicroSessionPolicy& policy() const { return m_policy; }

private:
    TaskView viewOf(const FactSet& facts, TaskId id) const;
    TimerOutcome report(TimerOutcome outcome) const;

    mutable UnitOfWork m_uow;
    MicroSessionPolicy m_policy;
    ClassificationTable m_table;
};

} // namespace taskwalker::application
