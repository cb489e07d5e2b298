/**
 * @file TaskTrackerService.cpp
 * @brief Implementation of TaskTrackerService.
 */

#include "TaskTrackerService.hpp"

#include <algorithm>
#include <iostream>

#include "domain/TaskError.hpp"
#include "domain/services/HandoffManager.hpp"
#include "domain/services/LifecycleManager.hpp"

namespace taskwalker::application {

namespace {

void RequireDescription(const TaskDetails& details) {
    if (details.description.empty()) {
        throw TaskError(ErrorKind::InvariantViolation, "Task description cannot be empty.");
    }
}

} // namespace

TaskTrackerService::TaskTrackerService(std::shared_ptr<FactStore> store,
                                       MicroSessionPolicy policy,
                                       ClassificationTable table)
    : m_uow(std::move(store)), m_policy(policy), m_table(std::move(table)) {}

// --- Tasks ---

TaskId TaskTrackerService::createTask(const TaskDetails& details, Timestamp ts) {
    RequireDescription(details);
    return m_uow.execute([&](Transaction& tx) {
        Task t;
        t.id = tx.facts.nextTaskId++;
        t.details = details;
        t.createdTs = ts;
        t.modifiedTs = ts;
        tx.facts.tasks[t.id] = t;
        tx.events.push_back(TaskCreated{t.id, details.description, ts});
        return t.id;
    });
}

void TaskTrackerService::updateDetails(TaskId id, const TaskDetails& details, Timestamp ts) {
    RequireDescription(details);
    m_uow.execute([&](Transaction& tx) {
        Task& t = tx.facts.task(id);
        if (IsTerminal(t.lifecycle)) {
            throw TaskError(ErrorKind::TerminalLifecycle,
                            "Task " + std::to_string(id) + " is " + LifecycleToString(t.lifecycle) + " and cannot be modified.");
        }
        t.details = details;
        t.modifiedTs = ts;
        tx.events.push_back(TaskDetailsUpdated{id, details.description, ts});
    });
}

std::int64_t TaskTrackerService::annotate(TaskId id, const std::string& note, Timestamp ts) {
    if (note.empty()) {
        throw TaskError(ErrorKind::InvariantViolation, "Annotation text cannot be empty.");
    }
    return m_uow.execute([&](Transaction& tx) {
        tx.facts.task(id);

        Annotation a;
        a.id = tx.facts.nextAnnotationId++;
        a.taskId = id;
        a.note = note;
        a.entryTs = ts;
        if (const WorkSession* open = tx.facts.openSession(); open && open->taskId == id) {
            a.sessionId = open->id;
        }
        tx.facts.annotations[a.id] = a;
        tx.events.push_back(TaskAnnotated{id, a.id, a.sessionId, ts});
        return a.id;
    });
}

// --- Queue ---

void TaskTrackerService::enqueue(TaskId id, Timestamp ts) {
    m_uow.execute([&](Transaction& tx) {
        QueueEngine(tx.facts, tx.events, ts).enqueue(id);
    });
}

TaskId TaskTrackerService::select(int index) const {
    FactSet facts = m_uow.read();
    EventLog unused;
    return QueueEngine(facts, unused, 0).selectAt(index);
}

void TaskTrackerService::promoteToFront(TaskId id, Timestamp ts) {
    m_uow.execute([&](Transaction& tx) {
        QueueEngine(tx.facts, tx.events, ts).promoteToFront(id);
    });
}

TaskId TaskTrackerService::pick(int index, Timestamp ts) {
    return m_uow.execute([&](Transaction& tx) {
        QueueEngine queue(tx.facts, tx.events, ts);
        TaskId id = queue.selectAt(index);
        queue.promoteToFront(id);
        return id;
    });
}

void TaskTrackerService::rotate(int n, Timestamp ts) {
    m_uow.execute([&](Transaction& tx) {
        QueueEngine(tx.facts, tx.events, ts).rotate(n);
    });
}

std::optional<TaskId> TaskTrackerService::remove(const QueueRef& ref, Timestamp ts) {
    return m_uow.execute([&](Transaction& tx) {
        return QueueEngine(tx.facts, tx.events, ts).remove(ref);
    });
}

void TaskTrackerService::clear(Timestamp ts) {
    m_uow.execute([&](Transaction& tx) {
        QueueEngine(tx.facts, tx.events, ts).clear();
    });
}

TimerOutcome TaskTrackerService::pickWithClock(int index, QueueClock clock, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).reshapeQueue([index](QueueEngine& queue) {
            queue.promoteToFront(queue.selectAt(index));
        }, clock, ts);
    }));
}

TimerOutcome TaskTrackerService::rotateWithClock(int n, QueueClock clock, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).reshapeQueue([n](QueueEngine& queue) {
            queue.rotate(n);
        }, clock, ts);
    }));
}

TimerOutcome TaskTrackerService::removeWithClock(const QueueRef& ref, QueueClock clock, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).reshapeQueue([&ref](QueueEngine& queue) {
            queue.remove(ref);
        }, clock, ts);
    }));
}

TimerOutcome TaskTrackerService::clearWithClock(QueueClock clock, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).reshapeQueue([](QueueEngine& queue) {
            queue.clear();
        }, clock, ts);
    }));
}

// --- Timer ---

TimerOutcome TaskTrackerService::startDefault(Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).startDefault(ts);
    }));
}

TimerOutcome TaskTrackerService::startFor(TaskId id, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).startFor(id, ts);
    }));
}

TimerOutcome TaskTrackerService::stop(Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).stop(ts);
    }));
}

TimerOutcome TaskTrackerService::next(int n, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).advance(n, ts);
    }));
}

WorkSession TaskTrackerService::interval(TaskId id, Timestamp start, Timestamp end, Timestamp ts) {
    return m_uow.execute([&](Transaction& tx) {
        return TimerEngine(tx.facts, tx.events, m_policy).interval(id, start, end, ts);
    });
}

// --- Handoff ---

ExternalRecord TaskTrackerService::send(TaskId id, const std::string& recipient,
                                        const std::optional<std::string>& note, Timestamp ts) {
    return m_uow.execute([&](Transaction& tx) {
        return ExternalRecord(HandoffManager(tx.facts, tx.events, ts).send(id, recipient, note));
    });
}

void TaskTrackerService::recall(TaskId id, int position, Timestamp ts) {
    m_uow.execute([&](Transaction& tx) {
        HandoffManager(tx.facts, tx.events, ts).recall(id, position);
    });
}

// --- Lifecycle ---

TimerOutcome TaskTrackerService::complete(TaskId id, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return LifecycleManager(tx.facts, tx.events, m_policy).complete(id, ts);
    }));
}

TimerOutcome TaskTrackerService::cancel(TaskId id, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return LifecycleManager(tx.facts, tx.events, m_policy).cancel(id, ts);
    }));
}

TimerOutcome TaskTrackerService::completeCurrent(bool startNext, Timestamp ts) {
    return report(m_uow.execute([&](Transaction& tx) {
        return LifecycleManager(tx.facts, tx.events, m_policy).completeCurrent(startNext, ts);
    }));
}

// --- Reads ---

Classification TaskTrackerService::classify(TaskId id) const {
    FactSet facts = m_uow.read();
    return Classify(facts.factsFor(id), m_table);
}

TrackerSnapshot TaskTrackerService::snapshot() const {
    FactSet facts = m_uow.read();
    TrackerSnapshot snap;
    for (TaskId id : facts.queue()) {
        snap.queue.push_back(viewOf(facts, id));
    }
    for (const auto& [id, t] : facts.tasks) {
        snap.tasks.push_back(viewOf(facts, id));
    }
    if (const WorkSession* open = facts.openSession()) {
        snap.running = *open;
    }
    return snap;
}

std::vector<WorkSession> TaskTrackerService::sessions(std::optional<TaskId> id) const {
    FactSet facts = m_uow.read();
    if (id) {
        facts.task(*id);
        return facts.sessionsFor(*id);
    }

    std::vector<WorkSession> result;
    for (const auto& [sid, s] : facts.sessions) result.push_back(s);
    std::sort(result.begin(), result.end(), [](const WorkSession& a, const WorkSession& b) {
        return a.startTs != b.startTs ? a.startTs > b.startTs : a.id > b.id;
    });
    return result;
}

std::vector<ExternalRecord> TaskTrackerService::waitingExternals() const {
    FactSet facts = m_uow.read();
    std::vector<ExternalRecord> result;
    for (const auto& [rid, record] : facts.externals) {
        if (record.isWaiting()) result.push_back(record);
    }
    return result;
}

std::vector<Annotation> TaskTrackerService::annotations(TaskId id) const {
    FactSet facts = m_uow.read();
    facts.task(id);
    std::vector<Annotation> result;
    for (const auto& [aid, a] : facts.annotations) {
        if (a.taskId == id) result.push_back(a);
    }
    return result;
}

Task TaskTrackerService::task(TaskId id) const {
    FactSet facts = m_uow.read();
    return facts.task(id);
}

TaskView TaskTrackerService::viewOf(const FactSet& facts, TaskId id) const {
    TaskView view;
    view.task = facts.task(id);
    view.facts = facts.factsFor(id);
    view.classification = Classify(view.facts, m_table);
    if (const WorkSession* open = facts.openSession(); open && open->taskId == id) {
        view.openSession = *open;
    }
    if (const ExternalRecord* record = facts.waitingRecord(id)) {
        view.waiting = *record;
    }
    return view;
}

TimerOutcome TaskTrackerService::report(TimerOutcome outcome) const {
    for (const auto& notice : outcome.notices) {
        std::cerr << "[TaskTracker] " << notice << std::endl;
    }
    return outcome;
}

} // namespace taskwalker::application
