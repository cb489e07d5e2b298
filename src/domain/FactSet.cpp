/**
 * @file FactSet.cpp
 * @brief Implementation of FactSet queries.
 */

#include "domain/FactSet.hpp"

#include <algorithm>
#include <string>

#include "domain/TaskError.hpp"

namespace taskwalker::domain {

Task& FactSet::task(TaskId id) {
    auto it = tasks.find(id);
    if (it == tasks.end()) {
        throw TaskError(ErrorKind::NoSuchTask, "Task " + std::to_string(id) + " not found");
    }
    return it->second;
}

const Task& FactSet::task(TaskId id) const {
    auto it = tasks.find(id);
    if (it == tasks.end()) {
        throw TaskError(ErrorKind::NoSuchTask, "Task " + std::to_string(id) + " not found");
    }
    return it->second;
}

WorkSession* FactSet::openSession() {
    for (auto& [id, session] : sessions) {
        if (session.isOpen()) return &session;
    }
    return nullptr;
}

const WorkSession* FactSet::openSession() const {
    for (const auto& [id, session] : sessions) {
        if (session.isOpen()) return &session;
    }
    return nullptr;
}

bool FactSet::hasHistory(TaskId id) const {
    return std::any_of(sessions.begin(), sessions.end(),
        [id](const auto& entry) { return entry.second.taskId == id; });
}

bool FactSet::timerOn(TaskId id) const {
    const WorkSession* open = openSession();
    return open && open->taskId == id;
}

ExternalRecord* FactSet::waitingRecord(TaskId id) {
    for (auto& [recordId, record] : externals) {
        if (record.taskId == id && record.isWaiting()) return &record;
    }
    return nullptr;
}

const ExternalRecord* FactSet::waitingRecord(TaskId id) const {
    for (const auto& [recordId, record] : externals) {
        if (record.taskId == id && record.isWaiting()) return &record;
    }
    return nullptr;
}

std::vector<TaskId> FactSet::queue() const {
    std::vector<std::pair<int, TaskId>> queued;
    for (const auto& [id, t] : tasks) {
        if (t.queuePosition) queued.emplace_back(*t.queuePosition, id);
    }
    std::sort(queued.begin(), queued.end());

    std::vector<TaskId> order;
    order.reserve(queued.size());
    for (const auto& entry : queued) order.push_back(entry.second);
    return order;
}

std::vector<WorkSession> FactSet::sessionsFor(TaskId id) const {
    std::vector<WorkSession> result;
    for (const auto& [sessionId, session] : sessions) {
        if (session.taskId == id) result.push_back(session);
    }
    std::sort(result.begin(), result.end(), [](const WorkSession& a, const WorkSession& b) {
        return a.startTs > b.startTs;
    });
    return result;
}

TaskFacts FactSet::factsFor(TaskId id) const {
    const Task& t = task(id);
    TaskFacts facts;
    facts.lifecycle = t.lifecycle;
    facts.queued = t.isQueued();
    facts.hasHistory = hasHistory(id);
    facts.timerOn = timerOn(id);
    facts.externalWaiting = waitingRecord(id) != nullptr;
    return facts;
}

} // namespace taskwalker::domain
