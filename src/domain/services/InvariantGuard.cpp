/**
 * @file InvariantGuard.cpp
 * @brief Implementation of InvariantGuard.
 */

#include "domain/services/InvariantGuard.hpp"

#include <algorithm>
#include <map>
#include <sstream>

#include "domain/TaskError.hpp"

namespace taskwalker::domain {

namespace {

std::string TaskLabel(TaskId id) {
    return "task " + std::to_string(id);
}

} // namespace

std::vector<std::string> InvariantGuard::FindViolations(const FactSet& facts) {
    std::vector<std::string> violations;

    // Sessions
    int openCount = 0;
    for (const auto& [id, session] : facts.sessions) {
        if (!facts.hasTask(session.taskId)) {
            violations.push_back("session " + std::to_string(id) + " references missing " + TaskLabel(session.taskId));
        }
        if (session.isOpen()) {
            ++openCount;
        } else if (*session.endTs <= session.startTs) {
            violations.push_back("session " + std::to_string(id) + " does not end after it starts");
        }
    }
    if (openCount > 1) {
        violations.push_back(std::to_string(openCount) + " sessions are open; at most one may run");
    }

    // Queue density
    std::vector<int> positions;
    for (const auto& [id, t] : facts.tasks) {
        if (t.queuePosition) positions.push_back(*t.queuePosition);
    }
    std::sort(positions.begin(), positions.end());
    for (std::size_t i = 0; i < positions.size(); ++i) {
        if (positions[i] != static_cast<int>(i)) {
            violations.push_back("queue positions are not a contiguous 0..n-1 sequence");
            break;
        }
    }

    // Timed task at the front
    if (const WorkSession* open = facts.openSession(); open && facts.hasTask(open->taskId)) {
        const Task& timed = facts.task(open->taskId);
        if (!timed.queuePosition || *timed.queuePosition != 0) {
            violations.push_back(TaskLabel(open->taskId) + " is timed but not at the front of the queue");
        }
        if (IsTerminal(timed.lifecycle)) {
            violations.push_back(TaskLabel(open->taskId) + " is timed but " + LifecycleToString(timed.lifecycle));
        }
    }

    // External records
    std::map<TaskId, int> waitingPerTask;
    for (const auto& [id, record] : facts.externals) {
        if (!facts.hasTask(record.taskId)) {
            violations.push_back("external record " + std::to_string(id) + " references missing " + TaskLabel(record.taskId));
            continue;
        }
        if (!record.isWaiting()) continue;
        ++waitingPerTask[record.taskId];

        const Task& t = facts.task(record.taskId);
        if (t.isQueued() && !facts.timerOn(record.taskId)) {
            violations.push_back(TaskLabel(record.taskId) + " is waiting on " + record.recipient + " but still queued");
        }
        if (IsTerminal(t.lifecycle)) {
            violations.push_back(TaskLabel(record.taskId) + " is " + LifecycleToString(t.lifecycle) + " but still waiting");
        }
    }
    for (const auto& [taskId, count] : waitingPerTask) {
        if (count > 1) {
            violations.push_back(TaskLabel(taskId) + " has " + std::to_string(count) + " waiting records");
        }
    }

    // Terminal tasks
    for (const auto& [id, t] : facts.tasks) {
        if (IsTerminal(t.lifecycle) && t.isQueued()) {
            violations.push_back(TaskLabel(id) + " is " + LifecycleToString(t.lifecycle) + " but still queued");
        }
    }

    for (const auto& [id, annotation] : facts.annotations) {
        if (!facts.hasTask(annotation.taskId)) {
            violations.push_back("annotation " + std::to_string(id) + " references missing " + TaskLabel(annotation.taskId));
        }
    }

    return violations;
}

void InvariantGuard::Validate(const FactSet& facts) {
    const std::vector<std::string> violations = FindViolations(facts);
    if (violations.empty()) return;

    std::ostringstream message;
    message << "Rejected: ";
    for (std::size_t i = 0; i < violations.size(); ++i) {
        if (i > 0) message << "; ";
        message << violations[i];
    }
    throw TaskError(ErrorKind::InvariantViolation, message.str());
}

} // namespace taskwalker::domain
