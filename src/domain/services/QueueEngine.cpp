/**
 * @file QueueEngine.cpp
 * @brief Implementation of QueueEngine.
 */

#include "domain/services/QueueEngine.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "domain/TaskError.hpp"

namespace taskwalker::domain {

QueueEngine::QueueEngine(FactSet& facts, EventLog& events, Timestamp now)
    : m_facts(facts), m_events(events), m_now(now) {}

std::size_t QueueEngine::ClampIndex(int index, std::size_t size) {
    if (size == 0 || index <= 0) return 0;
    return std::min(static_cast<std::size_t>(index), size - 1);
}

int QueueEngine::SaturateIndex(std::int64_t value) {
    if (value < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    if (value > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    return static_cast<int>(value);
}

void QueueEngine::requireOpen(TaskId id, const char* action) const {
    const Task& t = m_facts.task(id);
    if (IsTerminal(t.lifecycle)) {
        throw TaskError(ErrorKind::TerminalLifecycle,
            std::string("Cannot ") + action + " task " + std::to_string(id) +
            ": status is " + LifecycleToString(t.lifecycle));
    }
}

void QueueEngine::enqueue(TaskId id) {
    requireOpen(id, "queue");
    if (m_facts.waitingRecord(id) && !m_facts.timerOn(id)) {
        throw TaskError(ErrorKind::InvariantViolation,
            "Cannot queue task " + std::to_string(id) +
            ": waiting on external party. Recall it first, or start timing it to work on it temporarily.");
    }

    std::vector<TaskId> order = m_facts.queue();
    order.erase(std::remove(order.begin(), order.end(), id), order.end());
    order.push_back(id);
    applyOrder(order);
}

TaskId QueueEngine::selectAt(int index) const {
    std::vector<TaskId> order = m_facts.queue();
    if (order.empty()) {
        throw TaskError(ErrorKind::EmptyQueue, "Queue is empty.");
    }
    return order[ClampIndex(index, order.size())];
}

void QueueEngine::promoteToFront(TaskId id) {
    moveTo(id, 0);
}

void QueueEngine::moveTo(TaskId id, int position) {
    requireOpen(id, "queue");

    std::vector<TaskId> order = m_facts.queue();
    order.erase(std::remove(order.begin(), order.end(), id), order.end());
    // Unlike selection, insertion may target one past the last element.
    std::size_t at = position <= 0 ? 0 : std::min(static_cast<std::size_t>(position), order.size());
    order.insert(order.begin() + static_cast<std::ptrdiff_t>(at), id);
    applyOrder(order);
}

void QueueEngine::rotate(int n) {
    std::vector<TaskId> order = m_facts.queue();
    if (order.size() <= 1) return;

    const int count = static_cast<int>(order.size());
    const int shift = ((n % count) + count) % count;
    if (shift == 0) return;

    std::rotate(order.begin(), order.begin() + shift, order.end());
    applyOrder(order);
}

std::optional<TaskId> QueueEngine::remove(const QueueRef& ref) {
    std::vector<TaskId> order = m_facts.queue();
    if (order.empty()) {
        throw TaskError(ErrorKind::EmptyQueue, "Queue is empty.");
    }

    TaskId target = 0;
    if (const auto* index = std::get_if<QueueIndex>(&ref)) {
        target = order[ClampIndex(index->value, order.size())];
    } else {
        target = std::get<TaskId>(ref);
        if (!m_facts.task(target).isQueued()) return std::nullopt;
    }

    order.erase(std::remove(order.begin(), order.end(), target), order.end());
    applyOrder(order);
    return target;
}

void QueueEngine::clear() {
    applyOrder({});
}

bool QueueEngine::dequeue(TaskId id) {
    if (!m_facts.task(id).isQueued()) return false;
    std::vector<TaskId> order = m_facts.queue();
    order.erase(std::remove(order.begin(), order.end(), id), order.end());
    applyOrder(order);
    return true;
}

void QueueEngine::applyOrder(const std::vector<TaskId>& order) {
    const std::vector<TaskId> previous = m_facts.queue();
    bool membershipChanged = false;

    for (auto& [id, t] : m_facts.tasks) {
        if (!t.isQueued()) continue;
        if (std::find(order.begin(), order.end(), id) == order.end()) {
            t.queuePosition.reset();
            membershipChanged = true;
            m_events.push_back(TaskDequeued{id, m_now});
        }
    }

    for (std::size_t i = 0; i < order.size(); ++i) {
        Task& t = m_facts.task(order[i]);
        const bool added = !t.isQueued();
        t.queuePosition = static_cast<int>(i);
        if (added) {
            membershipChanged = true;
            m_events.push_back(TaskQueued{order[i], static_cast<int>(i), m_now});
        }
    }

    if (!membershipChanged && previous != order) {
        m_events.push_back(QueueReordered{order.front(), order, m_now});
    }
}

} // namespace taskwalker::domain
