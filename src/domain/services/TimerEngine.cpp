/**
 * @file TimerEngine.cpp
 * @brief Implementation of TimerEngine.
 */

#include "domain/services/TimerEngine.hpp"

#include <string>

#include "domain/TaskError.hpp"
#include "domain/services/QueueEngine.hpp"

namespace taskwalker::domain {

TimerEngine::TimerEngine(FactSet& facts, EventLog& events, MicroSessionPolicy policy)
    : m_facts(facts), m_events(events), m_policy(policy) {}

TimerOutcome TimerEngine::startDefault(Timestamp ts) {
    if (const WorkSession* open = m_facts.openSession()) {
        throw TaskError(ErrorKind::AlreadyRunning,
            "A session is already running for task " + std::to_string(open->taskId) + ". Stop it first.");
    }

    std::vector<TaskId> order = m_facts.queue();
    if (order.empty()) {
        throw TaskError(ErrorKind::EmptyQueue, "Queue is empty. Add a task to the queue first.");
    }

    TimerOutcome outcome;
    openFor(order.front(), ts, outcome);
    return outcome;
}

TimerOutcome TimerEngine::startFor(TaskId id, Timestamp ts) {
    const Task& t = m_facts.task(id);
    if (IsTerminal(t.lifecycle)) {
        throw TaskError(ErrorKind::TerminalLifecycle,
            "Cannot start timing task " + std::to_string(id) + ": status is " + LifecycleToString(t.lifecycle));
    }

    TimerOutcome outcome;
    if (m_facts.openSession()) {
        closeOpen(ts, CloseKind::Implicit, outcome);
    }

    QueueEngine(m_facts, m_events, ts).promoteToFront(id);
    openFor(id, ts, outcome);
    warnIfShort(outcome, false);
    return outcome;
}

TimerOutcome TimerEngine::stop(Timestamp ts) {
    TimerOutcome outcome;
    closeOpen(ts, CloseKind::Explicit, outcome);
    warnIfShort(outcome, true);
    return outcome;
}

TimerOutcome TimerEngine::advance(int n, Timestamp ts) {
    return reshapeQueue([n](QueueEngine& queue) { queue.rotate(n); }, QueueClock::Follow, ts);
}

TimerOutcome TimerEngine::reshapeQueue(const std::function<void(QueueEngine&)>& mutate,
                                       QueueClock clock, Timestamp ts) {
    std::optional<TaskId> running;
    if (const WorkSession* open = m_facts.openSession()) {
        running = open->taskId;
    }

    QueueEngine queue(m_facts, m_events, ts);
    mutate(queue);

    std::vector<TaskId> order = m_facts.queue();
    const bool keep = running && !order.empty() && order.front() == *running && clock != QueueClock::ClockOut;

    TimerOutcome outcome;
    if (running && !keep) {
        closeOpen(ts, CloseKind::Implicit, outcome);
        order = m_facts.queue();
    }

    bool start = false;
    switch (clock) {
        case QueueClock::Follow: start = running && !keep; break;
        case QueueClock::ClockIn: start = !keep; break;
        case QueueClock::ClockOut: start = false; break;
    }

    if (start && !order.empty()) {
        openFor(order.front(), ts, outcome);
        warnIfShort(outcome, false);
    } else {
        warnIfShort(outcome, true);
    }
    return outcome;
}

WorkSession TimerEngine::interval(TaskId id, Timestamp start, Timestamp end, Timestamp recordedAt) {
    const Task& t = m_facts.task(id);
    if (IsTerminal(t.lifecycle)) {
        throw TaskError(ErrorKind::TerminalLifecycle,
            "Cannot record time on task " + std::to_string(id) + ": status is " + LifecycleToString(t.lifecycle));
    }
    if (end <= start) {
        throw TaskError(ErrorKind::NonChronological,
            "Interval end (" + std::to_string(end) + ") must be after its start (" + std::to_string(start) + ")");
    }

    if (WorkSession* open = m_facts.openSession(); open && open->startTs < end) {
        if (open->startTs < start) {
            throw TaskError(ErrorKind::InvariantViolation,
                "Interval lies inside the running session of task " + std::to_string(open->taskId) +
                ". Stop the timer first.");
        }
        const Timestamp oldStart = open->startTs;
        open->startTs = end;
        m_events.push_back(SessionAmended{open->taskId, open->id, oldStart, std::nullopt,
                                          open->startTs, std::nullopt, recordedAt});
    }

    resolveOverlaps(start, end, recordedAt);

    // A merge would reopen the stopped session across the backfilled time.
    if (m_facts.lastBoundary && end > m_facts.lastBoundary->closedAt) {
        m_facts.lastBoundary.reset();
    }

    WorkSession session;
    session.id = m_facts.nextSessionId++;
    session.taskId = id;
    session.startTs = start;
    session.endTs = end;
    m_facts.sessions.emplace(session.id, session);

    m_events.push_back(SessionOpened{id, session.id, start, recordedAt});
    m_events.push_back(SessionClosed{id, session.id, start, end, recordedAt});
    return session;
}

void TimerEngine::closeFinal(Timestamp ts, TimerOutcome& outcome) {
    closeOpen(ts, CloseKind::Final, outcome);
}

void TimerEngine::closeOpen(Timestamp ts, CloseKind kind, TimerOutcome& outcome) {
    WorkSession* open = m_facts.openSession();
    if (!open) {
        throw TaskError(ErrorKind::NotRunning, "No session is currently running.");
    }
    if (ts < open->startTs || (kind == CloseKind::Explicit && ts == open->startTs)) {
        throw TaskError(ErrorKind::NonChronological,
            "Session end (" + std::to_string(ts) + ") must be after its start (" +
            std::to_string(open->startTs) + ")");
    }

    const TaskId taskId = open->taskId;
    const SessionId sessionId = open->id;

    if (ts == open->startTs) {
        m_facts.sessions.erase(sessionId);
        m_events.push_back(SessionRemoved{taskId, sessionId, ts});
    } else {
        open->endTs = ts;
        outcome.closed = *open;
        m_events.push_back(SessionClosed{taskId, sessionId, open->startTs, ts, ts});
        if (kind != CloseKind::Final) {
            m_facts.lastBoundary = SessionBoundary{sessionId, taskId, ts};
        }
    }
    if (kind == CloseKind::Final) {
        m_facts.lastBoundary.reset();
    }

    // A handed-off task only holds a queue slot while it is being timed.
    if (m_facts.waitingRecord(taskId)) {
        QueueEngine(m_facts, m_events, ts).dequeue(taskId);
    }
}

void TimerEngine::openFor(TaskId id, Timestamp ts, TimerOutcome& outcome) {
    if (m_facts.lastBoundary) {
        const SessionBoundary boundary = *m_facts.lastBoundary;
        m_facts.lastBoundary.reset();

        auto it = m_facts.sessions.find(boundary.sessionId);
        // Sessions of closed or cancelled tasks are final.
        if (it != m_facts.sessions.end() && m_facts.hasTask(it->second.taskId) &&
            !IsTerminal(m_facts.task(it->second.taskId).lifecycle)) {
            const MicroDecision decision = m_policy.decide(it->second, id, ts);

            if (decision.resolution == MicroResolution::Merged) {
                WorkSession& merged = it->second;
                merged.endTs.reset();
                if (outcome.closed && outcome.closed->id == merged.id) outcome.closed.reset();
                outcome.resolution = MicroResolution::Merged;
                outcome.opened = merged;
                outcome.notices.push_back(
                    "Merged micro-session: task " + std::to_string(id) + " resumed " +
                    std::to_string(decision.gapSecs) + "s after stopping; session " +
                    std::to_string(merged.id) + " continues.");
                m_events.push_back(MicroSessionMerged{id, merged.id, decision.gapSecs, ts});
                return;
            }

            if (decision.resolution == MicroResolution::Purged) {
                const TaskId purgedTask = it->second.taskId;
                outcome.resolution = MicroResolution::Purged;
                outcome.notices.push_back(
                    "Purged micro-session: " + std::to_string(decision.durationSecs) + "s on task " +
                    std::to_string(purgedTask) + " discarded.");
                m_events.push_back(MicroSessionPurged{purgedTask, it->first, decision.durationSecs, ts});
                if (outcome.closed && outcome.closed->id == it->first) outcome.closed.reset();
                m_facts.sessions.erase(it);
            }
        }
    }

    resolveOverlaps(ts, std::nullopt, ts);

    WorkSession session;
    session.id = m_facts.nextSessionId++;
    session.taskId = id;
    session.startTs = ts;
    m_facts.sessions.emplace(session.id, session);

    outcome.opened = session;
    m_events.push_back(SessionOpened{id, session.id, ts, ts});
}

void TimerEngine::resolveOverlaps(Timestamp start, std::optional<Timestamp> end, Timestamp recordedAt) {
    std::vector<SessionId> covered;

    for (auto& [sessionId, s] : m_facts.sessions) {
        if (s.isOpen()) continue;
        const Timestamp sEnd = *s.endTs;
        const bool overlaps = sEnd > start && (!end || s.startTs < *end);
        if (!overlaps) continue;

        if (s.startTs >= start && (!end || sEnd <= *end)) {
            covered.push_back(sessionId);
            continue;
        }

        const Timestamp oldStart = s.startTs;
        const std::optional<Timestamp> oldEnd = s.endTs;
        if (s.startTs < start) {
            s.endTs = start;
        } else {
            s.startTs = *end;
        }
        m_events.push_back(SessionAmended{s.taskId, sessionId, oldStart, oldEnd, s.startTs, s.endTs, recordedAt});
        forgetBoundary(sessionId);
    }

    for (SessionId sessionId : covered) {
        const TaskId taskId = m_facts.sessions.at(sessionId).taskId;
        m_facts.sessions.erase(sessionId);
        m_events.push_back(SessionRemoved{taskId, sessionId, recordedAt});
        forgetBoundary(sessionId);
    }
}

void TimerEngine::warnIfShort(TimerOutcome& outcome, bool provisional) const {
    if (!outcome.closed || outcome.resolution != MicroResolution::None) return;

    const std::int64_t duration = outcome.closed->duration(outcome.closed->startTs);
    if (!m_policy.isMicro(duration)) return;

    std::string notice = "Warning: Micro-session detected (" + std::to_string(duration) + "s on task " +
                         std::to_string(outcome.closed->taskId) + "). ";
    if (provisional) {
        notice += "It is kept unless the next start within " + std::to_string(m_policy.thresholdSecs) +
                  "s merges or purges it.";
    } else {
        notice += "It is kept as recorded.";
    }
    outcome.notices.push_back(notice);
}

void TimerEngine::forgetBoundary(SessionId id) {
    if (m_facts.lastBoundary && m_facts.lastBoundary->sessionId == id) {
        m_facts.lastBoundary.reset();
    }
}

} // namespace taskwalker::domain
