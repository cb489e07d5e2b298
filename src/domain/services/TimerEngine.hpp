/**
 * @file TimerEngine.hpp
 * @brief Opens and closes work sessions under global single-open-session exclusivity.
 */

#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "domain/FactSet.hpp"
#include "domain/events/TaskEvents.hpp"
#include "domain/services/MicroSessionPolicy.hpp"

namespace taskwalker::domain {

class QueueEngine;

/**
 * @enum QueueClock
 * @brief What the timer does when a queue change moves the front.
 */
enum class QueueClock {
    Follow,   ///< A running timer moves to the new front (stops if the queue empties).
    ClockIn,  ///< Ends with the new front being timed.
    ClockOut  ///< Ends with the timer stopped.
};

/**
 * @struct TimerOutcome
 * @brief What a timer transition did, including micro-session corrections and user notices.
 */
struct TimerOutcome {
    std::optional<WorkSession> closed; ///< Session this operation closed, as recorded at close time.
    std::optional<WorkSession> opened; ///< Session now running (a merged session keeps its original start).
    MicroResolution resolution = MicroResolution::None;
    std::vector<std::string> notices;
};

/**
 * @class TimerEngine
 * @brief Global timer state machine: Idle, or Running(task) with exactly one open session.
 *
 * Micro-session correction runs as a look-back when a session opens: the session
 * closed by the previous stop or switch (FactSet::lastBoundary) is merged into the
 * new one or purged, inside the transaction of the event that triggers it.
 */
class TimerEngine {
public:
    TimerEngine(FactSet& facts, EventLog& events, MicroSessionPolicy policy);

    /** @brief Starts timing the queue front. Throws AlreadyRunning or EmptyQueue. */
    TimerOutcome startDefault(Timestamp ts);

    /**
     * @brief Starts timing a specific task, switching away from any running task at the same instant.
     *
     * The task is promoted to the queue front; a handed-off task is queued temporarily.
     */
    TimerOutcome startFor(TaskId id, Timestamp ts);

    /** @brief Stops the running session. Throws NotRunning or NonChronological. */
    TimerOutcome stop(Timestamp ts);

    /** @brief Rotates the queue by @p n and, if the timer was running, moves it to the new front. */
    TimerOutcome advance(int n, Timestamp ts);

    /**
     * @brief Applies a queue change and settles the timer on the resulting front per @p clock.
     *
     * A timer already on the new front keeps its session unless @p clock is ClockOut.
     */
    TimerOutcome reshapeQueue(const std::function<void(QueueEngine&)>& mutate, QueueClock clock, Timestamp ts);

    /**
     * @brief Records a closed session directly (backfill). Overlapping sessions are truncated.
     * @param recordedAt Time stamped on the emitted events.
     */
    WorkSession interval(TaskId id, Timestamp start, Timestamp end, Timestamp recordedAt);

    /** @brief Closes the running session for good (task completion). Not subject to micro correction. */
    void closeFinal(Timestamp ts, TimerOutcome& outcome);

private:
    enum class CloseKind {
        Explicit, // stop(): zero length is an error
        Implicit, // switch: zero length is dropped
        Final     // lifecycle end: zero length is dropped, no look-back mark
    };

    void closeOpen(Timestamp ts, CloseKind kind, TimerOutcome& outcome);
    void openFor(TaskId id, Timestamp ts, TimerOutcome& outcome);
    void resolveOverlaps(Timestamp start, std::optional<Timestamp> end, Timestamp recordedAt);
    void forgetBoundary(SessionId id);
    void warnIfShort(TimerOutcome& outcome, bool provisional) const;

    FactSet& m_facts;
    EventLog& m_events;
    MicroSessionPolicy m_policy;
};

} // namespace taskwalker::domain
