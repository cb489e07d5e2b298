/**
 * @file LifecycleManager.hpp
 * @brief Terminal transitions (complete, cancel) with their queue/timer/handoff clean-up.
 */

#pragma once

#include "domain/FactSet.hpp"
#include "domain/events/TaskEvents.hpp"
#include "domain/services/TimerEngine.hpp"

namespace taskwalker::domain {

class LifecycleManager {
public:
    LifecycleManager(FactSet& facts, EventLog& events, MicroSessionPolicy policy);

    // Closes the task; a running timer on it is stopped at ts in the same transaction.
    TimerOutcome complete(TaskId id, Timestamp ts);

    TimerOutcome cancel(TaskId id, Timestamp ts);

    // Completes the actively timed task and optionally starts timing the new queue front at ts.
    TimerOutcome completeCurrent(bool startNext, Timestamp ts);

private:
    TimerOutcome finish(TaskId id, Lifecycle target, Timestamp ts);

    FactSet& m_facts;
    EventLog& m_events;
    MicroSessionPolicy m_policy;
};

} // namespace taskwalker::domain
