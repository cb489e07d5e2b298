/**
 * @file MicroSessionPolicy.cpp
 * @brief Implementation of MicroSessionPolicy.
 */

#include "domain/services/MicroSessionPolicy.hpp"

namespace taskwalker::domain {

MicroDecision MicroSessionPolicy::decide(const WorkSession& previous, TaskId nextTask, Timestamp nextStart) const {
    MicroDecision decision;
    if (previous.isOpen()) return decision;

    decision.gapSecs = nextStart - *previous.endTs;
    decision.durationSecs = *previous.endTs - previous.startTs;
    if (decision.gapSecs < 0) return decision;

    const bool withinGap = decision.gapSecs < thresholdSecs;

    if (previous.taskId == nextTask) {
        if (mergeEnabled && withinGap) decision.resolution = MicroResolution::Merged;
        return decision;
    }

    if (!purgeEnabled) return decision;

    bool purge = false;
    switch (purgeTrigger) {
        case PurgeTrigger::DurationAndGap:
            purge = isMicro(decision.durationSecs) && withinGap;
            break;
        case PurgeTrigger::Duration:
            purge = isMicro(decision.durationSecs);
            break;
        case PurgeTrigger::Gap:
            purge = withinGap;
            break;
    }
    if (purge) decision.resolution = MicroResolution::Purged;
    return decision;
}

} // namespace taskwalker::domain
