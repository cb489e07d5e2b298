/**
 * @file MicroSessionPolicy.hpp
 * @brief Merge/purge rules for very short work sessions.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "domain/entities/WorkSession.hpp"

namespace taskwalker::domain {

/**
 * @enum PurgeTrigger
 * @brief Which measurement decides that a short session before a task switch is discarded.
 */
enum class PurgeTrigger {
    DurationAndGap, ///< Session shorter than the threshold and the switch happens within the threshold.
    Duration,       ///< Session shorter than the threshold, however late the switch happens.
    Gap             ///< Switch within the threshold of the stop, whatever the session length.
};

inline std::string PurgeTriggerToString(PurgeTrigger trigger) {
    switch (trigger) {
        case PurgeTrigger::DurationAndGap: return "duration_and_gap";
        case PurgeTrigger::Duration: return "duration";
        case PurgeTrigger::Gap: return "gap";
        default: return "unknown";
    }
}

inline std::optional<PurgeTrigger> PurgeTriggerFromString(const std::string& value) {
    if (value == "duration_and_gap") return PurgeTrigger::DurationAndGap;
    if (value == "duration") return PurgeTrigger::Duration;
    if (value == "gap") return PurgeTrigger::Gap;
    return std::nullopt;
}

enum class MicroResolution {
    None,
    Merged,
    Purged
};

/**
 * @struct MicroDecision
 * @brief Outcome of looking back at the last closed session when a new one starts.
 */
struct MicroDecision {
    MicroResolution resolution = MicroResolution::None;
    std::int64_t gapSecs = 0;      ///< Next start minus the previous close.
    std::int64_t durationSecs = 0; ///< Length of the previously closed session.
};

/**
 * @struct MicroSessionPolicy
 * @brief Configurable thresholds. Defaults: 30s, merge and purge on, purge keyed on duration and gap.
 */
struct MicroSessionPolicy {
    std::int64_t thresholdSecs = 30;
    bool mergeEnabled = true;
    bool purgeEnabled = true;
    PurgeTrigger purgeTrigger = PurgeTrigger::DurationAndGap;

    bool isMicro(std::int64_t durationSecs) const { return durationSecs < thresholdSecs; }

    /**
     * @brief Decides what happens to @p previous when @p nextTask starts at @p nextStart.
     *
     * Same task within the threshold: merge. Different task: purge according to
     * purgeTrigger. A start earlier than the previous close never resolves.
     */
    MicroDecision decide(const WorkSession& previous, TaskId nextTask, Timestamp nextStart) const;
};

} // namespace taskwalker::domain
