/**
 * @file Classification.cpp
 * @brief Default classification table and the lookup function.
 */

#include "domain/services/Classification.hpp"

#include <utility>

#include "domain/TaskError.hpp"

namespace taskwalker::domain {

namespace {

Classification Row(Status status, const char* label, int sortOrder, const char* color) {
    return Classification{status, label, sortOrder, color};
}

Classification DefaultRow(PrecedenceTier tier, bool queued, bool hasHistory) {
    switch (tier) {
        case PrecedenceTier::Completed: return Row(Status::Completed, "completed", 6, "bright_black");
        case PrecedenceTier::Cancelled: return Row(Status::Cancelled, "cancelled", 7, "bright_black");
        case PrecedenceTier::Active: return Row(Status::Active, "active", 5, "green");
        case PrecedenceTier::External: return Row(Status::External, "external", 3, "magenta");
        case PrecedenceTier::Open:
        default:
            break;
    }
    if (queued) {
        return hasHistory ? Row(Status::InProgress, "in progress", 4, "cyan")
                          : Row(Status::Planned, "planned", 1, "blue");
    }
    return hasHistory ? Row(Status::Suspended, "suspended", 2, "yellow")
                      : Row(Status::Proposed, "proposed", 0, "bright_black");
}

} // namespace

ClassificationTable ClassificationTable::Defaults() {
    ClassificationTable table;
    const PrecedenceTier tiers[] = {
        PrecedenceTier::Completed, PrecedenceTier::Cancelled, PrecedenceTier::Active,
        PrecedenceTier::External, PrecedenceTier::Open};
    for (PrecedenceTier tier : tiers) {
        for (bool queued : {false, true}) {
            for (bool hasHistory : {false, true}) {
                table.m_rows[ClassificationKey{tier, queued, hasHistory}] = DefaultRow(tier, queued, hasHistory);
            }
        }
    }
    return table;
}

void ClassificationTable::set(const ClassificationKey& key, Classification entry) {
    m_rows[key] = std::move(entry);
}

const Classification& ClassificationTable::lookup(const ClassificationKey& key) const {
    auto it = m_rows.find(key);
    if (it == m_rows.end()) {
        // Unreachable while the table is built from Defaults().
        throw TaskError(ErrorKind::InvariantViolation,
                        "No classification row for tier " + PrecedenceTierToString(key.tier));
    }
    return it->second;
}

PrecedenceTier TierOf(const TaskFacts& facts) {
    if (facts.lifecycle == Lifecycle::Closed) return PrecedenceTier::Completed;
    if (facts.lifecycle == Lifecycle::Cancelled) return PrecedenceTier::Cancelled;
    if (facts.timerOn) return PrecedenceTier::Active;
    if (facts.externalWaiting) return PrecedenceTier::External;
    return PrecedenceTier::Open;
}

ClassificationKey KeyOf(const TaskFacts& facts) {
    return ClassificationKey{TierOf(facts), facts.queued, facts.hasHistory};
}

const Classification& Classify(const TaskFacts& facts, const ClassificationTable& table) {
    return table.lookup(KeyOf(facts));
}

} // namespace taskwalker::domain
