/**
 * @file Classification.hpp
 * @brief Derives the single user-facing status of a task from its stored facts.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <tuple>

#include "domain/FactSet.hpp"

namespace taskwalker::domain {

enum class Status {
    Proposed,
    Planned,
    InProgress,
    Suspended,
    External,
    Active,
    Completed,
    Cancelled
};

inline std::string StatusToString(Status status) {
    switch (status) {
        case Status::Proposed: return "proposed";
        case Status::Planned: return "planned";
        case Status::InProgress: return "in_progress";
        case Status::Suspended: return "suspended";
        case Status::External: return "external";
        case Status::Active: return "active";
        case Status::Completed: return "completed";
        case Status::Cancelled: return "cancelled";
        default: return "proposed";
    }
}

inline std::optional<Status> StatusFromString(const std::string& str) {
    if (str == "proposed") return Status::Proposed;
    if (str == "planned") return Status::Planned;
    if (str == "in_progress") return Status::InProgress;
    if (str == "suspended") return Status::Suspended;
    if (str == "external") return Status::External;
    if (str == "active") return Status::Active;
    if (str == "completed") return Status::Completed;
    if (str == "cancelled") return Status::Cancelled;
    return std::nullopt;
}

/**
 * @enum PrecedenceTier
 * @brief First matching rule wins: lifecycle, then timer, then handoff, then queue/history.
 */
enum class PrecedenceTier {
    Completed,
    Cancelled,
    Active,
    External,
    Open
};

inline std::string PrecedenceTierToString(PrecedenceTier tier) {
    switch (tier) {
        case PrecedenceTier::Completed: return "completed";
        case PrecedenceTier::Cancelled: return "cancelled";
        case PrecedenceTier::Active: return "active";
        case PrecedenceTier::External: return "external";
        case PrecedenceTier::Open: return "open";
        default: return "open";
    }
}

inline std::optional<PrecedenceTier> PrecedenceTierFromString(const std::string& str) {
    if (str == "completed") return PrecedenceTier::Completed;
    if (str == "cancelled") return PrecedenceTier::Cancelled;
    if (str == "active") return PrecedenceTier::Active;
    if (str == "external") return PrecedenceTier::External;
    if (str == "open") return PrecedenceTier::Open;
    return std::nullopt;
}

struct ClassificationKey {
    PrecedenceTier tier = PrecedenceTier::Open;
    bool queued = false;
    bool hasHistory = false;

    bool operator<(const ClassificationKey& other) const {
        return std::tie(tier, queued, hasHistory) < std::tie(other.tier, other.queued, other.hasHistory);
    }
};

/**
 * @struct Classification
 * @brief One row of the table: the status plus its display attributes.
 */
struct Classification {
    Status status = Status::Proposed;
    std::string label;
    int sortOrder = 0;
    std::string color;
};

/**
 * @class ClassificationTable
 * @brief Replaceable lookup table keyed by (tier, queued, history).
 *
 * Defaults() covers every key, and set() only replaces rows, so lookup() is total.
 */
class ClassificationTable {
public:
    static ClassificationTable Defaults();

    /** @brief Overrides a single row. */
    void set(const ClassificationKey& key, Classification entry);

    const Classification& lookup(const ClassificationKey& key) const;

    std::size_t size() const { return m_rows.size(); }

private:
    ClassificationTable() = default;

    std::map<ClassificationKey, Classification> m_rows;
};

PrecedenceTier TierOf(const TaskFacts& facts);

ClassificationKey KeyOf(const TaskFacts& facts);

/** @brief Pure: same facts and table always give the same row. */
const Classification& Classify(const TaskFacts& facts, const ClassificationTable& table);

} // namespace taskwalker::domain
