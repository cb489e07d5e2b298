/**
 * @file InvariantGuard.hpp
 * @brief Validation gate run on the working FactSet before every commit.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/FactSet.hpp"

namespace taskwalker::domain {

/**
 * @class InvariantGuard
 * @brief Checks the cross-fact invariants of the store.
 *
 * - at most one open session store-wide;
 * - a timed task sits at queue position 0;
 * - a handed-off task with its timer off is not queued;
 * - a closed or cancelled task is neither queued, timed nor waiting;
 * - queued positions are exactly 0..n-1;
 * - closed sessions end strictly after they start;
 * - every session, external record and annotation references an existing task.
 */
class InvariantGuard {
public:
    /** @brief Lists every violated invariant; empty when the facts are consistent. */
    static std::vector<std::string> FindViolations(const FactSet& facts);

    /** @brief Throws TaskError(InvariantViolation) describing the violations, if any. */
    static void Validate(const FactSet& facts);
};

} // namespace taskwalker::domain
