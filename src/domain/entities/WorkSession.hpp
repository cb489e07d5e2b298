/**
 * @file WorkSession.hpp
 * @brief Entity representing a start/stop bounded interval of work on one task.
 */

#pragma once

#include <optional>

#include "../value_objects/Timestamp.hpp"

namespace taskwalker::domain {

struct WorkSession {
    SessionId id = 0;
    TaskId taskId = 0;
    Timestamp startTs = 0;
    std::optional<Timestamp> endTs; ///< Absent while the session is running.

    bool isOpen() const { return !endTs.has_value(); }

    /** @brief Elapsed seconds; for an open session measured up to @p now. */
    std::int64_t duration(Timestamp now) const {
        return (endTs ? *endTs : now) - startTs;
    }
};

} // namespace taskwalker::domain
