/**
 * @file Annotation.hpp
 * @brief Append-only note attached to a task.
 */

#pragma once

#include <optional>
#include <string>

#include "../value_objects/Timestamp.hpp"

namespace taskwalker::domain {

struct Annotation {
    std::int64_t id = 0;
    TaskId taskId = 0;
    std::optional<SessionId> sessionId; ///< Session running when the note was taken, if any.
    std::string note;
    Timestamp entryTs = 0;
};

} // namespace taskwalker::domain
