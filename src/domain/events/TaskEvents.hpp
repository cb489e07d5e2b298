/**
 * @file TaskEvents.hpp
 * @brief Domain Events emitted by tracker transactions.
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../value_objects/Lifecycle.hpp"
#include "../value_objects/Timestamp.hpp"

namespace taskwalker::domain {

struct TaskCreated {
    static constexpr const char* Type = "TaskCreated";
    TaskId taskId;
    std::string description;
    Timestamp timestamp;
};

struct TaskDetailsUpdated {
    static constexpr const char* Type = "TaskDetailsUpdated";
    TaskId taskId;
    std::string description;
    Timestamp timestamp;
};

struct TaskQueued {
    static constexpr const char* Type = "TaskQueued";
    TaskId taskId;
    int position;
    Timestamp timestamp;
};

struct TaskDequeued {
    static constexpr const char* Type = "TaskDequeued";
    TaskId taskId;
    Timestamp timestamp;
};

struct QueueReordered {
    static constexpr const char* Type = "QueueReordered";
    TaskId taskId; // front after reordering
    std::vector<TaskId> order;
    Timestamp timestamp;
};

struct SessionOpened {
    static constexpr const char* Type = "SessionOpened";
    TaskId taskId;
    SessionId sessionId;
    Timestamp startTs;
    Timestamp timestamp;
};

struct SessionClosed {
    static constexpr const char* Type = "SessionClosed";
    TaskId taskId;
    SessionId sessionId;
    Timestamp startTs;
    Timestamp endTs;
    Timestamp timestamp;
};

struct SessionAmended {
    static constexpr const char* Type = "SessionAmended";
    TaskId taskId;
    SessionId sessionId;
    Timestamp oldStartTs;
    std::optional<Timestamp> oldEndTs;
    Timestamp newStartTs;
    std::optional<Timestamp> newEndTs;
    Timestamp timestamp;
};

struct SessionRemoved {
    static constexpr const char* Type = "SessionRemoved";
    TaskId taskId;
    SessionId sessionId;
    Timestamp timestamp;
};

struct MicroSessionMerged {
    static constexpr const char* Type = "MicroSessionMerged";
    TaskId taskId;
    SessionId sessionId;
    std::int64_t gapSecs;
    Timestamp timestamp;
};

struct MicroSessionPurged {
    static constexpr const char* Type = "MicroSessionPurged";
    TaskId taskId;
    SessionId sessionId;
    std::int64_t durationSecs;
    Timestamp timestamp;
};

struct ExternalSent {
    static constexpr const char* Type = "ExternalSent";
    TaskId taskId;
    std::string recipient;
    std::optional<std::string> note;
    Timestamp timestamp;
};

struct ExternalReturned {
    static constexpr const char* Type = "ExternalReturned";
    TaskId taskId;
    std::string recipient;
    Timestamp timestamp;
};

struct LifecycleChanged {
    static constexpr const char* Type = "LifecycleChanged";
    TaskId taskId;
    Lifecycle oldLifecycle;
    Lifecycle newLifecycle;
    Timestamp timestamp;
};

struct TaskAnnotated {
    static constexpr const char* Type = "TaskAnnotated";
    TaskId taskId;
    std::int64_t annotationId;
    std::optional<SessionId> sessionId;
    Timestamp timestamp;
};

// variant for generic handling
using TaskEvent = std::variant<
    TaskCreated,
    TaskDetailsUpdated,
    TaskQueued,
    TaskDequeued,
    QueueReordered,
    SessionOpened,
    SessionClosed,
    SessionAmended,
    SessionRemoved,
    MicroSessionMerged,
    MicroSessionPurged,
    ExternalSent,
    ExternalReturned,
    LifecycleChanged,
    TaskAnnotated
>;

using EventLog = std::vector<TaskEvent>;

} // namespace taskwalker::domain
