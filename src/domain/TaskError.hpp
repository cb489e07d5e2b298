/**
 * @file TaskError.hpp
 * @brief Error kinds raised by the tracker core.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taskwalker::domain {

/**
 * @enum ErrorKind
 * @brief Classifies a failed operation. Everything except StoreUnavailable is a user mistake.
 */
enum class ErrorKind {
    InvariantViolation,
    EmptyQueue,
    AlreadyRunning,
    NotRunning,
    NoSuchTask,
    NoWaitingRecord,
    TerminalLifecycle,
    NonChronological,
    StoreUnavailable
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvariantViolation: return "InvariantViolation";
        case ErrorKind::EmptyQueue: return "EmptyQueue";
        case ErrorKind::AlreadyRunning: return "AlreadyRunning";
        case ErrorKind::NotRunning: return "NotRunning";
        case ErrorKind::NoSuchTask: return "NoSuchTask";
        case ErrorKind::NoWaitingRecord: return "NoWaitingRecord";
        case ErrorKind::TerminalLifecycle: return "TerminalLifecycle";
        case ErrorKind::NonChronological: return "NonChronological";
        case ErrorKind::StoreUnavailable: return "StoreUnavailable";
        default: return "Unknown";
    }
}

/**
 * @class TaskError
 * @brief Exception carrying an ErrorKind. Thrown inside a transaction it aborts the commit.
 */
class TaskError : public std::runtime_error {
public:
    TaskError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

    /** @brief True for storage-layer faults, false for rejected user input. */
    bool isSystemFault() const { return m_kind == ErrorKind::StoreUnavailable; }

private:
    ErrorKind m_kind;
};

} // namespace taskwalker::domain
