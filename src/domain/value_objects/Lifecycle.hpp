/**
 * @file Lifecycle.hpp
 * @brief Value Object for the lifecycle of a task.
 */

#pragma once

#include <string>

namespace taskwalker::domain {

/**
 * @enum Lifecycle
 * @brief Closed and Cancelled are terminal.
 */
enum class Lifecycle {
    Open,
    Closed,
    Cancelled
};

inline std::string LifecycleToString(Lifecycle lifecycle) {
    switch (lifecycle) {
        case Lifecycle::Open: return "open";
        case Lifecycle::Closed: return "closed";
        case Lifecycle::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

inline Lifecycle LifecycleFromString(const std::string& value) {
    if (value == "closed") return Lifecycle::Closed;
    if (value == "cancelled") return Lifecycle::Cancelled;
    return Lifecycle::Open;
}

inline bool IsTerminal(Lifecycle lifecycle) {
    return lifecycle == Lifecycle::Closed || lifecycle == Lifecycle::Cancelled;
}

} // namespace taskwalker::domain
