/**
 * @file Timestamp.hpp
 * @brief Absolute instants used by the tracker (UTC seconds since the epoch).
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace taskwalker::domain {

using Timestamp = std::int64_t;
using TaskId = std::int64_t;
using SessionId = std::int64_t;

/** @brief Current wall-clock time truncated to whole seconds. */
inline Timestamp NowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace taskwalker::domain
