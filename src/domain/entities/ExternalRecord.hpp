/**
 * @file ExternalRecord.hpp
 * @brief Entity recording that a task was handed off to a third party.
 */

#pragma once

#include <optional>
#include <string>

#include "../value_objects/Timestamp.hpp"

namespace taskwalker::domain {

enum class ExternalStatus {
    Waiting,
    Returned
};

inline std::string ExternalStatusToString(ExternalStatus status) {
    return status == ExternalStatus::Waiting ? "waiting" : "returned";
}

inline ExternalStatus ExternalStatusFromString(const std::string& value) {
    return value == "returned" ? ExternalStatus::Returned : ExternalStatus::Waiting;
}

/**
 * @struct ExternalRecord
 * @brief Returned records are kept for history; only Waiting ones count as handed off.
 */
struct ExternalRecord {
    std::int64_t id = 0;
    TaskId taskId = 0;
    std::string recipient;
    std::optional<std::string> note;
    Timestamp sentAt = 0;
    ExternalStatus status = ExternalStatus::Waiting;
    std::optional<Timestamp> returnedAt;

    bool isWaiting() const { return status == ExternalStatus::Waiting; }
};

} // namespace taskwalker::domain
