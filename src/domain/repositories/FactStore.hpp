/**
 * @file FactStore.hpp
 * @brief Interface for durable storage of the fact tables.
 */

#pragma once

#include <memory>

#include "../FactSet.hpp"
#include "../events/TaskEvents.hpp"

namespace taskwalker::domain {

/**
 * @class WriteLock
 * @brief Held for the whole of a write transaction; released on destruction.
 */
class WriteLock {
public:
    virtual ~WriteLock() = default;
};

/**
 * @class FactStore
 * @brief Single-writer transactional store. Implementations raise TaskError(StoreUnavailable) on I/O faults.
 */
class FactStore {
public:
    virtual ~FactStore() = default;

    // Blocks until no other writer holds the store
    virtual std::unique_ptr<WriteLock> acquireWriteLock() = 0;

    // Reads the last committed state
    virtual FactSet load() = 0;

    // Durably replaces the committed state and records the events that produced it
    virtual void commit(const FactSet& facts, const EventLog& events) = 0;
};

} // namespace taskwalker::domain
