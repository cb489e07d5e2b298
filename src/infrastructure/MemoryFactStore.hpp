/**
 * @file MemoryFactStore.hpp
 * @brief Volatile FactStore used by tests and dry runs.
 */

#pragma once

#include <mutex>

#include "domain/repositories/FactStore.hpp"

namespace taskwalker::infrastructure {

class MemoryFactStore : public domain::FactStore {
public:
    std::unique_ptr<domain::WriteLock> acquireWriteLock() override;
    domain::FactSet load() override;
    void commit(const domain::FactSet& facts, const domain::EventLog& events) override;

    // Every event committed so far, oldest first
    domain::EventLog journal() const;
    int commitCount() const;

private:
    std::mutex m_writeMutex; // held by the WriteLock across a transaction
    mutable std::mutex m_stateMutex;
    domain::FactSet m_facts;
    domain::EventLog m_journal;
    int m_commits = 0;
};

} // namespace taskwalker::infrastructure
