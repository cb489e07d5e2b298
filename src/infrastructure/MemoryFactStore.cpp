/**
 * @file MemoryFactStore.cpp
 * @brief Implementation of MemoryFactStore.
 */

#include "infrastructure/MemoryFactStore.hpp"

namespace taskwalker::infrastructure {

namespace {

class MutexWriteLock : public domain::WriteLock {
public:
    explicit MutexWriteLock(std::mutex& mutex) : m_lock(mutex) {}

private:
    std::unique_lock<std::mutex> m_lock;
};

} // namespace

std::unique_ptr<domain::WriteLock> MemoryFactStore::acquireWriteLock() {
    return std::make_unique<MutexWriteLock>(m_writeMutex);
}

domain::FactSet MemoryFactStore::load() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_facts;
}

void MemoryFactStore::commit(const domain::FactSet& facts, const domain::EventLog& events) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_facts = facts;
    m_journal.insert(m_journal.end(), events.begin(), events.end());
    ++m_commits;
}

domain::EventLog MemoryFactStore::journal() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_journal;
}

int MemoryFactStore::commitCount() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_commits;
}

} // namespace taskwalker::infrastructure
