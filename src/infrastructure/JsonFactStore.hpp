/**
 * @file JsonFactStore.hpp
 * @brief File system implementation of the FactStore.
 */

#pragma once

#include <filesystem>

#include "domain/repositories/FactStore.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace taskwalker::infrastructure {

/**
 * @class JsonFactStore
 * @brief Keeps the fact tables in one JSON snapshot and appends events to an NDJSON journal.
 *
 * Layout under the data directory:
 * - facts.json     : committed state, replaced atomically on every commit
 * - journal.ndjson : one line per domain event (audit trail, never read back)
 * - .lock          : advisory lock held by the active writer
 */
class JsonFactStore : public domain::FactStore {
public:
    explicit JsonFactStore(std::filesystem::path dataDir);

    std::unique_ptr<domain::WriteLock> acquireWriteLock() override;
    domain::FactSet load() override;
    void commit(const domain::FactSet& facts, const domain::EventLog& events) override;

    std::filesystem::path factsPath() const { return m_dataDir / "facts.json"; }
    std::filesystem::path journalPath() const { return m_dataDir / "journal.ndjson"; }
    std::filesystem::path lockPath() const { return m_dataDir / ".lock"; }

private:
    void ensureDataDir() const;

    std::filesystem::path m_dataDir;
    PersistenceService m_persistence;
};

} // namespace taskwalker::infrastructure
