/**
 * @file PersistenceService.hpp
 * @brief Atomic file I/O used by the on-disk fact store.
 */

#pragma once
#include <filesystem>
#include <string>

namespace taskwalker::infrastructure {

/**
 * @class PersistenceService
 * @brief Synchronous writes: a commit returns only once its file is in place.
 *
 * Failures are reported as TaskError(StoreUnavailable) so the caller's
 * transaction is known not to have committed.
 */
class PersistenceService {
public:
    /**
     * @brief Replaces @p path with @p content via temp file + rename.
     * Readers see either the old or the new file, never a partial one.
     */
    void writeAtomic(const std::filesystem::path& path, const std::string& content) const;

    /**
     * @brief Appends lines to a log file, creating it if needed.
     * @return false if the file could not be written (the failure is logged).
     */
    bool appendText(const std::filesystem::path& path, const std::string& text) const;

    /** @brief Whole file as a string. Throws StoreUnavailable when it cannot be read. */
    std::string readText(const std::filesystem::path& path) const;

private:
    void ensureParent(const std::filesystem::path& path) const;
};

} // namespace taskwalker::infrastructure
