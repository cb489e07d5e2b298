/**
 * @file FileLock.hpp
 * @brief Exclusive advisory lock on a file, held for the lifetime of the object.
 */

#pragma once

#include <filesystem>

#include "domain/repositories/FactStore.hpp"

namespace taskwalker::infrastructure {

/**
 * @class FileLock
 * @brief flock(LOCK_EX) on a lock file. Blocks until the lock is granted.
 *
 * Each instance opens its own descriptor, so two locks taken in one process
 * exclude each other just like two processes do.
 */
class FileLock : public domain::WriteLock {
public:
    explicit FileLock(const std::filesystem::path& path);
    ~FileLock() override;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int m_fd = -1;
};

} // namespace taskwalker::infrastructure
