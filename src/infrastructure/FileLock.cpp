/**
 * @file FileLock.cpp
 * @brief Implementation of FileLock.
 */

#include "infrastructure/FileLock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include "domain/TaskError.hpp"

namespace taskwalker::infrastructure {

using domain::ErrorKind;
using domain::TaskError;

FileLock::FileLock(const std::filesystem::path& path) {
    m_fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (m_fd < 0) {
        throw TaskError(ErrorKind::StoreUnavailable,
                        "Cannot open lock file " + path.string() + ": " + std::strerror(errno));
    }

    int rc;
    do {
        rc = ::flock(m_fd, LOCK_EX);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        const std::string reason = std::strerror(errno);
        ::close(m_fd);
        m_fd = -1;
        throw TaskError(ErrorKind::StoreUnavailable, "Cannot lock " + path.string() + ": " + reason);
    }
}

FileLock::~FileLock() {
    if (m_fd >= 0) {
        ::flock(m_fd, LOCK_UN);
        ::close(m_fd);
    }
}

} // namespace taskwalker::infrastructure
