/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

#include "domain/TaskError.hpp"

namespace taskwalker::infrastructure {

namespace fs = std::filesystem;
using domain::ErrorKind;
using domain::TaskError;

void PersistenceService::ensureParent(const fs::path& path) const {
    if (!path.has_parent_path()) return;
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw TaskError(ErrorKind::StoreUnavailable,
                        "Cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }
}

void PersistenceService::writeAtomic(const fs::path& path, const std::string& content) const {
    ensureParent(path);

    // Unique temp path: filename.<timestamp>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = path;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw TaskError(ErrorKind::StoreUnavailable, "Failed to open temp file: " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw TaskError(ErrorKind::StoreUnavailable, "Write failed: " + tempPath.string());
        }
    }

    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw TaskError(ErrorKind::StoreUnavailable, "Rename failed for " + path.string() + ": " + ec.message());
    }
}

bool PersistenceService::appendText(const fs::path& path, const std::string& text) const {
    try {
        ensureParent(path);
    } catch (const TaskError& e) {
        std::cerr << "[PersistenceService] " << e.what() << std::endl;
        return false;
    }

    std::ofstream ofs(path, std::ios::binary | std::ios::app);
    if (!ofs.is_open()) {
        std::cerr << "[PersistenceService] Failed to open for append: " << path << std::endl;
        return false;
    }
    ofs << text;
    ofs.flush();
    if (ofs.fail()) {
        std::cerr << "[PersistenceService] Append failed: " << path << std::endl;
        return false;
    }
    return true;
}

std::string PersistenceService::readText(const fs::path& path) const {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        throw TaskError(ErrorKind::StoreUnavailable, "Cannot open " + path.string());
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw TaskError(ErrorKind::StoreUnavailable, "Read failed: " + path.string());
    }
    return buffer.str();
}

} // namespace taskwalker::infrastructure
