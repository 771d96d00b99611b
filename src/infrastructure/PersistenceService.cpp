/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include "domain/PlaylistRepository.hpp"
#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace streamsieve::infrastructure {

namespace fs = std::filesystem;

fs::path PersistenceService::makeTempPath(const fs::path& target) {
    // filename.<timestamp>.<sequence>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = target;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(m_sequence++) + ".tmp";
    return tempPath;
}

void PersistenceService::ensureDirectory(const fs::path& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw domain::PersistError(dir.string(), ec.message());
    }
}

void PersistenceService::writeTextAtomic(const fs::path& target, const std::string& content) {
    // 1. Ensure directory exists
    if (target.has_parent_path()) {
        ensureDirectory(target.parent_path());
    }

    // 2. Write to Temp
    fs::path tempPath = makeTempPath(target);
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            throw domain::PersistError(target.string(), "cannot open temporary file " + tempPath.string());
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            ofs.close();
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw domain::PersistError(target.string(), "write failed");
        }
    }

    // 3. Atomic Rename
    std::error_code ec;
    fs::rename(tempPath, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw domain::PersistError(target.string(), "rename failed: " + ec.message());
    }
}

std::string PersistenceService::readText(const fs::path& source) const {
    std::ifstream file(source, std::ios::binary);
    if (!file.is_open()) {
        throw domain::PersistError(source.string(), "cannot open for reading");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw domain::PersistError(source.string(), "read failed");
    }
    return buffer.str();
}

} // namespace streamsieve::infrastructure
