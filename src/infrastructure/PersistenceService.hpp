/**
 * @file PersistenceService.hpp
 * @brief Atomic text file I/O shared by the repositories.
 */

#pragma once
#include <atomic>
#include <filesystem>
#include <string>

namespace streamsieve::infrastructure {

/**
 * @class PersistenceService
 * @brief Writes files through a temporary sibling and a rename, so readers only ever
 *        see a complete old or a complete new file.
 *
 * Safe to call from several threads as long as they target different files.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Replaces @p target with @p content atomically, creating parent directories.
     * @throws domain::PersistError
     */
    void writeTextAtomic(const std::filesystem::path& target, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @throws domain::PersistError if it is missing or unreadable.
     */
    std::string readText(const std::filesystem::path& source) const;

    /**
     * @brief Creates a directory (and parents) if absent.
     * @throws domain::PersistError
     */
    void ensureDirectory(const std::filesystem::path& dir) const;

private:
    std::filesystem::path makeTempPath(const std::filesystem::path& target);

    std::atomic<unsigned long> m_sequence{0};
};

} // namespace streamsieve::infrastructure
