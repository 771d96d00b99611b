/**
 * @file PlaylistRepository.hpp
 * @brief Interface for storing downloaded playlists and their reports.
 */

#pragma once
#include <stdexcept>
#include <string>
#include "PlaylistEntry.hpp"

namespace streamsieve::domain {

/**
 * @class PersistError
 * @brief Raised when playlist data could not be read from or written to storage.
 */
class PersistError : public std::runtime_error {
public:
    PersistError(const std::string& path, const std::string& cause)
        : std::runtime_error("Storage error on " + path + ": " + cause), m_path(path) {}

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/**
 * @class PlaylistRepository
 * @brief Abstract storage keyed by playlist name.
 *
 * Calls for different names may run concurrently; a name is only ever handled by one
 * caller at a time.
 */
class PlaylistRepository {
public:
    virtual ~PlaylistRepository() = default;

    /**
     * @brief Stores the raw text of a downloaded playlist.
     * @throws PersistError
     */
    virtual void saveRawPlaylist(const std::string& name, const std::string& content) = 0;

    /**
     * @brief Loads a playlist previously stored with saveRawPlaylist().
     * @throws PersistError if it is missing or unreadable.
     */
    virtual std::string loadRawPlaylist(const std::string& name) = 0;

    /**
     * @brief Persists both partitions of a report. Each output is replaced atomically.
     * @throws PersistError
     */
    virtual void saveReport(const PlaylistReport& report) = 0;
};

} // namespace streamsieve::domain
