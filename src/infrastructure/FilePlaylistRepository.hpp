/**
 * @file FilePlaylistRepository.hpp
 * @brief Filesystem-based implementation of the PlaylistRepository.
 */

#pragma once
#include "domain/PlaylistRepository.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace streamsieve::infrastructure {

/**
 * @class FilePlaylistRepository
 * @brief Keeps raw playlists as "<name>.m3u" and reports as
 *        "available_<name>.m3u" / "unavailable_<name>.m3u".
 */
class FilePlaylistRepository : public domain::PlaylistRepository {
public:
    /**
     * @brief Constructor; creates both directories if they do not exist yet.
     * @param playlistDir Directory for downloaded playlists.
     * @param outputDir Directory for processed partitions.
     * @throws domain::PersistError if a directory cannot be created.
     */
    FilePlaylistRepository(const std::string& playlistDir, const std::string& outputDir,
                           std::shared_ptr<PersistenceService> persistence);

    /** @see domain::PlaylistRepository::saveRawPlaylist */
    void saveRawPlaylist(const std::string& name, const std::string& content) override;

    /** @see domain::PlaylistRepository::loadRawPlaylist */
    std::string loadRawPlaylist(const std::string& name) override;

    /** @brief Writes both partition files. @see domain::PlaylistRepository::saveReport */
    void saveReport(const domain::PlaylistReport& report) override;

    std::filesystem::path rawPlaylistPath(const std::string& name) const;
    std::filesystem::path availablePath(const std::string& name) const;
    std::filesystem::path unavailablePath(const std::string& name) const;

    /** @brief Output format: "<metadata>\n<url>" per entry, entries joined by '\n'. */
    static std::string FormatEntries(const std::vector<domain::PlaylistEntry>& entries);

private:
    std::filesystem::path m_playlistDir; ///< Raw downloads.
    std::filesystem::path m_outputDir;   ///< Processed partitions.
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace streamsieve::infrastructure
