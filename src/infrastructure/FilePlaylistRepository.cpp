/**
 * @file FilePlaylistRepository.cpp
 * @brief Implementation of the FilePlaylistRepository class.
 */
#include "infrastructure/FilePlaylistRepository.hpp"

namespace fs = std::filesystem;

namespace streamsieve::infrastructure {

namespace {
constexpr const char* kPlaylistExtension = ".m3u";
constexpr const char* kAvailablePrefix = "available_";
constexpr const char* kUnavailablePrefix = "unavailable_";
}

FilePlaylistRepository::FilePlaylistRepository(const std::string& playlistDir, const std::string& outputDir,
                                               std::shared_ptr<PersistenceService> persistence)
    : m_playlistDir(playlistDir), m_outputDir(outputDir), m_persistence(std::move(persistence)) {
    m_persistence->ensureDirectory(m_playlistDir);
    m_persistence->ensureDirectory(m_outputDir);
}

fs::path FilePlaylistRepository::rawPlaylistPath(const std::string& name) const {
    return m_playlistDir / (name + kPlaylistExtension);
}

fs::path FilePlaylistRepository::availablePath(const std::string& name) const {
    return m_outputDir / (kAvailablePrefix + name + kPlaylistExtension);
}

fs::path FilePlaylistRepository::unavailablePath(const std::string& name) const {
    return m_outputDir / (kUnavailablePrefix + name + kPlaylistExtension);
}

void FilePlaylistRepository::saveRawPlaylist(const std::string& name, const std::string& content) {
    m_persistence->writeTextAtomic(rawPlaylistPath(name), content);
}

std::string FilePlaylistRepository::loadRawPlaylist(const std::string& name) {
    return m_persistence->readText(rawPlaylistPath(name));
}

void FilePlaylistRepository::saveReport(const domain::PlaylistReport& report) {
    m_persistence->writeTextAtomic(availablePath(report.name), FormatEntries(report.available));
    m_persistence->writeTextAtomic(unavailablePath(report.name), FormatEntries(report.unavailable));
}

std::string FilePlaylistRepository::FormatEntries(const std::vector<domain::PlaylistEntry>& entries) {
    std::string out;
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) out += '\n';
        out += entries[i].metadata;
        out += '\n';
        out += entries[i].url;
    }
    return out;
}

} // namespace streamsieve::infrastructure
