/**
 * @file PlaylistEntry.hpp
 * @brief Playlist entries, probe classification and per-playlist reports.
 */

#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace streamsieve::domain {

/**
 * @struct PlaylistEntry
 * @brief One playable item: the metadata line that preceded a URL line, and the URL.
 */
struct PlaylistEntry {
    std::string metadata; ///< "#EXTINF..." line, or empty when the URL had none.
    std::string url;      ///< Stream location, never empty.

    bool operator==(const PlaylistEntry& other) const {
        return metadata == other.metadata && url == other.url;
    }
    bool operator!=(const PlaylistEntry& other) const { return !(*this == other); }
};

/**
 * @enum ProbeResult
 * @brief Outcome of a liveness check against a single URL.
 */
enum class ProbeResult {
    Reachable,   ///< Completed with a success status.
    Unreachable, ///< Completed with any other status.
    ProbeFailed  ///< The check itself could not complete (timeout, DNS, refused).
};

inline const char* ProbeResultToString(ProbeResult result) {
    switch (result) {
        case ProbeResult::Reachable: return "reachable";
        case ProbeResult::Unreachable: return "unreachable";
        case ProbeResult::ProbeFailed: return "probe-failed";
    }
    return "unknown";
}

/**
 * @struct PlaylistReport
 * @brief Stable partition of one playlist's entries by availability.
 *
 * Both sequences keep the order in which entries were parsed. Entries classified as
 * ProbeFailed land in @c unavailable; @c probeFailures counts them so that "down"
 * and "could not check" stay distinguishable.
 */
struct PlaylistReport {
    std::string name;
    std::vector<PlaylistEntry> available;
    std::vector<PlaylistEntry> unavailable;
    std::size_t probeFailures = 0;

    std::size_t totalEntries() const { return available.size() + unavailable.size(); }
};

} // namespace streamsieve::domain
