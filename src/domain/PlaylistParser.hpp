#pragma once

#include "domain/PlaylistEntry.hpp"
#include <string>
#include <vector>

namespace streamsieve::domain {

/**
 * @brief Turns M3U playlist text into entries.
 * This parser is stateless; each call is a single pass over the lines.
 */
class PlaylistParser {
public:
    static constexpr const char* kMetadataMarker = "#EXTINF";
    static constexpr const char* kUrlScheme = "http";

    /**
     * @brief Pairs every metadata line with the URL line that follows it.
     *
     * A metadata line replaces any earlier one that was never paired. Lines that are
     * neither metadata nor URLs are skipped, and metadata left pending at the end of
     * input produces no entry.
     *
     * @param content Raw playlist text (LF or CRLF line endings).
     * @return Entries in the order their URL lines appear.
     */
    static std::vector<PlaylistEntry> Parse(const std::string& content);
};

} // namespace streamsieve::domain
