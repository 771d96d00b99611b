#include "domain/PlaylistParser.hpp"
#include <sstream>

namespace streamsieve::domain {

namespace {
    bool StartsWith(const std::string& text, const char* prefix) {
        return text.compare(0, std::string(prefix).length(), prefix) == 0;
    }

    void Trim(std::string& s) {
        const char* ws = " \t\r\n\f\v";
        size_t first = s.find_first_not_of(ws);
        if (first == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, first);
        s.erase(s.find_last_not_of(ws) + 1);
    }
}

std::vector<PlaylistEntry> PlaylistParser::Parse(const std::string& content) {
    std::vector<PlaylistEntry> entries;
    std::stringstream ss(content);
    std::string line;
    std::string pendingMetadata;

    while (std::getline(ss, line)) {
        Trim(line);
        if (line.empty()) continue;

        if (StartsWith(line, kMetadataMarker)) {
            pendingMetadata = line;
        } else if (StartsWith(line, kUrlScheme)) {
            entries.push_back(PlaylistEntry{pendingMetadata, line});
            pendingMetadata.clear();
        }
    }

    return entries;
}

} // namespace streamsieve::domain
