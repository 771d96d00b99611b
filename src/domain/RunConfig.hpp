/**
 * @file RunConfig.hpp
 * @brief Settings for a single pipeline run.
 */

#pragma once
#include <string>
#include <cstddef>

namespace streamsieve::domain {

/**
 * @enum DuplicateNamePolicy
 * @brief What the link extractor does when two records normalize to the same name.
 */
enum class DuplicateNamePolicy {
    LastWins, ///< The later record replaces the earlier URL.
    Suffix    ///< The later record is kept as name_2, name_3, ...
};

/**
 * @struct RunConfig
 * @brief Externally overridable parameters; defaults reproduce the stock iptv-org run.
 */
struct RunConfig {
    std::string indexUrl = "https://raw.githubusercontent.com/iptv-org/iptv/master/README.md";
    std::string playlistDir = "m3u_files";
    std::string outputDir = "processed";
    int fetchTimeoutMs = 10000;
    int probeTimeoutMs = 5000;
    std::size_t workerCount = 5;
    std::size_t queueCapacity = 0; ///< 0 means "same as workerCount".
    std::string logFile = "streamsieve.log"; ///< Empty disables the log file.
    std::string linkPattern = R"(<td>(.+?)</td>.*?<code>(https://[^\s]+\.m3u(?:8)?)</code>)";
    DuplicateNamePolicy duplicateNames = DuplicateNamePolicy::LastWins;
    std::string userAgent = "StreamSieve/1.0";

    std::size_t effectiveQueueCapacity() const {
        return queueCapacity == 0 ? workerCount : queueCapacity;
    }
};

} // namespace streamsieve::domain
