/**
 * @file PipelineOrchestrator.hpp
 * @brief Drives discovery, download and validation of playlists for one run.
 */

#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "application/RunContext.hpp"
#include "domain/NamedResource.hpp"
#include "domain/PlaylistEntry.hpp"

namespace streamsieve::application {

/**
 * @class PipelineOrchestrator
 * @brief Index fetch -> link extraction -> sequential downloads -> bounded parallel
 *        validation -> per-playlist persistence.
 *
 * Only the index fetch can end a run early. Failures for one playlist are recorded in
 * the summary and never affect the others.
 */
class PipelineOrchestrator {
public:
    explicit PipelineOrchestrator(RunContext context);

    enum class RunStatus {
        Completed,           ///< Every discovered playlist was processed or accounted for.
        DocumentFetchFailed, ///< The index document could not be retrieved.
        NothingToDo          ///< The index document contained no records.
    };

    enum class FailureStage { Download, Validation, Persist };

    /**
     * @struct PlaylistFailure
     * @brief A playlist that produced no report, and why.
     */
    struct PlaylistFailure {
        std::string name;
        std::string url;
        FailureStage stage;
        std::string cause;
    };

    /**
     * @struct RunSummary
     * @brief Result of a run.
     */
    struct RunSummary {
        RunStatus status = RunStatus::Completed;
        std::size_t playlistsDiscovered = 0;
        std::size_t playlistsDownloaded = 0;
        std::size_t reportsWritten = 0;
        std::size_t entriesAvailable = 0;
        std::size_t entriesUnavailable = 0;
        std::size_t probeFailures = 0;
        std::vector<PlaylistFailure> failures;
    };

    /**
     * @brief Executes the whole pipeline and waits for every submitted task.
     * @return Summary; status tells whether the run got past the index document.
     */
    RunSummary run();

    /**
     * @brief Parses a playlist and probes its entries in parse order.
     * @param name Playlist identifier used for the report.
     * @param content Raw playlist text.
     * @return Report whose partitions together hold every parsed entry exactly once.
     */
    domain::PlaylistReport validatePlaylist(const std::string& name, const std::string& content);

    static const char* RunStatusToString(RunStatus status);
    static const char* FailureStageToString(FailureStage stage);

private:
    /** @brief Worker task: load, validate, persist. Throws on storage errors. */
    domain::PlaylistReport processPlaylist(const domain::NamedResource& resource);

    void logSummary(const RunSummary& summary);
    void log(domain::LogLevel level, const std::string& message);

    RunContext m_context;
};

} // namespace streamsieve::application
