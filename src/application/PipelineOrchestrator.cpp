/**
 * @file PipelineOrchestrator.cpp
 * @brief Implementation of PipelineOrchestrator.
 */

#include "application/PipelineOrchestrator.hpp"
#include "application/AsyncTaskManager.hpp"
#include "domain/PlaylistParser.hpp"
#include <future>
#include <sstream>

namespace streamsieve::application {

namespace {
constexpr const char* kComponent = "PipelineOrchestrator";
}

PipelineOrchestrator::PipelineOrchestrator(RunContext context)
    : m_context(std::move(context)) {}

PipelineOrchestrator::RunSummary PipelineOrchestrator::run() {
    const domain::RunConfig& config = m_context.config;
    RunSummary summary;

    log(domain::LogLevel::Info, "Fetching index document from " + config.indexUrl);
    std::string document;
    try {
        document = m_context.fetcher->fetchText(config.indexUrl, config.fetchTimeoutMs);
    } catch (const domain::FetchError& e) {
        log(domain::LogLevel::Error, std::string("Could not fetch index document. ") + e.what());
        summary.status = RunStatus::DocumentFetchFailed;
        logSummary(summary);
        return summary;
    }
    log(domain::LogLevel::Info, "Fetched index document (" + std::to_string(document.size()) + " bytes)");

    domain::ResourceIndex resources;
    try {
        resources = m_context.extractor->extract(document);
    } catch (const std::exception& e) {
        log(domain::LogLevel::Error, "Link extraction failed for " + config.indexUrl + ": " + e.what());
    }
    summary.playlistsDiscovered = resources.size();
    if (resources.empty()) {
        log(domain::LogLevel::Warning, "No playlist links found in the index document. Nothing to do.");
        summary.status = RunStatus::NothingToDo;
        logSummary(summary);
        return summary;
    }
    log(domain::LogLevel::Info, "Found " + std::to_string(resources.size()) + " playlist links");

    struct PendingReport {
        domain::NamedResource resource;
        std::future<domain::PlaylistReport> report;
    };
    std::vector<PendingReport> pending;
    pending.reserve(resources.size());

    {
        AsyncTaskManager pool(config.workerCount, config.effectiveQueueCapacity());
        log(domain::LogLevel::Info, "Validating with " + std::to_string(pool.GetWorkerCount()) + " workers, queue capacity " +
                                        std::to_string(pool.GetQueueCapacity()));

        for (const auto& resource : resources) {
            log(domain::LogLevel::Info, "Downloading playlist '" + resource.name + "' from " + resource.url);
            try {
                std::string content = m_context.fetcher->fetchText(resource.url, config.fetchTimeoutMs);
                m_context.repository->saveRawPlaylist(resource.name, content);
            } catch (const domain::FetchError& e) {
                log(domain::LogLevel::Error, "Failed to download playlist '" + resource.name + "'. " + e.what());
                summary.failures.push_back({resource.name, resource.url, FailureStage::Download, e.cause()});
                continue;
            } catch (const domain::PersistError& e) {
                log(domain::LogLevel::Error, "Failed to store playlist '" + resource.name + "'. " + e.what());
                summary.failures.push_back({resource.name, resource.url, FailureStage::Persist, e.what()});
                continue;
            } catch (const std::exception& e) {
                log(domain::LogLevel::Error, "Failed to download playlist '" + resource.name + "': " + e.what());
                summary.failures.push_back({resource.name, resource.url, FailureStage::Download, e.what()});
                continue;
            }

            ++summary.playlistsDownloaded;
            // Blocks while the pool's queue is full.
            pending.push_back({resource, pool.SubmitTask([this, resource]() {
                return processPlaylist(resource);
            })});
        }

        pool.WaitAll();
    }

    for (auto& item : pending) {
        const domain::NamedResource& resource = item.resource;
        try {
            domain::PlaylistReport report = item.report.get();
            ++summary.reportsWritten;
            summary.entriesAvailable += report.available.size();
            summary.entriesUnavailable += report.unavailable.size();
            summary.probeFailures += report.probeFailures;
        } catch (const domain::PersistError& e) {
            log(domain::LogLevel::Error, "Error saving playlist '" + resource.name + "'. " + e.what());
            summary.failures.push_back({resource.name, resource.url, FailureStage::Persist, e.what()});
        } catch (const std::exception& e) {
            log(domain::LogLevel::Error, "Error processing playlist '" + resource.name + "': " + e.what());
            summary.failures.push_back({resource.name, resource.url, FailureStage::Validation, e.what()});
        }
    }

    summary.status = RunStatus::Completed;
    logSummary(summary);
    return summary;
}

domain::PlaylistReport PipelineOrchestrator::validatePlaylist(const std::string& name, const std::string& content) {
    domain::PlaylistReport report;
    report.name = name;

    for (auto& entry : domain::PlaylistParser::Parse(content)) {
        domain::ProbeResult result = m_context.prober->probe(entry.url, m_context.config.probeTimeoutMs);
        const std::string outcome = std::string(domain::ProbeResultToString(result)) + ": " + entry.url;
        switch (result) {
            case domain::ProbeResult::Reachable:
                log(domain::LogLevel::Info, "URL " + outcome);
                report.available.push_back(std::move(entry));
                break;
            case domain::ProbeResult::Unreachable:
                log(domain::LogLevel::Warning, "URL " + outcome);
                report.unavailable.push_back(std::move(entry));
                break;
            case domain::ProbeResult::ProbeFailed:
                log(domain::LogLevel::Error, "URL " + outcome);
                report.unavailable.push_back(std::move(entry));
                ++report.probeFailures;
                break;
        }
    }
    return report;
}

domain::PlaylistReport PipelineOrchestrator::processPlaylist(const domain::NamedResource& resource) {
    log(domain::LogLevel::Info, "Processing playlist '" + resource.name + "'");
    std::string content = m_context.repository->loadRawPlaylist(resource.name);

    domain::PlaylistReport report = validatePlaylist(resource.name, content);
    m_context.repository->saveReport(report);

    std::ostringstream ss;
    ss << "Saved results for '" << report.name << "': " << report.available.size() << " available, "
       << report.unavailable.size() << " unavailable (" << report.probeFailures << " probe failures)";
    log(domain::LogLevel::Info, ss.str());
    return report;
}

void PipelineOrchestrator::logSummary(const RunSummary& summary) {
    std::ostringstream ss;
    ss << "Run finished: " << RunStatusToString(summary.status)
       << ", playlists discovered=" << summary.playlistsDiscovered
       << ", downloaded=" << summary.playlistsDownloaded
       << ", reports=" << summary.reportsWritten
       << ", entries available=" << summary.entriesAvailable
       << ", unavailable=" << summary.entriesUnavailable
       << " (probe failures=" << summary.probeFailures << ")"
       << ", failed playlists=" << summary.failures.size();
    log(summary.status == RunStatus::Completed ? domain::LogLevel::Info : domain::LogLevel::Warning, ss.str());

    for (const auto& failure : summary.failures) {
        log(domain::LogLevel::Warning, std::string("  ") + FailureStageToString(failure.stage) + " failure for '" +
                                           failure.name + "' (" + failure.url + "): " + failure.cause);
    }
}

void PipelineOrchestrator::log(domain::LogLevel level, const std::string& message) {
    if (m_context.log) {
        m_context.log(level, kComponent, message);
    }
}

const char* PipelineOrchestrator::RunStatusToString(RunStatus status) {
    switch (status) {
        case RunStatus::Completed: return "completed";
        case RunStatus::DocumentFetchFailed: return "index document fetch failed";
        case RunStatus::NothingToDo: return "no playlists found";
    }
    return "unknown";
}

const char* PipelineOrchestrator::FailureStageToString(FailureStage stage) {
    switch (stage) {
        case FailureStage::Download: return "download";
        case FailureStage::Validation: return "validation";
        case FailureStage::Persist: return "persist";
    }
    return "unknown";
}

} // namespace streamsieve::application
