/**
 * @file RunContext.hpp
 * @brief Everything one pipeline run needs, constructed explicitly by the caller.
 */

#pragma once

#include <memory>
#include "domain/LinkExtractor.hpp"
#include "domain/LivenessProber.hpp"
#include "domain/LogSink.hpp"
#include "domain/PlaylistRepository.hpp"
#include "domain/ResourceFetcher.hpp"
#include "domain/RunConfig.hpp"

namespace streamsieve::application {

/**
 * @struct RunContext
 * @brief Configuration, collaborators and log sink scoped to a single run.
 *
 * The fetcher and prober are shared by all worker threads and must be thread-safe.
 */
struct RunContext {
    domain::RunConfig config;
    std::shared_ptr<domain::ResourceFetcher> fetcher;
    std::shared_ptr<domain::LinkExtractor> extractor;
    std::shared_ptr<domain::LivenessProber> prober;
    std::shared_ptr<domain::PlaylistRepository> repository;
    domain::LogSink log; ///< May be empty, in which case nothing is logged.
};

} // namespace streamsieve::application
