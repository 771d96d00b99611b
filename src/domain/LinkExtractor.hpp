/**
 * @file LinkExtractor.hpp
 * @brief Interface for discovering playlist links in an index document.
 */

#pragma once
#include <string>
#include "NamedResource.hpp"

namespace streamsieve::domain {

/**
 * @class LinkExtractor
 * @brief Abstract strategy that maps display names found in a document to playlist URLs.
 *
 * Implementations decide how records are recognized (regex, token scanner, structured
 * parser). The orchestrator only relies on the contract below.
 */
class LinkExtractor {
public:
    virtual ~LinkExtractor() = default;

    /**
     * @brief Scans the document and returns one resource per normalized name.
     * @param documentText Raw index document.
     * @return Resources with non-empty, unique names; empty when nothing matched.
     */
    virtual ResourceIndex extract(const std::string& documentText) const = 0;
};

} // namespace streamsieve::domain
