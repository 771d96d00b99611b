/**
 * @file NamedResource.hpp
 * @brief Domain value object for a playlist discovered in the index document.
 */

#pragma once
#include <string>
#include <vector>

namespace streamsieve::domain {

/**
 * @struct NamedResource
 * @brief A normalized playlist name and the URL it was found next to.
 */
struct NamedResource {
    std::string name; ///< Normalized identifier, never empty.
    std::string url;  ///< Remote playlist location.
};

/**
 * @brief Name-unique set of resources, in order of first appearance in the document.
 */
using ResourceIndex = std::vector<NamedResource>;

} // namespace streamsieve::domain
