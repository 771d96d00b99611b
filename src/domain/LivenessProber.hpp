/**
 * @file LivenessProber.hpp
 * @brief Interface for lightweight reachability checks.
 */

#pragma once
#include <string>
#include "PlaylistEntry.hpp"

namespace streamsieve::domain {

/**
 * @class LivenessProber
 * @brief Classifies a URL as reachable, unreachable or not checkable.
 *
 * Implementations must not throw: every failure is reported through the result so
 * callers can keep going with the remaining entries.
 */
class LivenessProber {
public:
    virtual ~LivenessProber() = default;

    /**
     * @brief Checks whether @p url exists without transferring its body.
     * @param url Entry URL.
     * @param timeoutMs Bound for the check.
     */
    virtual ProbeResult probe(const std::string& url, int timeoutMs) = 0;
};

} // namespace streamsieve::domain
