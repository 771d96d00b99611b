/**
 * @file ResourceFetcher.hpp
 * @brief Interface for retrieving text resources over the network.
 */

#pragma once
#include <stdexcept>
#include <string>

namespace streamsieve::domain {

/**
 * @class FetchError
 * @brief Raised when a resource could not be retrieved (transport error or non-2xx status).
 */
class FetchError : public std::runtime_error {
public:
    FetchError(const std::string& url, const std::string& cause)
        : std::runtime_error("Failed to fetch " + url + ": " + cause), m_url(url), m_cause(cause) {}

    const std::string& url() const { return m_url; }
    const std::string& cause() const { return m_cause; }

private:
    std::string m_url;
    std::string m_cause;
};

/**
 * @class ResourceFetcher
 * @brief Abstract "bytes from a URL" capability. Single attempt, no retries.
 */
class ResourceFetcher {
public:
    virtual ~ResourceFetcher() = default;

    /**
     * @brief Retrieves the body of @p url.
     * @param url Absolute http(s) URL.
     * @param timeoutMs Upper bound for connecting and for each read.
     * @return Response body.
     * @throws FetchError on transport failure or a non-2xx status.
     */
    virtual std::string fetchText(const std::string& url, int timeoutMs) = 0;
};

} // namespace streamsieve::domain
