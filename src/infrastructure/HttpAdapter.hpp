/**
 * @file HttpAdapter.hpp
 * @brief HTTP implementation of the ResourceFetcher and LivenessProber interfaces.
 */

#pragma once
#include "domain/ResourceFetcher.hpp"
#include "domain/LivenessProber.hpp"
#include "infrastructure/HttpClient.hpp"
#include <string>

namespace streamsieve::infrastructure {

/**
 * @class HttpAdapter
 * @brief Downloads resources with GET and checks liveness with HEAD.
 *
 * Stateless apart from the User-Agent, so one instance can serve every worker thread.
 */
class HttpAdapter : public domain::ResourceFetcher, public domain::LivenessProber {
public:
    explicit HttpAdapter(const std::string& userAgent = "StreamSieve/1.0");

    /** @brief Single GET; non-2xx raises. @see domain::ResourceFetcher::fetchText */
    std::string fetchText(const std::string& url, int timeoutMs) override;

    /** @brief Single HEAD; never raises. @see domain::LivenessProber::probe */
    domain::ProbeResult probe(const std::string& url, int timeoutMs) override;

private:
    HttpClient m_client;
};

} // namespace streamsieve::infrastructure
