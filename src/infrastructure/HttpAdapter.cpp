/**
 * @file HttpAdapter.cpp
 * @brief Implementation of the HttpAdapter class.
 */
#include "infrastructure/HttpAdapter.hpp"

namespace streamsieve::infrastructure {

HttpAdapter::HttpAdapter(const std::string& userAgent)
    : m_client(userAgent) {}

std::string HttpAdapter::fetchText(const std::string& url, int timeoutMs) {
    HttpResponse res = m_client.get(url, timeoutMs);
    if (!res.completed()) {
        throw domain::FetchError(url, res.transportError);
    }
    if (!res.isSuccess()) {
        throw domain::FetchError(url, "HTTP status " + std::to_string(res.status));
    }
    return std::move(res.body);
}

domain::ProbeResult HttpAdapter::probe(const std::string& url, int timeoutMs) {
    try {
        HttpResponse res = m_client.head(url, timeoutMs);
        if (!res.completed()) return domain::ProbeResult::ProbeFailed;
        return res.isSuccess() ? domain::ProbeResult::Reachable : domain::ProbeResult::Unreachable;
    } catch (const std::exception&) {
        // Allocation failures and the like still classify the entry instead of escaping.
        return domain::ProbeResult::ProbeFailed;
    }
}

} // namespace streamsieve::infrastructure
