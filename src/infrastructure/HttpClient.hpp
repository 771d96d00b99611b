/**
 * @file HttpClient.hpp
 * @brief Low-level HTTP(S) client on top of cpp-httplib.
 */

#pragma once

#include <optional>
#include <string>

namespace streamsieve::infrastructure {

/**
 * @struct HttpResponse
 * @brief Outcome of one request. @c transportError is empty when the exchange completed.
 */
struct HttpResponse {
    int status = 0;
    std::string body;
    std::string transportError;

    bool completed() const { return transportError.empty(); }
    bool isSuccess() const { return completed() && status >= 200 && status < 300; }
};

class HttpClient {
public:
    explicit HttpClient(const std::string& userAgent = "StreamSieve/1.0");

    /**
     * @struct UrlParts
     * @brief "scheme://host[:port]" and the request target ("/path?query").
     */
    struct UrlParts {
        std::string origin;
        std::string target;
    };

    /** @brief Splits an absolute http/https URL; nullopt for anything else. */
    static std::optional<UrlParts> SplitUrl(const std::string& url);

    /** @brief Sends a GET request, following redirects. */
    HttpResponse get(const std::string& url, int timeoutMs) const;

    /** @brief Sends a HEAD request without following redirects. No body is transferred. */
    HttpResponse head(const std::string& url, int timeoutMs) const;

private:
    HttpResponse send(const std::string& url, int timeoutMs, bool headOnly) const;

    std::string m_userAgent;
};

} // namespace streamsieve::infrastructure
