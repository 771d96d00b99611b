#include "infrastructure/HttpClient.hpp"
#include <httplib.h>
#include <algorithm>
#include <cctype>
#include <chrono>

namespace streamsieve::infrastructure {

namespace {
constexpr const char* kSchemeSeparator = "://";
}

HttpClient::HttpClient(const std::string& userAgent)
    : m_userAgent(userAgent) {}

std::optional<HttpClient::UrlParts> HttpClient::SplitUrl(const std::string& url) {
    size_t sep = url.find(kSchemeSeparator);
    if (sep == std::string::npos || sep == 0) return std::nullopt;

    std::string scheme = url.substr(0, sep);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c){ return std::tolower(c); });
    if (scheme != "http" && scheme != "https") return std::nullopt;

    size_t hostStart = sep + 3;
    size_t hostEnd = url.find_first_of("/?#", hostStart);
    std::string host = url.substr(hostStart, hostEnd == std::string::npos ? std::string::npos : hostEnd - hostStart);
    if (host.empty() || host.find_first_of(" \t") != std::string::npos) return std::nullopt;

    std::string target = hostEnd == std::string::npos ? std::string() : url.substr(hostEnd);
    size_t fragment = target.find('#');
    if (fragment != std::string::npos) target.erase(fragment);
    if (target.empty() || target.front() != '/') target.insert(0, "/");

    return UrlParts{scheme + kSchemeSeparator + host, target};
}

HttpResponse HttpClient::get(const std::string& url, int timeoutMs) const {
    return send(url, timeoutMs, false);
}

HttpResponse HttpClient::head(const std::string& url, int timeoutMs) const {
    return send(url, timeoutMs, true);
}

HttpResponse HttpClient::send(const std::string& url, int timeoutMs, bool headOnly) const {
    HttpResponse response;

    auto parts = SplitUrl(url);
    if (!parts) {
        response.transportError = "Malformed URL";
        return response;
    }

    try {
        httplib::Client cli(parts->origin);
        if (!cli.is_valid()) {
            response.transportError = "Unsupported endpoint " + parts->origin;
            return response;
        }

        const auto timeout = std::chrono::milliseconds(timeoutMs);
        cli.set_connection_timeout(timeout);
        cli.set_read_timeout(timeout);
        cli.set_write_timeout(timeout);
        // A liveness check reports the redirect itself rather than its target.
        cli.set_follow_location(!headOnly);

        httplib::Headers headers = {{"User-Agent", m_userAgent}};
        auto res = headOnly ? cli.Head(parts->target, headers) : cli.Get(parts->target, headers);
        if (!res) {
            response.transportError = httplib::to_string(res.error());
            return response;
        }

        response.status = res->status;
        if (!headOnly) {
            response.body = std::move(res->body);
        }
    } catch (const std::exception& e) {
        response.transportError = e.what();
    }
    return response;
}

} // namespace streamsieve::infrastructure
