/**
 * @file RegexLinkExtractor.cpp
 * @brief Implementation of RegexLinkExtractor.
 */

#include "infrastructure/RegexLinkExtractor.hpp"
#include "domain/NameNormalizer.hpp"
#include <re2/re2.h>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace streamsieve::infrastructure {

namespace {
// Whole match, display name, URL.
constexpr int kSubmatchCount = 3;
}

std::unique_ptr<re2::RE2> RegexLinkExtractor::CompilePattern(const std::string& pattern) {
    re2::RE2::Options options;
    options.set_log_errors(false);

    auto compiled = std::make_unique<re2::RE2>(pattern, options);
    if (!compiled->ok()) {
        throw std::invalid_argument("Link pattern does not compile (" + compiled->error() + "): " + pattern);
    }
    if (compiled->NumberOfCapturingGroups() < 2) {
        throw std::invalid_argument("Link pattern needs a name group and a URL group: " + pattern);
    }
    return compiled;
}

RegexLinkExtractor::RegexLinkExtractor(const std::string& pattern, domain::DuplicateNamePolicy policy)
    : m_pattern(CompilePattern(pattern)), m_policy(policy) {}

RegexLinkExtractor::~RegexLinkExtractor() = default;

domain::ResourceIndex RegexLinkExtractor::extract(const std::string& documentText) const {
    domain::ResourceIndex resources;
    std::unordered_map<std::string, size_t> positionByName;

    auto insert = [&](const std::string& name, const std::string& url) {
        auto it = positionByName.find(name);
        if (it == positionByName.end()) {
            positionByName.emplace(name, resources.size());
            resources.push_back({name, url});
            return;
        }

        if (m_policy == domain::DuplicateNamePolicy::LastWins) {
            resources[it->second].url = url;
            return;
        }

        // Suffix: an exact repeat collapses, a different URL gets the next free suffix.
        if (resources[it->second].url == url) return;
        for (int n = 2;; ++n) {
            std::string candidate = name + "_" + std::to_string(n);
            auto existing = positionByName.find(candidate);
            if (existing == positionByName.end()) {
                positionByName.emplace(candidate, resources.size());
                resources.push_back({candidate, url});
                return;
            }
            if (resources[existing->second].url == url) return;
        }
    };

    std::stringstream ss(documentText);
    std::string line;
    re2::StringPiece groups[kSubmatchCount];
    while (std::getline(ss, line)) {
        const re2::StringPiece text(line);
        size_t pos = 0;
        while (pos <= text.size() &&
               m_pattern->Match(text, pos, text.size(), re2::RE2::UNANCHORED, groups, kSubmatchCount)) {
            size_t matchEnd = static_cast<size_t>(groups[0].data() - text.data()) + groups[0].size();
            pos = matchEnd > pos ? matchEnd : pos + 1; // an empty match still advances

            std::string name = domain::NameNormalizer::Normalize(groups[1].as_string());
            std::string url = groups[2].as_string();
            if (name.empty() || url.empty()) continue;
            insert(name, url);
        }
    }

    return resources;
}

} // namespace streamsieve::infrastructure
