/**
 * @file RegexLinkExtractor.hpp
 * @brief Regex-driven implementation of the LinkExtractor.
 */

#pragma once
#include <memory>
#include <string>
#include "domain/LinkExtractor.hpp"
#include "domain/RunConfig.hpp"

namespace re2 {
class RE2;
}

namespace streamsieve::infrastructure {

/**
 * @class RegexLinkExtractor
 * @brief Finds records with a configurable pattern; group 1 is the display name and
 *        group 2 the playlist URL.
 *
 * Records never span lines, so the pattern is applied to one line at a time. Matching
 * uses RE2, which runs in time linear in the line length and does not recurse, so
 * very long single-line documents are safe.
 */
class RegexLinkExtractor : public domain::LinkExtractor {
public:
    /**
     * @param pattern RE2 pattern with at least two capture groups.
     * @param policy Collision handling for names that normalize identically.
     * @throws std::invalid_argument if the pattern does not compile or has fewer
     *         than two capture groups.
     */
    explicit RegexLinkExtractor(const std::string& pattern,
                                domain::DuplicateNamePolicy policy = domain::DuplicateNamePolicy::LastWins);
    ~RegexLinkExtractor() override;

    /** @see domain::LinkExtractor::extract */
    domain::ResourceIndex extract(const std::string& documentText) const override;

    /**
     * @brief Compiles a link pattern without logging to stderr.
     * @throws std::invalid_argument as described for the constructor.
     */
    static std::unique_ptr<re2::RE2> CompilePattern(const std::string& pattern);

private:
    std::unique_ptr<re2::RE2> m_pattern;
    domain::DuplicateNamePolicy m_policy;
};

} // namespace streamsieve::infrastructure
