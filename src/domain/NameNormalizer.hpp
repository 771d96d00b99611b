/**
 * @file NameNormalizer.hpp
 * @brief Canonicalizes free-text labels into filesystem-safe identifiers.
 */

#pragma once
#include <string>

namespace streamsieve::domain {

class NameNormalizer {
public:
    /**
     * @brief Normalizes a display name.
     *
     * Non-breaking spaces (U+00A0 or the "&nbsp;" entity) become spaces, every
     * character that is not alphanumeric, '_' or whitespace is dropped, the result is
     * trimmed and each internal whitespace run becomes a single '_'.
     * Letters and numbers of every script count as alphanumeric and every Unicode
     * whitespace character counts as whitespace; malformed UTF-8 is dropped.
     *
     * @param rawName Label as it appears in the index document (UTF-8).
     * @return The identifier; empty if nothing usable remained.
     */
    static std::string Normalize(const std::string& rawName);
};

} // namespace streamsieve::domain
