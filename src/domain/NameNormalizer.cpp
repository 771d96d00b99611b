/**
 * @file NameNormalizer.cpp
 * @brief Implementation of NameNormalizer.
 */

#include "domain/NameNormalizer.hpp"
#include <cstdint>
#include <unicode/uchar.h>
#include <unicode/utf8.h>

namespace streamsieve::domain {

namespace {

const std::string kNbspEntity = "&nbsp;";

// Letters in any script plus decimal, letter and other numbers.
bool IsWordCharacter(UChar32 cp) {
    if (cp == '_' || u_isalpha(cp)) return true;
    switch (u_charType(cp)) {
        case U_DECIMAL_DIGIT_NUMBER:
        case U_LETTER_NUMBER:
        case U_OTHER_NUMBER:
            return true;
        default:
            return false;
    }
}

// White_Space property, plus the ASCII separators U+001C..U+001F.
bool IsWhitespace(UChar32 cp) {
    return u_isUWhiteSpace(cp) || (cp >= 0x1C && cp <= 0x1F);
}

} // namespace

std::string NameNormalizer::Normalize(const std::string& rawName) {
    std::string text = rawName;
    for (size_t pos = text.find(kNbspEntity); pos != std::string::npos; pos = text.find(kNbspEntity, pos + 1)) {
        text.replace(pos, kNbspEntity.size(), " ");
    }

    // Keep word characters, turn every whitespace character (U+00A0 included) into a plain space.
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const int32_t length = static_cast<int32_t>(text.size());

    std::string filtered;
    filtered.reserve(text.size());
    for (int32_t pos = 0; pos < length;) {
        int32_t start = pos;
        UChar32 cp = 0;
        U8_NEXT(bytes, pos, length, cp);
        if (cp < 0) continue; // malformed sequence

        if (IsWhitespace(cp)) {
            filtered.push_back(' ');
        } else if (IsWordCharacter(cp)) {
            filtered.append(text, static_cast<size_t>(start), static_cast<size_t>(pos - start));
        }
    }

    size_t first = filtered.find_first_not_of(' ');
    if (first == std::string::npos) return {};
    size_t last = filtered.find_last_not_of(' ');

    std::string out;
    out.reserve(last - first + 1);
    bool inGap = false;
    for (size_t i = first; i <= last; ++i) {
        if (filtered[i] == ' ') {
            if (!inGap) out.push_back('_');
            inGap = true;
        } else {
            out.push_back(filtered[i]);
            inGap = false;
        }
    }
    return out;
}

} // namespace streamsieve::domain
