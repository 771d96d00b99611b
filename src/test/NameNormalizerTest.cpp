#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/NameNormalizer.hpp"

using streamsieve::domain::NameNormalizer;

int main() {
    std::cout << "[Test] Starting NameNormalizer Test..." << std::endl;

    assert(NameNormalizer::Normalize(" Some &nbsp; Name! ") == "Some_Name");
    assert(NameNormalizer::Normalize("Some\xC2\xA0Name") == "Some_Name");
    assert(NameNormalizer::Normalize("News") == "News");
    assert(NameNormalizer::Normalize("Kids & Family") == "Kids_Family");
    assert(NameNormalizer::Normalize("Tab\tand\r\nnewline") == "Tab_and_newline");
    assert(NameNormalizer::Normalize("already_normal") == "already_normal");
    std::cout << "[PASS] Punctuation removed and whitespace collapsed." << std::endl;

    // Letters of any script survive, symbols and emoji do not.
    assert(NameNormalizer::Normalize("C\xC3\xB4te d'Ivoire") == "C\xC3\xB4te_dIvoire");
    assert(NameNormalizer::Normalize("\xF0\x9F\x87\xA6\xF0\x9F\x87\xAB Afghanistan") == "Afghanistan");
    assert(NameNormalizer::Normalize("5 \xC3\x97 5") == "5_5");
    assert(NameNormalizer::Normalize(u8"Русский") == u8"Русский");
    assert(NameNormalizer::Normalize(u8"Ελληνικά") == u8"Ελληνικά");
    assert(NameNormalizer::Normalize(u8"日本 Japan") == u8"日本_Japan");
    assert(NameNormalizer::Normalize(u8"العربية!") == u8"العربية");
    assert(NameNormalizer::Normalize(u8"Канал «Россия» 1") == u8"Канал_Россия_1");
    std::cout << "[PASS] Non-ASCII handling." << std::endl;

    // Ideographic and em spaces separate words like ASCII spaces.
    assert(NameNormalizer::Normalize(u8"日本　ニュース") == u8"日本_ニュース");
    assert(NameNormalizer::Normalize("TopâNews") == "Top_News");
    std::cout << "[PASS] Unicode whitespace collapses to underscores." << std::endl;

    assert(NameNormalizer::Normalize("").empty());
    assert(NameNormalizer::Normalize("   ").empty());
    assert(NameNormalizer::Normalize("!?&;").empty());
    assert(NameNormalizer::Normalize("&nbsp;&nbsp;").empty());
    assert(NameNormalizer::Normalize("\xFF\xFE").empty());
    std::cout << "[PASS] Inputs without usable characters normalize to empty." << std::endl;

    const std::vector<std::string> samples = {
        " Some &nbsp; Name! ",
        "a _ b",
        "  Multiple   spaces\there ",
        "C\xC3\xB4te d'Ivoire",
        "_leading underscore_",
        "Weird---dashes...and(parens)",
        "\xF0\x9F\x8E\xAC Movies",
        u8"日本\u3000 Japan",
        u8"Канал «Россия»",
    };
    for (const auto& sample : samples) {
        std::string once = NameNormalizer::Normalize(sample);
        assert(NameNormalizer::Normalize(once) == once);
    }
    assert(NameNormalizer::Normalize("a _ b") == "a___b");
    std::cout << "[PASS] Normalize is idempotent." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
