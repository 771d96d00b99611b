#include <cassert>
#include <iostream>
#include <string>

#include "domain/PlaylistParser.hpp"

using streamsieve::domain::PlaylistEntry;
using streamsieve::domain::PlaylistParser;

int main() {
    std::cout << "[Test] Starting PlaylistParser Test..." << std::endl;

    {
        auto entries = PlaylistParser::Parse(
            "#EXTINF:-1,Channel A\nhttp://a.test/1\n#EXTINF:-1,Channel B\nhttp://b.test/2");
        assert(entries.size() == 2);
        assert((entries[0] == PlaylistEntry{"#EXTINF:-1,Channel A", "http://a.test/1"}));
        assert((entries[1] == PlaylistEntry{"#EXTINF:-1,Channel B", "http://b.test/2"}));
        std::cout << "[PASS] Metadata paired with the following URL." << std::endl;
    }

    {
        auto entries = PlaylistParser::Parse("#EXTINF:-1,A\nhttp://a.test/1\n#EXTINF:-1,Dangling\n");
        assert(entries.size() == 1);
        assert(entries[0].url == "http://a.test/1");
        std::cout << "[PASS] Trailing metadata without URL is dropped." << std::endl;
    }

    {
        auto entries = PlaylistParser::Parse(
            "#EXTM3U x-tvg-url=\"http://epg.test\"\r\n"
            "\r\n"
            "#EXTINF:-1 tvg-id=\"one\",One\r\n"
            "#EXTVLCOPT:http-user-agent=Mozilla\r\n"
            "https://one.test/live.m3u8\r\n"
            "http://bare.test/stream\r\n"
            "#EXTINF:-1,Lost\r\n"
            "#EXTINF:-1,Kept\r\n"
            "  http://kept.test/x  \r\n"
            "rtmp://ignored.test/live\r\n");
        assert(entries.size() == 3);
        assert((entries[0] == PlaylistEntry{"#EXTINF:-1 tvg-id=\"one\",One", "https://one.test/live.m3u8"}));
        assert((entries[1] == PlaylistEntry{"", "http://bare.test/stream"}));
        assert((entries[2] == PlaylistEntry{"#EXTINF:-1,Kept", "http://kept.test/x"}));
        std::cout << "[PASS] Directives ignored, CRLF trimmed, unpaired metadata overwritten." << std::endl;
    }

    {
        assert(PlaylistParser::Parse("").empty());
        assert(PlaylistParser::Parse("#EXTM3U\n# comment only\n").empty());
        std::cout << "[PASS] No URLs yields no entries." << std::endl;
    }

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
