#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "app/StreamSieveApp.hpp"
#include "infrastructure/ConfigLoader.hpp"

using namespace streamsieve;
using infrastructure::ConfigError;
using infrastructure::ConfigLoader;

namespace {

template <typename F>
bool Throws(F&& f) {
    try {
        f();
    } catch (const ConfigError&) {
        return true;
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void TestDefaultsAndFile() {
    domain::RunConfig defaults = ConfigLoader::Load("does_not_exist_settings.json");
    assert(defaults.indexUrl == "https://raw.githubusercontent.com/iptv-org/iptv/master/README.md");
    assert(defaults.playlistDir == "m3u_files");
    assert(defaults.outputDir == "processed");
    assert(defaults.fetchTimeoutMs == 10000);
    assert(defaults.probeTimeoutMs == 5000);
    assert(defaults.workerCount == 5);
    assert(defaults.effectiveQueueCapacity() == 5);
    assert(defaults.duplicateNames == domain::DuplicateNamePolicy::LastWins);
    ConfigLoader::Validate(defaults);

    const std::string path = "test_settings.json";
    {
        std::ofstream f(path);
        f << R"({
            "index_url": "https://mirror.test/README.md",
            "output_dir": "out",
            "worker_count": 8,
            "queue_capacity": 2,
            "probe_timeout_ms": 1500,
            "duplicate_names": "suffix",
            "unknown_key": true
        })";
    }
    domain::RunConfig loaded = ConfigLoader::Load(path);
    assert(loaded.indexUrl == "https://mirror.test/README.md");
    assert(loaded.outputDir == "out");
    assert(loaded.playlistDir == "m3u_files");
    assert(loaded.workerCount == 8);
    assert(loaded.effectiveQueueCapacity() == 2);
    assert(loaded.probeTimeoutMs == 1500);
    assert(loaded.fetchTimeoutMs == 10000);
    assert(loaded.duplicateNames == domain::DuplicateNamePolicy::Suffix);
    ConfigLoader::Validate(loaded);

    {
        std::ofstream f(path);
        f << "{ not json";
    }
    assert(Throws([&] { ConfigLoader::Load(path); }));
    std::filesystem::remove(path);
    std::cout << "[PASS] Defaults, file values and parse errors." << std::endl;
}

void TestValidation() {
    assert(Throws([] { ConfigLoader::LoadFromString(R"({"worker_count": -1})"); }));
    assert(Throws([] { ConfigLoader::LoadFromString(R"({"fetch_timeout_ms": "fast"})"); }));
    assert(Throws([] { ConfigLoader::LoadFromString(R"({"duplicate_names": "first_wins"})"); }));
    assert(Throws([] { ConfigLoader::LoadFromString("[1, 2]"); }));

    assert(Throws([] { ConfigLoader::Validate(ConfigLoader::LoadFromString(R"({"worker_count": 0})")); }));
    assert(Throws([] { ConfigLoader::Validate(ConfigLoader::LoadFromString(R"({"probe_timeout_ms": 0})")); }));
    assert(Throws([] { ConfigLoader::Validate(ConfigLoader::LoadFromString(R"({"output_dir": ""})")); }));
    assert(Throws([] { ConfigLoader::Validate(ConfigLoader::LoadFromString(R"({"link_pattern": "(unclosed"})")); }));
    assert(Throws([] { ConfigLoader::Validate(ConfigLoader::LoadFromString(R"({"link_pattern": "<td>(.+?)</td>"})")); }));
    std::cout << "[PASS] Invalid values are rejected." << std::endl;
}

void TestCommandLine() {
    using App = app::StreamSieveApp;

    auto cli = App::ParseArguments({"--index-url", "https://other.test/index.md", "--workers=2",
                                    "--output-dir", "results", "--probe-timeout-ms", "750", "--log-file="});
    assert(!cli.showHelp);
    assert(!cli.configPath);

    domain::RunConfig config;
    App::ApplyOverrides(cli, config);
    assert(config.indexUrl == "https://other.test/index.md");
    assert(config.workerCount == 2);
    assert(config.outputDir == "results");
    assert(config.probeTimeoutMs == 750);
    assert(config.logFile.empty());
    assert(config.playlistDir == "m3u_files");

    assert(App::ParseArguments({"-h"}).showHelp);
    assert(*App::ParseArguments({"--config", "x.json"}).configPath == "x.json");
    assert(Throws([] { App::ParseArguments({"--bogus"}); }));
    assert(Throws([] { App::ParseArguments({"--workers"}); }));
    assert(Throws([] { App::ParseArguments({"--workers", "many"}); }));

    assert(Throws([] {
        domain::RunConfig c;
        App::ApplyOverrides(App::ParseArguments({"--workers", "0"}), c);
    }));
    std::cout << "[PASS] Command-line overrides." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    TestDefaultsAndFile();
    TestValidation();
    TestCommandLine();

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
