/**
 * @file StreamSieveApp.cpp
 * @brief Implementation of the StreamSieveApp class.
 */
#include "app/StreamSieveApp.hpp"

#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

#include "application/PipelineOrchestrator.hpp"
#include "application/RunContext.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/FilePlaylistRepository.hpp"
#include "infrastructure/HttpAdapter.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RegexLinkExtractor.hpp"
#include "infrastructure/RunLogger.hpp"

namespace streamsieve::app {

namespace {

constexpr const char* kComponent = "StreamSieveApp";

long long ParseNumber(const std::string& flag, const std::string& value) {
    size_t consumed = 0;
    long long number = 0;
    try {
        number = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
    }
    return number;
}

int ToPositiveInt(const char* flag, long long value) {
    if (value <= 0 || value > std::numeric_limits<int>::max()) {
        throw std::invalid_argument(std::string(flag) + " must be a positive number");
    }
    return static_cast<int>(value);
}

} // namespace

StreamSieveApp::CommandLine StreamSieveApp::ParseArguments(const std::vector<std::string>& args) {
    CommandLine cli;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::optional<std::string> inlineValue;
        size_t eq = flag.find('=');
        if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            inlineValue = flag.substr(eq + 1);
            flag.erase(eq);
        }

        if (flag == "-h" || flag == "--help") {
            cli.showHelp = true;
            continue;
        }

        auto nextValue = [&]() -> std::string {
            if (inlineValue) return *inlineValue;
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(flag + " requires a value");
            }
            return args[++i];
        };

        if (flag == "--config") cli.configPath = nextValue();
        else if (flag == "--index-url") cli.indexUrl = nextValue();
        else if (flag == "--playlist-dir") cli.playlistDir = nextValue();
        else if (flag == "--output-dir") cli.outputDir = nextValue();
        else if (flag == "--log-file") cli.logFile = nextValue();
        else if (flag == "--workers") cli.workers = ParseNumber(flag, nextValue());
        else if (flag == "--fetch-timeout-ms") cli.fetchTimeoutMs = ParseNumber(flag, nextValue());
        else if (flag == "--probe-timeout-ms") cli.probeTimeoutMs = ParseNumber(flag, nextValue());
        else throw std::invalid_argument("Unknown argument: " + args[i]);
    }
    return cli;
}

void StreamSieveApp::ApplyOverrides(const CommandLine& cli, domain::RunConfig& config) {
    if (cli.indexUrl) config.indexUrl = *cli.indexUrl;
    if (cli.playlistDir) config.playlistDir = *cli.playlistDir;
    if (cli.outputDir) config.outputDir = *cli.outputDir;
    if (cli.logFile) config.logFile = *cli.logFile;
    if (cli.workers) config.workerCount = static_cast<std::size_t>(ToPositiveInt("--workers", *cli.workers));
    if (cli.fetchTimeoutMs) config.fetchTimeoutMs = ToPositiveInt("--fetch-timeout-ms", *cli.fetchTimeoutMs);
    if (cli.probeTimeoutMs) config.probeTimeoutMs = ToPositiveInt("--probe-timeout-ms", *cli.probeTimeoutMs);
}

void StreamSieveApp::PrintUsage(std::ostream& os, const std::string& program) {
    os << "Usage: " << program << " [options]\n"
       << "\n"
       << "Discovers playlists listed in an index document, probes every entry and writes\n"
       << "available_<name>.m3u / unavailable_<name>.m3u for each playlist.\n"
       << "\n"
       << "Options:\n"
       << "  --config <file>            Settings file (default: "
       << infrastructure::PathUtils::GetDefaultSettingsPath().string() << ")\n"
       << "  --index-url <url>          Index document to scan\n"
       << "  --playlist-dir <dir>       Where downloaded playlists are stored\n"
       << "  --output-dir <dir>         Where partitioned playlists are written\n"
       << "  --workers <n>              Playlists validated in parallel\n"
       << "  --fetch-timeout-ms <ms>    Timeout for index and playlist downloads\n"
       << "  --probe-timeout-ms <ms>    Timeout for each entry check\n"
       << "  --log-file <file>          Log file, empty to disable\n"
       << "  -h, --help                 Show this help\n";
}

int StreamSieveApp::Run(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "streamsieve";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CommandLine cli;
    domain::RunConfig config;
    try {
        cli = ParseArguments(args);
        if (cli.showHelp) {
            PrintUsage(std::cout, program);
            return kExitOk;
        }

        std::string settingsPath = cli.configPath ? *cli.configPath
                                                  : infrastructure::PathUtils::GetDefaultSettingsPath().string();
        if (cli.configPath && !std::filesystem::exists(settingsPath)) {
            throw infrastructure::ConfigError("Settings file not found: " + settingsPath);
        }
        config = infrastructure::ConfigLoader::Load(settingsPath);
        ApplyOverrides(cli, config);
        infrastructure::ConfigLoader::Validate(config);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[" << kComponent << "] " << e.what() << std::endl;
        PrintUsage(std::cerr, program);
        return kExitFatal;
    } catch (const infrastructure::ConfigError& e) {
        std::cerr << "[" << kComponent << "] Configuration error: " << e.what() << std::endl;
        return kExitFatal;
    }

    infrastructure::RunLogger logger(config.logFile, std::cout, std::cerr);
    logger.write(domain::LogLevel::Info, kComponent, "Starting playlist validation run");

    application::RunContext context;
    context.config = config;
    context.log = logger.sink();

    auto http = std::make_shared<infrastructure::HttpAdapter>(config.userAgent);
    context.fetcher = http;
    context.prober = http;
    context.extractor = std::make_shared<infrastructure::RegexLinkExtractor>(config.linkPattern, config.duplicateNames);

    try {
        context.repository = std::make_shared<infrastructure::FilePlaylistRepository>(
            config.playlistDir, config.outputDir, std::make_shared<infrastructure::PersistenceService>());
    } catch (const domain::PersistError& e) {
        logger.write(domain::LogLevel::Error, kComponent, std::string("Cannot prepare output directories. ") + e.what());
        return kExitFatal;
    }

    application::PipelineOrchestrator orchestrator(std::move(context));
    auto summary = orchestrator.run();

    switch (summary.status) {
        case application::PipelineOrchestrator::RunStatus::Completed:
            logger.write(domain::LogLevel::Info, kComponent, "Run completed successfully");
            return kExitOk;
        case application::PipelineOrchestrator::RunStatus::DocumentFetchFailed:
            logger.write(domain::LogLevel::Error, kComponent, "Failed to fetch the index document. Exiting.");
            return kExitFatal;
        case application::PipelineOrchestrator::RunStatus::NothingToDo:
            logger.write(domain::LogLevel::Warning, kComponent, "No playlist links found. Exiting.");
            return kExitNoRecords;
    }
    return kExitFatal;
}

} // namespace streamsieve::app
