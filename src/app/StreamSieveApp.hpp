/**
 * @file StreamSieveApp.hpp
 * @brief Command-line application wrapper around the pipeline.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "domain/RunConfig.hpp"

namespace streamsieve::app {

/**
 * @class StreamSieveApp
 * @brief Parses arguments, loads settings, wires the collaborators and runs once.
 */
class StreamSieveApp {
public:
    enum ExitCode {
        kExitOk = 0,
        kExitFatal = 1,     ///< Bad configuration or the index document could not be fetched.
        kExitNoRecords = 2  ///< The index document had no playlist links.
    };

    /**
     * @struct CommandLine
     * @brief Values given on the command line; unset fields keep the settings file value.
     */
    struct CommandLine {
        std::optional<std::string> configPath;
        std::optional<std::string> indexUrl;
        std::optional<std::string> playlistDir;
        std::optional<std::string> outputDir;
        std::optional<std::string> logFile;
        std::optional<long long> workers;
        std::optional<long long> fetchTimeoutMs;
        std::optional<long long> probeTimeoutMs;
        bool showHelp = false;
    };

    /**
     * @brief Parses "--flag value" / "--flag=value" arguments.
     * @throws std::invalid_argument for unknown flags, missing or malformed values.
     */
    static CommandLine ParseArguments(const std::vector<std::string>& args);

    /**
     * @brief Applies command-line overrides on top of a loaded configuration.
     * @throws std::invalid_argument for out-of-range numbers.
     */
    static void ApplyOverrides(const CommandLine& cli, domain::RunConfig& config);

    static void PrintUsage(std::ostream& os, const std::string& program);

    /**
     * @brief Starts the application.
     * @return Process exit code.
     */
    int Run(int argc, char** argv);
};

} // namespace streamsieve::app
