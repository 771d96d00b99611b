/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/RegexLinkExtractor.hpp"
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <re2/re2.h>

namespace streamsieve::infrastructure {

namespace {

std::size_t ReadCount(const nlohmann::json& j, const char* key, std::size_t fallback) {
    long long value = j.value(key, static_cast<long long>(fallback));
    if (value < 0) {
        throw ConfigError(std::string("'") + key + "' must not be negative");
    }
    return static_cast<std::size_t>(value);
}

void Apply(const nlohmann::json& j, domain::RunConfig& config) {
    if (!j.is_object()) {
        throw ConfigError("settings must be a JSON object");
    }

    config.indexUrl = j.value("index_url", config.indexUrl);
    config.playlistDir = j.value("playlist_dir", config.playlistDir);
    config.outputDir = j.value("output_dir", config.outputDir);
    config.fetchTimeoutMs = j.value("fetch_timeout_ms", config.fetchTimeoutMs);
    config.probeTimeoutMs = j.value("probe_timeout_ms", config.probeTimeoutMs);
    config.workerCount = ReadCount(j, "worker_count", config.workerCount);
    config.queueCapacity = ReadCount(j, "queue_capacity", config.queueCapacity);
    config.logFile = j.value("log_file", config.logFile);
    config.linkPattern = j.value("link_pattern", config.linkPattern);
    config.userAgent = j.value("user_agent", config.userAgent);

    if (j.contains("duplicate_names")) {
        config.duplicateNames = ConfigLoader::ParseDuplicatePolicy(j["duplicate_names"].get<std::string>());
    }
}

} // namespace

domain::RunConfig ConfigLoader::Load(const std::string& path) {
    domain::RunConfig config;
    if (!std::filesystem::exists(path)) {
        return config;
    }

    std::ifstream f(path);
    if (!f.is_open()) {
        throw ConfigError("Cannot open " + path);
    }

    try {
        nlohmann::json j;
        f >> j;
        Apply(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Error reading " + path + ": " + e.what());
    }
    return config;
}

domain::RunConfig ConfigLoader::LoadFromString(const std::string& json, domain::RunConfig base) {
    try {
        Apply(nlohmann::json::parse(json), base);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Error parsing settings: ") + e.what());
    }
    return base;
}

void ConfigLoader::Validate(const domain::RunConfig& config) {
    if (config.indexUrl.empty()) throw ConfigError("index_url must not be empty");
    if (config.playlistDir.empty()) throw ConfigError("playlist_dir must not be empty");
    if (config.outputDir.empty()) throw ConfigError("output_dir must not be empty");
    if (config.fetchTimeoutMs <= 0) throw ConfigError("fetch_timeout_ms must be positive");
    if (config.probeTimeoutMs <= 0) throw ConfigError("probe_timeout_ms must be positive");
    if (config.workerCount == 0) throw ConfigError("worker_count must be positive");

    try {
        RegexLinkExtractor::CompilePattern(config.linkPattern);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("link_pattern is invalid: ") + e.what());
    }
}

domain::DuplicateNamePolicy ConfigLoader::ParseDuplicatePolicy(const std::string& value) {
    if (value == "last_wins") return domain::DuplicateNamePolicy::LastWins;
    if (value == "suffix") return domain::DuplicateNamePolicy::Suffix;
    throw ConfigError("duplicate_names must be 'last_wins' or 'suffix', got '" + value + "'");
}

} // namespace streamsieve::infrastructure
