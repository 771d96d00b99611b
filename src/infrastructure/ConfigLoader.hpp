/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the run configuration (settings.json).
 *
 * Keeps JSON parsing in one place; the rest of the code only sees domain::RunConfig.
 */

#pragma once

#include <stdexcept>
#include <string>
#include "domain/RunConfig.hpp"

namespace streamsieve::infrastructure {

/**
 * @class ConfigError
 * @brief Raised for unreadable settings or values that fail validation.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

class ConfigLoader {
public:
    /**
     * @brief Reads settings from a JSON file on top of the defaults.
     * @param path Settings file. A missing file yields the defaults.
     * @return The merged configuration (not yet validated).
     * @throws ConfigError if the file exists but cannot be parsed or has wrongly typed keys.
     */
    static domain::RunConfig Load(const std::string& path);

    /**
     * @brief Same as Load() but from an in-memory JSON document.
     */
    static domain::RunConfig LoadFromString(const std::string& json, domain::RunConfig base = {});

    /**
     * @brief Checks ranges and the link pattern.
     * @throws ConfigError describing the first invalid value.
     */
    static void Validate(const domain::RunConfig& config);

    /**
     * @brief Parses "last_wins" / "suffix".
     * @throws ConfigError for any other value.
     */
    static domain::DuplicateNamePolicy ParseDuplicatePolicy(const std::string& value);
};

} // namespace streamsieve::infrastructure
