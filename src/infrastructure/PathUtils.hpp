// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace streamsieve::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();

    /** @brief <config home>/streamsieve/settings.json */
    static std::filesystem::path GetDefaultSettingsPath();

private:
    static std::filesystem::path ResolveXdgDir(const char* variable, const std::filesystem::path& underHome);
};

} // namespace streamsieve::infrastructure
