#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace streamsieve::infrastructure {

namespace fs = std::filesystem;

namespace {
constexpr const char* kAppDirName = "streamsieve";
constexpr const char* kSettingsFileName = "settings.json";
}

fs::path PathUtils::ResolveXdgDir(const char* variable, const fs::path& underHome) {
    if (const char* value = std::getenv(variable); value && *value) {
        return fs::path(value);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / underHome;
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    return ResolveXdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultSettingsPath() {
    return GetConfigHome() / kAppDirName / kSettingsFileName;
}

} // namespace streamsieve::infrastructure
