#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace trekplanner::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetCacheHome() {
    const char* xdgCacheHome = std::getenv("XDG_CACHE_HOME");
    if (xdgCacheHome && *xdgCacheHome) {
        return fs::path(xdgCacheHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".cache";
    }
    return fs::current_path();
}

fs::path PathUtils::GetDefaultConfigFile() {
    return GetConfigHome() / "TrekPlanner" / "settings.json";
}

fs::path PathUtils::GetThemeEmbeddingCacheFile() {
    // Directory is created by EmbeddingCache::persist.
    return GetCacheHome() / "TrekPlanner" / "theme_embeddings.json";
}

} // namespace trekplanner::infrastructure
