// PathUtils Header
#pragma once
#include <filesystem>
#include <string>

namespace trekplanner::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetConfigHome();
    static std::filesystem::path GetCacheHome();
    static std::filesystem::path GetDefaultConfigFile();
    static std::filesystem::path GetThemeEmbeddingCacheFile();
};

} // namespace trekplanner::infrastructure
