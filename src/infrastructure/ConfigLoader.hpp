/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Keeps JSON parsing of settings in one place; everything else receives plain
 * values.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/Theme.hpp"
#include "domain/ThemeDescriptor.hpp"

namespace trekplanner::infrastructure {

struct EmbeddingSettings {
    bool enabled = false;
    std::string host = "localhost";
    int port = 11434;
    std::string model = "nomic-embed-text";
};

/**
 * @struct AppConfig
 * @brief Settings with their defaults; every field may be absent from the file.
 */
struct AppConfig {
    std::string catalogPath = "data/catalog.json";
    std::string defaultLanguage = "en";
    double semanticWeight = 0.5;
    double keywordWeight = 0.5;
    int alignmentMinutes = 1;
    EmbeddingSettings embeddings;
    std::map<domain::Theme, std::vector<std::string>> themeKeywords; ///< Replaces default keywords.
    std::map<domain::Theme, double> themeBoosts;                     ///< Replaces default boosts.
};

class ConfigLoader {
public:
    /**
     * @brief Reads a settings file.
     * @param configPath Path to settings.json.
     * @return Defaults if the file does not exist; unreadable values are logged and defaulted.
     */
    static AppConfig Load(const std::string& configPath);

    /** @brief Applies the keys of an already parsed settings object over the defaults. */
    static AppConfig FromJson(const nlohmann::json& j);

    /** @brief Default descriptors with the configured overrides applied. */
    static domain::ThemeDescriptorTable BuildThemeTable(const AppConfig& config);
};

} // namespace trekplanner::infrastructure
