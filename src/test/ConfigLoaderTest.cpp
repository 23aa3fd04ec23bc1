#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <nlohmann/json.hpp>

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace trekplanner;
using infrastructure::AppConfig;
using infrastructure::ConfigLoader;
using domain::Theme;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    // Missing file -> defaults.
    AppConfig config = ConfigLoader::Load("/nonexistent/trekplanner/settings.json");
    assert(config.catalogPath == "data/catalog.json");
    assert(config.defaultLanguage == "en");
    assert(config.semanticWeight == 0.5 && config.keywordWeight == 0.5);
    assert(config.alignmentMinutes == 1);
    assert(!config.embeddings.enabled);
    assert(config.embeddings.port == 11434);

    // Every key, plus an unknown theme and a value of the wrong type.
    auto j = nlohmann::json::parse(R"({
      "catalog_path": "/srv/catalog.json",
      "default_language": "fr",
      "scoring": { "semantic_weight": 0.7, "keyword_weight": 0.3 },
      "scheduler": { "alignment_minutes": "thirty" },
      "embeddings": { "enabled": true, "host": "gpu-box", "port": 8080, "model": "bge-m3" },
      "themes": {
        "Foodies": { "keywords": ["Restaurant", "Koshary"], "boost": 0.4 },
        "couples": { "boost": 0.1 },
        "pirates": { "keywords": ["ship"] }
      }
    })");
    config = ConfigLoader::FromJson(j);
    assert(config.catalogPath == "/srv/catalog.json");
    assert(config.defaultLanguage == "fr");
    assert(config.semanticWeight == 0.7 && config.keywordWeight == 0.3);
    assert(config.alignmentMinutes == 1);
    assert(config.embeddings.enabled);
    assert(config.embeddings.host == "gpu-box" && config.embeddings.port == 8080);
    assert(config.embeddings.model == "bge-m3");
    assert(config.themeKeywords.size() == 1);
    assert((config.themeKeywords[Theme::Foodies] == std::vector<std::string>{"restaurant", "koshary"}));
    assert(config.themeBoosts[Theme::Foodies] == 0.4);
    assert(config.themeBoosts[Theme::Couples] == 0.1);

    auto table = ConfigLoader::BuildThemeTable(config);
    assert(table.get(Theme::Foodies).keywords.size() == 2);
    assert(table.get(Theme::Foodies).boost == 0.4);
    assert(table.get(Theme::Couples).boost == 0.1);
    assert(table.get(Theme::Couples).keywords == domain::ThemeDescriptorTable::Defaults().get(Theme::Couples).keywords);
    assert(table.get(Theme::Cultural).boost == 0.25);

    // Non-object root.
    config = ConfigLoader::FromJson(nlohmann::json::array());
    assert(config.catalogPath == "data/catalog.json");

    // Corrupt file -> defaults.
    const fs::path dir = fs::temp_directory_path() / "trekplanner_config_test";
    fs::create_directories(dir);
    {
        std::ofstream out(dir / "settings.json");
        out << "{ not json";
    }
    config = ConfigLoader::Load((dir / "settings.json").string());
    assert(config.catalogPath == "data/catalog.json");

    {
        std::ofstream out(dir / "settings.json");
        out << R"({ "scheduler": { "alignment_minutes": 15 } })";
    }
    config = ConfigLoader::Load((dir / "settings.json").string());
    assert(config.alignmentMinutes == 15);

    // XDG locations.
    setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    setenv("XDG_CACHE_HOME", (dir / "cache").c_str(), 1);
    assert(infrastructure::PathUtils::GetDefaultConfigFile() == dir / "TrekPlanner" / "settings.json");
    assert(infrastructure::PathUtils::GetThemeEmbeddingCacheFile() ==
           dir / "cache" / "TrekPlanner" / "theme_embeddings.json");

    fs::remove_all(dir);
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
