/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace trekplanner::infrastructure {

namespace {

template <typename T>
void ReadValue(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    try {
        target = j[key].get<T>();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

AppConfig ConfigLoader::FromJson(const nlohmann::json& j) {
    AppConfig config;
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object; using defaults." << std::endl;
        return config;
    }

    ReadValue(j, "catalog_path", config.catalogPath);
    ReadValue(j, "default_language", config.defaultLanguage);

    if (j.contains("scoring") && j["scoring"].is_object()) {
        ReadValue(j["scoring"], "semantic_weight", config.semanticWeight);
        ReadValue(j["scoring"], "keyword_weight", config.keywordWeight);
    }
    if (j.contains("scheduler") && j["scheduler"].is_object()) {
        ReadValue(j["scheduler"], "alignment_minutes", config.alignmentMinutes);
    }
    if (j.contains("embeddings") && j["embeddings"].is_object()) {
        const auto& e = j["embeddings"];
        ReadValue(e, "enabled", config.embeddings.enabled);
        ReadValue(e, "host", config.embeddings.host);
        ReadValue(e, "port", config.embeddings.port);
        ReadValue(e, "model", config.embeddings.model);
    }

    if (j.contains("themes") && j["themes"].is_object()) {
        for (auto it = j["themes"].begin(); it != j["themes"].end(); ++it) {
            auto theme = domain::ThemeFromString(it.key());
            if (!theme) {
                std::cerr << "[ConfigLoader] Unknown theme '" << it.key() << "' in settings." << std::endl;
                continue;
            }
            const auto& entry = it.value();
            if (entry.contains("keywords")) {
                std::vector<std::string> keywords;
                ReadValue(entry, "keywords", keywords);
                for (auto& kw : keywords) {
                    std::transform(kw.begin(), kw.end(), kw.begin(),
                                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                }
                if (!keywords.empty()) config.themeKeywords[*theme] = keywords;
            }
            if (entry.contains("boost")) {
                double boost = 0.0;
                ReadValue(entry, "boost", boost);
                config.themeBoosts[*theme] = boost;
            }
        }
    }
    return config;
}

AppConfig ConfigLoader::Load(const std::string& configPath) {
    if (!std::filesystem::exists(configPath)) {
        return AppConfig{};
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;
        std::clog << "[ConfigLoader] Loaded " << configPath << std::endl;
        return FromJson(j);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << configPath << ": " << e.what() << std::endl;
    }
    return AppConfig{};
}

domain::ThemeDescriptorTable ConfigLoader::BuildThemeTable(const AppConfig& config) {
    auto table = domain::ThemeDescriptorTable::Defaults();
    for (domain::Theme theme : domain::AllThemes()) {
        auto descriptor = table.get(theme);
        bool overridden = false;
        if (auto kw = config.themeKeywords.find(theme); kw != config.themeKeywords.end()) {
            descriptor.keywords = kw->second;
            overridden = true;
        }
        if (auto boost = config.themeBoosts.find(theme); boost != config.themeBoosts.end()) {
            descriptor.boost = boost->second;
            overridden = true;
        }
        if (overridden) {
            table = table.with(descriptor);
        }
    }
    return table;
}

} // namespace trekplanner::infrastructure
