/**
 * @file JsonCatalogRepository.cpp
 * @brief Implementation of JsonCatalogRepository.
 */

#include "infrastructure/JsonCatalogRepository.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>

using json = nlohmann::json;

namespace trekplanner::infrastructure {

namespace {

constexpr size_t kMaxSuggestions = 20;

std::string Normalize(const std::string& input) {
    size_t begin = 0;
    size_t end = input.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(input[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1]))) --end;

    std::string out;
    out.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(input[i]))));
    }
    return out;
}

std::string Trim(const std::string& input) {
    const auto first = input.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    const auto last = input.find_last_not_of(" \t\r\n");
    return input.substr(first, last - first + 1);
}

std::string StringOr(const json& j, const char* key, const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

bool IsStorableId(const json& id) {
    if (id.is_number_unsigned()) {
        return id.get<unsigned long long>() <= static_cast<unsigned long long>(std::numeric_limits<long long>::max());
    }
    return id.is_number_integer();
}

domain::PoiText ParseText(const json& j) {
    domain::PoiText text;
    text.name = StringOr(j, "name");
    text.shortDescription = StringOr(j, "short_description");
    text.description = StringOr(j, "description");
    return text;
}

} // namespace

JsonCatalogRepository::JsonCatalogRepository(const std::string& catalogPath, const std::string& defaultLanguage)
    : m_defaultLanguage(defaultLanguage) {
    if (!std::filesystem::exists(catalogPath)) {
        throw std::runtime_error("Catalog file not found: " + catalogPath);
    }
    std::ifstream f(catalogPath);
    if (!f.is_open()) {
        throw std::runtime_error("Cannot open catalog file: " + catalogPath);
    }

    json document;
    try {
        document = json::parse(f);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Malformed catalog " + catalogPath + ": " + e.what());
    }
    loadDocument(document);
    std::clog << "[JsonCatalogRepository] Loaded " << m_pois.size() << " POIs from "
              << m_byLocation.size() << " locations (" << catalogPath << ")" << std::endl;
}

JsonCatalogRepository::JsonCatalogRepository(EmptyTag, const std::string& defaultLanguage)
    : m_defaultLanguage(defaultLanguage) {}

std::shared_ptr<JsonCatalogRepository> JsonCatalogRepository::FromDocument(const json& document,
                                                                           const std::string& defaultLanguage) {
    std::shared_ptr<JsonCatalogRepository> repo(new JsonCatalogRepository(EmptyTag{}, defaultLanguage));
    repo->loadDocument(document);
    return repo;
}

void JsonCatalogRepository::loadDocument(const json& document) {
    if (!document.is_object() || !document.contains("pois") || !document["pois"].is_array()) {
        throw std::runtime_error("Catalog document must be an object with a 'pois' array.");
    }

    size_t skipped = 0;
    size_t droppedEmbeddings = 0;
    for (const auto& item : document["pois"]) {
        if (!item.is_object() || !item.contains("id") || !IsStorableId(item["id"])) {
            ++skipped;
            continue;
        }
        domain::Poi poi;
        poi.id = item["id"].get<long long>();
        poi.city = Trim(StringOr(item, "city"));
        poi.country = Trim(StringOr(item, "country"));
        if (poi.city.empty() || poi.country.empty()) {
            ++skipped;
            continue;
        }

        auto explicitCategory = domain::CategoryFromString(StringOr(item, "category"));
        poi.category = explicitCategory ? *explicitCategory : domain::NormalizeCategory(StringOr(item, "type"));

        if (item.contains("popularity") && item["popularity"].is_number()) {
            poi.popularity = item["popularity"].get<double>();
        }

        if (item.contains("themes") && item["themes"].is_array()) {
            for (const auto& t : item["themes"]) {
                if (!t.is_string()) continue;
                if (auto theme = domain::ThemeFromString(t.get<std::string>())) {
                    poi.themeTags.push_back(*theme);
                }
            }
        }

        if (item.contains("texts") && item["texts"].is_object()) {
            for (auto it = item["texts"].begin(); it != item["texts"].end(); ++it) {
                if (it.value().is_object()) {
                    poi.textEntries[Normalize(it.key())] = ParseText(it.value());
                }
            }
        }
        if (poi.textEntries.empty() && item.contains("name")) {
            poi.textEntries[m_defaultLanguage] = ParseText(item);
        }

        domain::FeatureVector features;
        if (item.contains("embedding") && item["embedding"].is_array()) {
            const auto& embedding = item["embedding"];
            if (std::all_of(embedding.begin(), embedding.end(), [](const json& v) { return v.is_number(); })) {
                features.embedding = embedding.get<std::vector<float>>();
            } else {
                ++droppedEmbeddings;
            }
        }
        if (item.contains("keywords") && item["keywords"].is_object()) {
            for (auto it = item["keywords"].begin(); it != item["keywords"].end(); ++it) {
                if (it.value().is_number()) {
                    features.keywordWeights[Normalize(it.key())] = it.value().get<float>();
                }
            }
        }
        if (!features.empty()) {
            poi.features = std::move(features);
        }

        m_byLocation[{Normalize(poi.city), Normalize(poi.country)}].push_back(m_pois.size());
        m_pois.push_back(std::move(poi));
    }

    if (skipped > 0) {
        std::cerr << "[JsonCatalogRepository] Skipped " << skipped
                  << " records without id, city or country." << std::endl;
    }
    if (droppedEmbeddings > 0) {
        std::cerr << "[JsonCatalogRepository] Ignored " << droppedEmbeddings
                  << " embeddings with non-numeric values." << std::endl;
    }
}

std::string JsonCatalogRepository::resolveLanguage(const domain::Poi& poi, const std::string& requested) const {
    if (poi.textEntries.count(requested)) return requested;
    if (poi.textEntries.count(m_defaultLanguage)) return m_defaultLanguage;
    if (!poi.textEntries.empty()) return poi.textEntries.begin()->first;
    return requested;
}

std::vector<domain::Poi> JsonCatalogRepository::findByLocation(const std::string& city,
                                                               const std::string& country,
                                                               const std::string& language) const {
    std::vector<domain::Poi> result;
    auto it = m_byLocation.find({Normalize(city), Normalize(country)});
    if (it == m_byLocation.end()) return result;

    const std::string requested = Normalize(language);
    result.reserve(it->second.size());
    for (size_t idx : it->second) {
        domain::Poi poi = m_pois[idx];
        poi.resolvedLanguage = resolveLanguage(poi, requested);
        result.push_back(std::move(poi));
    }
    return result;
}

std::vector<domain::LocationSummary> JsonCatalogRepository::listLocations() const {
    std::vector<domain::LocationSummary> locations;
    locations.reserve(m_byLocation.size());
    for (const auto& [key, indices] : m_byLocation) {
        const auto& first = m_pois[indices.front()];
        locations.push_back({first.city, first.country, indices.size()});
    }
    std::sort(locations.begin(), locations.end(), [](const auto& a, const auto& b) {
        if (a.poiCount != b.poiCount) return a.poiCount > b.poiCount;
        return a.city < b.city;
    });
    return locations;
}

std::vector<domain::LocationSummary> JsonCatalogRepository::suggestLocations(const std::string& partialCity,
                                                                             const std::string& partialCountry) const {
    const std::string cityNeedle = Normalize(partialCity);
    const std::string countryNeedle = Normalize(partialCountry);

    std::vector<domain::LocationSummary> suggestions;
    for (const auto& location : listLocations()) {
        const bool cityMatch = !cityNeedle.empty() && Normalize(location.city).find(cityNeedle) != std::string::npos;
        const bool countryMatch = !countryNeedle.empty() &&
                                  Normalize(location.country).find(countryNeedle) != std::string::npos;
        if (cityMatch || countryMatch || (cityNeedle.empty() && countryNeedle.empty())) {
            suggestions.push_back(location);
        }
        if (suggestions.size() >= kMaxSuggestions) break;
    }
    return suggestions;
}

} // namespace trekplanner::infrastructure
