/**
 * @file PoiCategory.hpp
 * @brief Value Object for the closed set of POI categories.
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace trekplanner::domain {

/**
 * @enum PoiCategory
 * @brief Normalized category of a point of interest. Hotel is the only lodging category.
 */
enum class PoiCategory {
    Hotel,
    Restaurant,
    Shop,
    TouristPlace,
    Entertainment,
    Other
};

inline std::string CategoryToString(PoiCategory category) {
    switch (category) {
        case PoiCategory::Hotel: return "hotel";
        case PoiCategory::Restaurant: return "restaurant";
        case PoiCategory::Shop: return "shop";
        case PoiCategory::TouristPlace: return "tourist place";
        case PoiCategory::Entertainment: return "entertainment";
        case PoiCategory::Other: return "other";
        default: return "other";
    }
}

/** @brief Exact (case-insensitive) match on a display name. */
inline std::optional<PoiCategory> CategoryFromString(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (PoiCategory category : {PoiCategory::Hotel, PoiCategory::Restaurant, PoiCategory::Shop,
                                 PoiCategory::TouristPlace, PoiCategory::Entertainment, PoiCategory::Other}) {
        if (CategoryToString(category) == lowered) {
            return category;
        }
    }
    return std::nullopt;
}

/**
 * @brief Maps a raw catalog type (e.g. "Boutique Hotel", "Street Food") to a category.
 *
 * Rules are checked in order, so "resort bar" is a hotel.
 */
inline PoiCategory NormalizeCategory(const std::string& rawType) {
    if (rawType.empty()) return PoiCategory::Other;

    std::string t = rawType;
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto containsAny = [&t](const std::vector<const char*>& needles) {
        return std::any_of(needles.begin(), needles.end(),
                           [&t](const char* n) { return t.find(n) != std::string::npos; });
    };

    if (containsAny({"hotel", "resort", "hostel", "inn", "lodg"})) return PoiCategory::Hotel;
    if (containsAny({"restaurant", "cafe", "bar", "pub", "food", "eat"})) return PoiCategory::Restaurant;
    if (containsAny({"shop", "mall", "market", "store", "boutique", "bazaar"})) return PoiCategory::Shop;
    if (containsAny({"museum", "nature", "beach", "park", "tourist", "monument", "landmark",
                     "viewpoint", "temple", "mosque", "church", "castle"})) {
        return PoiCategory::TouristPlace;
    }
    if (containsAny({"club", "entertainment", "nightlife"})) return PoiCategory::Entertainment;
    return PoiCategory::Other;
}

} // namespace trekplanner::domain
