/**
 * @file Poi.hpp
 * @brief Domain entity for a catalog point of interest.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "PoiCategory.hpp"
#include "Theme.hpp"

namespace trekplanner::domain {

/**
 * @struct PoiText
 * @brief Descriptive text of a POI in one language.
 */
struct PoiText {
    std::string name;
    std::string shortDescription;
    std::string description;
};

/**
 * @struct FeatureVector
 * @brief Features precomputed at ingestion time. Either part may be empty.
 */
struct FeatureVector {
    std::vector<float> embedding;               ///< Sentence embedding of the POI text.
    std::map<std::string, float> keywordWeights; ///< Lower-case keyword -> weight in [0, 1].

    bool empty() const { return embedding.empty() && keywordWeights.empty(); }
};

/**
 * @struct Poi
 * @brief A visitable place. Read-only during itinerary generation.
 */
struct Poi {
    long long id = 0;
    PoiCategory category = PoiCategory::Other;
    std::string city;
    std::string country;
    std::map<std::string, PoiText> textEntries; ///< Language code -> text.
    std::vector<Theme> themeTags;               ///< Themes assigned by the ingestion process.
    std::optional<double> popularity;           ///< Rating or visit count, when known.
    std::optional<FeatureVector> features;

    /// Language of the text entry used for this request; set by the catalog store.
    std::string resolvedLanguage;

    bool isHotel() const { return category == PoiCategory::Hotel; }

    bool hasThemeTag(Theme theme) const {
        for (Theme t : themeTags) {
            if (t == theme) return true;
        }
        return false;
    }

    /** @brief Text in the resolved language, or an empty entry if none. */
    const PoiText& text() const {
        static const PoiText kEmpty;
        auto it = textEntries.find(resolvedLanguage);
        if (it != textEntries.end()) return it->second;
        if (!textEntries.empty()) return textEntries.begin()->second;
        return kEmpty;
    }

    std::string displayName() const {
        const auto& t = text();
        return t.name.empty() ? "Unknown" : t.name;
    }
};

} // namespace trekplanner::domain
