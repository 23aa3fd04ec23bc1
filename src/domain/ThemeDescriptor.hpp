/**
 * @file ThemeDescriptor.hpp
 * @brief Static descriptors used to score POIs against a theme.
 */

#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "Theme.hpp"

namespace trekplanner::domain {

/**
 * @struct ThemeDescriptor
 * @brief Keywords, tag boost and optional embedding of one theme.
 */
struct ThemeDescriptor {
    Theme theme = Theme::Cultural;
    std::vector<std::string> keywords; ///< Lower-case phrases.
    double boost = 0.0;                ///< Added when a POI carries the theme tag.
    std::vector<float> embedding;      ///< Empty when semantic scoring is unavailable.

    /** @brief Text sent to an embedding model for this theme. */
    std::string descriptorText() const {
        std::string text = ThemeToString(theme) + " travel:";
        for (const auto& kw : keywords) {
            text += " " + kw;
        }
        return text;
    }
};

/**
 * @class ThemeDescriptorTable
 * @brief Immutable mapping Theme -> ThemeDescriptor.
 *
 * Invariant: every Theme has exactly one descriptor.
 */
class ThemeDescriptorTable {
public:
    /** @brief Descriptors of the original recommender. */
    static ThemeDescriptorTable Defaults() {
        std::map<Theme, ThemeDescriptor> d;
        d[Theme::Cultural] = {Theme::Cultural,
            {"museum", "monument", "historic", "temple", "gallery", "heritage", "church", "mosque", "castle", "ruins"},
            0.25, {}};
        d[Theme::Adventure] = {Theme::Adventure,
            {"nature", "beach", "desert", "hiking", "diving", "snorkel", "quad", "safari", "kayak", "trail", "climb"},
            0.25, {}};
        d[Theme::Foodies] = {Theme::Foodies,
            {"restaurant", "cafe", "market", "street food", "bakery", "eatery", "diner"},
            0.30, {}};
        d[Theme::Family] = {Theme::Family,
            {"park", "zoo", "aquarium", "children", "playground", "amusement", "family"},
            0.20, {}};
        d[Theme::Couples] = {Theme::Couples,
            {"romantic", "sunset", "candlelight", "spa", "scenic", "viewpoint", "resort"},
            0.25, {}};
        d[Theme::Friends] = {Theme::Friends,
            {"bar", "club", "sports", "fun", "nightlife", "escape room", "bowling"},
            0.20, {}};
        return ThemeDescriptorTable(std::move(d));
    }

    explicit ThemeDescriptorTable(std::map<Theme, ThemeDescriptor> descriptors)
        : m_descriptors(std::move(descriptors)) {
        for (Theme theme : AllThemes()) {
            if (m_descriptors.find(theme) == m_descriptors.end()) {
                throw std::invalid_argument("ThemeDescriptorTable: missing descriptor for " + ThemeToString(theme));
            }
        }
    }

    const ThemeDescriptor& get(Theme theme) const { return m_descriptors.at(theme); }

    const std::map<Theme, ThemeDescriptor>& all() const { return m_descriptors; }

    /** @brief Returns a copy with one descriptor replaced. */
    ThemeDescriptorTable with(const ThemeDescriptor& descriptor) const {
        auto copy = m_descriptors;
        copy[descriptor.theme] = descriptor;
        return ThemeDescriptorTable(std::move(copy));
    }

private:
    std::map<Theme, ThemeDescriptor> m_descriptors;
};

} // namespace trekplanner::domain
