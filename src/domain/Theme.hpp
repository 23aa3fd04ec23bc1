/**
 * @file Theme.hpp
 * @brief Value Object for the closed set of travel themes.
 */

#pragma once

#include <array>
#include <cctype>
#include <optional>
#include <string>

namespace trekplanner::domain {

/**
 * @enum Theme
 * @brief Travel style requested by the user.
 */
enum class Theme {
    Cultural,
    Adventure,
    Foodies,
    Family,
    Couples,
    Friends
};

/** @brief All themes in canonical order. */
inline const std::array<Theme, 6>& AllThemes() {
    static const std::array<Theme, 6> themes = {
        Theme::Cultural, Theme::Adventure, Theme::Foodies,
        Theme::Family, Theme::Couples, Theme::Friends
    };
    return themes;
}

inline std::string ThemeToString(Theme theme) {
    switch (theme) {
        case Theme::Cultural: return "cultural";
        case Theme::Adventure: return "adventure";
        case Theme::Foodies: return "foodies";
        case Theme::Family: return "family";
        case Theme::Couples: return "couples";
        case Theme::Friends: return "friends";
        default: return "unknown";
    }
}

/**
 * @brief Parses a theme name, ignoring case and surrounding whitespace.
 * @return The theme, or nullopt for names outside the closed set.
 */
inline std::optional<Theme> ThemeFromString(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;

    std::string token;
    token.reserve(end - begin);
    for (size_t i = begin; i < end; ++i) {
        token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(value[i]))));
    }
    for (Theme theme : AllThemes()) {
        if (ThemeToString(theme) == token) {
            return theme;
        }
    }
    return std::nullopt;
}

} // namespace trekplanner::domain
