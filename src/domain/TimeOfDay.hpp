/**
 * @file TimeOfDay.hpp
 * @brief Value Object for a wall-clock time within one day, in whole minutes.
 */

#pragma once

#include <cctype>
#include <cstdio>
#include <optional>
#include <string>

namespace trekplanner::domain {

/**
 * @class TimeOfDay
 * @brief Minutes since midnight in [0, 1439].
 *
 * All slot arithmetic is done on this integer representation so that slot
 * boundaries never drift.
 */
class TimeOfDay {
public:
    static constexpr int kMinutesPerDay = 24 * 60;

    TimeOfDay() = default;

    /** @brief Builds from minutes; returns nullopt outside [0, 1439]. */
    static std::optional<TimeOfDay> FromMinutes(int minutes) {
        if (minutes < 0 || minutes >= kMinutesPerDay) return std::nullopt;
        return TimeOfDay(minutes);
    }

    /**
     * @brief Parses "HH:MM" (one or two hour digits, exactly two minute digits).
     */
    static std::optional<TimeOfDay> Parse(const std::string& text) {
        const auto colon = text.find(':');
        if (colon == std::string::npos || colon == 0 || colon > 2 || text.size() != colon + 3) {
            return std::nullopt;
        }
        for (size_t i = 0; i < text.size(); ++i) {
            if (i != colon && !std::isdigit(static_cast<unsigned char>(text[i]))) {
                return std::nullopt;
            }
        }
        const int hours = std::stoi(text.substr(0, colon));
        const int minutes = std::stoi(text.substr(colon + 1));
        if (hours > 23 || minutes > 59) return std::nullopt;
        return TimeOfDay(hours * 60 + minutes);
    }

    int minutes() const { return m_minutes; }

    std::string toString() const {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%02d:%02d", m_minutes / 60, m_minutes % 60);
        return buf;
    }

    bool operator==(const TimeOfDay& other) const { return m_minutes == other.m_minutes; }
    bool operator!=(const TimeOfDay& other) const { return m_minutes != other.m_minutes; }
    bool operator<(const TimeOfDay& other) const { return m_minutes < other.m_minutes; }
    bool operator<=(const TimeOfDay& other) const { return m_minutes <= other.m_minutes; }
    bool operator>=(const TimeOfDay& other) const { return m_minutes >= other.m_minutes; }

private:
    explicit TimeOfDay(int minutes) : m_minutes(minutes) {}

    int m_minutes = 0;
};

} // namespace trekplanner::domain
