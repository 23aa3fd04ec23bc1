/**
 * @file Itinerary.hpp
 * @brief Output entities: scheduled slots and the itinerary that orders them.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ItineraryError.hpp"
#include "ItineraryRequest.hpp"
#include "PoiCategory.hpp"
#include "Theme.hpp"
#include "TimeOfDay.hpp"

namespace trekplanner::domain {

/**
 * @struct PoiReference
 * @brief What a slot shows about its POI.
 */
struct PoiReference {
    long long id = 0;
    std::string name;
    PoiCategory category = PoiCategory::Other;
    std::vector<Theme> matchedThemes;
};

struct ScheduledSlot {
    TimeOfDay start;
    TimeOfDay end;
    PoiReference poi;
    double relevanceScore = 0.0;

    int durationMinutes() const { return end.minutes() - start.minutes(); }
};

/**
 * @struct Itinerary
 * @brief Ordered slots for one request. Transient; never persisted.
 *
 * Invariant: the hotel occupies slot 0 and is the only hotel; slots tile
 * [request.startTime, request.endTime] without gaps or overlaps.
 */
struct Itinerary {
    ItineraryRequest request;
    std::string name;
    std::string shortDescription;
    std::vector<ScheduledSlot> slots;

    bool operator==(const Itinerary& other) const;
};

inline bool operator==(const PoiReference& a, const PoiReference& b) {
    return a.id == b.id && a.name == b.name && a.category == b.category && a.matchedThemes == b.matchedThemes;
}

inline bool operator==(const ScheduledSlot& a, const ScheduledSlot& b) {
    return a.start == b.start && a.end == b.end && a.poi == b.poi && a.relevanceScore == b.relevanceScore;
}

inline bool Itinerary::operator==(const Itinerary& other) const {
    return name == other.name && shortDescription == other.shortDescription && slots == other.slots;
}

/**
 * @struct GenerationResult
 * @brief Either an itinerary or a classified error, never both.
 */
struct GenerationResult {
    std::optional<Itinerary> itinerary;
    std::optional<ItineraryError> error;

    bool succeeded() const { return itinerary.has_value(); }

    static GenerationResult Success(Itinerary itinerary) {
        GenerationResult r;
        r.itinerary = std::move(itinerary);
        return r;
    }

    static GenerationResult Failure(ItineraryErrorKind kind, std::string message) {
        GenerationResult r;
        r.error = ItineraryError{kind, std::move(message)};
        return r;
    }
};

} // namespace trekplanner::domain
