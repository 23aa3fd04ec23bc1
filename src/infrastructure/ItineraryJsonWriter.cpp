/**
 * @file ItineraryJsonWriter.cpp
 * @brief Implementation of ItineraryJsonWriter.
 */

#include "infrastructure/ItineraryJsonWriter.hpp"

namespace trekplanner::infrastructure {

using json = nlohmann::json;

json ItineraryJsonWriter::ToJson(const domain::Itinerary& itinerary) {
    const auto& r = itinerary.request;
    json slots = json::array();
    for (const auto& slot : itinerary.slots) {
        json themes = json::array();
        for (auto theme : slot.poi.matchedThemes) {
            themes.push_back(domain::ThemeToString(theme));
        }
        slots.push_back({
            {"start", slot.start.toString()},
            {"end", slot.end.toString()},
            {"id", slot.poi.id},
            {"name", slot.poi.name},
            {"category", domain::CategoryToString(slot.poi.category)},
            {"score", slot.relevanceScore},
            {"themes", themes}
        });
    }

    return {
        {"name", itinerary.name},
        {"short_description", itinerary.shortDescription},
        {"request", {
            {"city", r.city},
            {"country", r.country},
            {"theme", domain::ThemeToString(r.theme)},
            {"plan_size", r.planSize},
            {"start_time", r.startTime.toString()},
            {"end_time", r.endTime.toString()},
            {"language", r.language}
        }},
        {"slots", slots}
    };
}

json ItineraryJsonWriter::ToJson(const domain::ItineraryError& error) {
    return {
        {"error", {
            {"kind", domain::ErrorKindToString(error.kind)},
            {"message", error.message}
        }}
    };
}

json ItineraryJsonWriter::ToJson(const std::vector<domain::LocationSummary>& locations) {
    json out = json::array();
    for (const auto& loc : locations) {
        out.push_back({{"city", loc.city}, {"country", loc.country}, {"poi_count", loc.poiCount}});
    }
    return out;
}

} // namespace trekplanner::infrastructure
