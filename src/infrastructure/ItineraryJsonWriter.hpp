/**
 * @file ItineraryJsonWriter.hpp
 * @brief JSON rendering of itineraries, errors and location lists.
 */

#pragma once

#include <vector>

#include <nlohmann/json.hpp>

#include "domain/CatalogRepository.hpp"
#include "domain/Itinerary.hpp"

namespace trekplanner::infrastructure {

class ItineraryJsonWriter {
public:
    /** @brief {"name", "short_description", "request": {...}, "slots": [...]} */
    static nlohmann::json ToJson(const domain::Itinerary& itinerary);

    /** @brief {"error": {"kind", "message"}} */
    static nlohmann::json ToJson(const domain::ItineraryError& error);

    static nlohmann::json ToJson(const std::vector<domain::LocationSummary>& locations);
};

} // namespace trekplanner::infrastructure
