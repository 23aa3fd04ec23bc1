/**
 * @file ItineraryValidator.cpp
 * @brief Implementation of ItineraryValidator.
 */

#include "application/ItineraryValidator.hpp"

#include <set>

namespace trekplanner::application {

void ItineraryValidator::AddViolation(Result& result, const std::string& message) const {
    result.valid = false;
    result.violations.push_back(message);
}

ItineraryValidator::Result ItineraryValidator::Validate(const domain::Itinerary& itinerary) const {
    Result result;
    const auto& slots = itinerary.slots;
    const auto& request = itinerary.request;

    if (slots.empty()) {
        AddViolation(result, "itinerary has no slots");
        return result;
    }
    if (static_cast<int>(slots.size()) > request.planSize) {
        AddViolation(result, "slot count " + std::to_string(slots.size()) +
                             " exceeds plan size " + std::to_string(request.planSize));
    }

    size_t hotels = 0;
    for (const auto& slot : slots) {
        if (slot.poi.category == domain::PoiCategory::Hotel) ++hotels;
    }
    if (hotels != 1) {
        AddViolation(result, "expected exactly one hotel, found " + std::to_string(hotels));
    }
    if (slots.front().poi.category != domain::PoiCategory::Hotel) {
        AddViolation(result, "first slot is not the hotel");
    }

    if (slots.front().start != request.startTime) {
        AddViolation(result, "first slot starts at " + slots.front().start.toString() +
                             " instead of " + request.startTime.toString());
    }
    if (slots.back().end != request.endTime) {
        AddViolation(result, "last slot ends at " + slots.back().end.toString() +
                             " instead of " + request.endTime.toString());
    }

    std::set<long long> ids;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (!(slots[i].start < slots[i].end)) {
            AddViolation(result, "slot " + std::to_string(i) + " has no positive duration");
        }
        if (i > 0 && slots[i].start != slots[i - 1].end) {
            AddViolation(result, "gap or overlap between slots " + std::to_string(i - 1) +
                                 " and " + std::to_string(i));
        }
        if (!ids.insert(slots[i].poi.id).second) {
            AddViolation(result, "POI " + std::to_string(slots[i].poi.id) + " scheduled twice");
        }
    }
    return result;
}

} // namespace trekplanner::application
