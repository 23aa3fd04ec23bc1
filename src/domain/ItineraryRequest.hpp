/**
 * @file ItineraryRequest.hpp
 * @brief Value Object holding the parameters of one itinerary request.
 */

#pragma once

#include <stdexcept>
#include <string>

#include "Theme.hpp"
#include "TimeOfDay.hpp"

namespace trekplanner::domain {

/**
 * @struct ItineraryRequest
 * @brief Input to itinerary generation. Constructed per call, never persisted.
 *
 * Invariant (checked by validate()): city and country are non-empty,
 * planSize is in [kMinPlanSize, kMaxPlanSize] and language has 2-5 characters.
 * Window ordering is checked by the generator and reported as INVALID_WINDOW.
 */
struct ItineraryRequest {
    static constexpr int kMinPlanSize = 1;
    static constexpr int kMaxPlanSize = 20;

    std::string city;
    std::string country;
    Theme theme = Theme::Cultural;
    int planSize = 6;
    TimeOfDay startTime;
    TimeOfDay endTime;
    std::string language = "en";

    void validate() const {
        if (city.empty()) {
            throw std::invalid_argument("ItineraryRequest: city cannot be empty.");
        }
        if (country.empty()) {
            throw std::invalid_argument("ItineraryRequest: country cannot be empty.");
        }
        if (planSize < kMinPlanSize || planSize > kMaxPlanSize) {
            throw std::invalid_argument("ItineraryRequest: plan size must be between 1 and 20.");
        }
        if (language.size() < 2 || language.size() > 5) {
            throw std::invalid_argument("ItineraryRequest: language must be a 2-5 character code.");
        }
    }
};

} // namespace trekplanner::domain
