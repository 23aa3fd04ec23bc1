/**
 * @file ItineraryValidator.hpp
 * @brief Checks the global invariants of a generated itinerary.
 */

#pragma once

#include <string>
#include <vector>

#include "domain/Itinerary.hpp"

namespace trekplanner::application {

/**
 * @class ItineraryValidator
 * @brief Last gate before an itinerary leaves the core.
 */
class ItineraryValidator {
public:
    struct Result {
        bool valid = true;
        std::vector<std::string> violations;
    };

    /**
     * @brief Checks slot count, hotel uniqueness and position, window coverage,
     *        contiguity, positive durations and POI uniqueness.
     */
    Result Validate(const domain::Itinerary& itinerary) const;

private:
    void AddViolation(Result& result, const std::string& message) const;
};

} // namespace trekplanner::application
