/**
 * @file ItineraryError.hpp
 * @brief Classified failures of itinerary generation.
 */

#pragma once

#include <string>

namespace trekplanner::domain {

enum class ItineraryErrorKind {
    NoPoisFound,                  ///< Catalog has no POI for (city, country).
    NoHotelAvailable,             ///< Catalog has activities but no hotel.
    InsufficientCandidates,       ///< Not even one activity for a multi-slot plan.
    InvalidWindow,                ///< start >= end, or window shorter than the slot count.
    SchedulingInvariantViolation  ///< Internal bug: the schedule broke a global invariant.
};

inline std::string ErrorKindToString(ItineraryErrorKind kind) {
    switch (kind) {
        case ItineraryErrorKind::NoPoisFound: return "NO_POIS_FOUND";
        case ItineraryErrorKind::NoHotelAvailable: return "NO_HOTEL_AVAILABLE";
        case ItineraryErrorKind::InsufficientCandidates: return "INSUFFICIENT_CANDIDATES";
        case ItineraryErrorKind::InvalidWindow: return "INVALID_WINDOW";
        case ItineraryErrorKind::SchedulingInvariantViolation: return "SCHEDULING_INVARIANT_VIOLATION";
        default: return "UNKNOWN";
    }
}

struct ItineraryError {
    ItineraryErrorKind kind;
    std::string message;
};

} // namespace trekplanner::domain
