/**
 * @file ItineraryService.cpp
 * @brief Implementation of ItineraryService.
 */

#include "application/ItineraryService.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <map>

namespace trekplanner::application {

namespace {

constexpr size_t kLocationsToLog = 10;

std::string TitleCase(const std::string& value) {
    std::string out = value;
    bool startOfWord = true;
    for (auto& ch : out) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || ch == '-') {
            startOfWord = true;
        } else {
            ch = static_cast<char>(startOfWord ? std::toupper(c) : std::tolower(c));
            startOfWord = false;
        }
    }
    return out;
}

std::string Lower(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double RoundScore(double score) {
    return std::round(score * 1000.0) / 1000.0;
}

} // namespace

ItineraryService::ItineraryService(std::shared_ptr<const domain::CatalogRepository> catalog,
                                   domain::ThemeDescriptorTable themes,
                                   ScoringWeights weights,
                                   SchedulerOptions schedulerOptions)
    : m_catalog(std::move(catalog)),
      m_themes(std::move(themes)),
      m_scorer(weights),
      m_selector(m_scorer),
      m_scheduler(schedulerOptions) {}

std::string ItineraryService::BuildName(const std::string& city) {
    static const std::map<std::string, std::string> kFamousCities = {
        {"paris", "Parisian Adventure"},
        {"london", "London Explorer"},
        {"tokyo", "Tokyo Discovery"},
        {"new york", "NYC Experience"},
        {"rome", "Roman Holiday"},
        {"cairo", "Cairo Explorer"},
        {"dubai", "Dubai Luxury"},
        {"barcelona", "Barcelona Vibes"},
        {"sydney", "Sydney Explorer"},
        {"mumbai", "Mumbai Discovery"}
    };
    auto it = kFamousCities.find(Lower(city));
    if (it != kFamousCities.end()) {
        return "1-Day " + it->second;
    }
    return "1-Day " + TitleCase(city) + " Discovery";
}

std::string ItineraryService::BuildShortDescription(const domain::ItineraryRequest& request, size_t places) {
    return "A " + domain::ThemeToString(request.theme) + " day in " + TitleCase(request.city) + ", " +
           TitleCase(request.country) + ": " + std::to_string(places) + " carefully selected places from " +
           request.startTime.toString() + " to " + request.endTime.toString() + ".";
}

void ItineraryService::logAvailableLocations() const {
    auto locations = m_catalog->listLocations();
    if (locations.empty()) {
        std::cerr << "[ItineraryService] Catalog is empty." << std::endl;
        return;
    }
    std::clog << "[ItineraryService] Available locations:" << std::endl;
    for (size_t i = 0; i < locations.size() && i < kLocationsToLog; ++i) {
        std::clog << "[ItineraryService]   " << locations[i].city << ", " << locations[i].country
                  << ": " << locations[i].poiCount << " POIs" << std::endl;
    }
}

domain::GenerationResult ItineraryService::generate(const domain::ItineraryRequest& requestIn) const {
    using domain::GenerationResult;
    using domain::ItineraryErrorKind;

    domain::ItineraryRequest request = requestIn;
    if (request.planSize < domain::ItineraryRequest::kMinPlanSize ||
        request.planSize > domain::ItineraryRequest::kMaxPlanSize) {
        std::cerr << "[ItineraryService] Plan size " << request.planSize << " out of range, clamping." << std::endl;
        request.planSize = std::clamp(request.planSize, domain::ItineraryRequest::kMinPlanSize,
                                      domain::ItineraryRequest::kMaxPlanSize);
    }

    std::clog << "[ItineraryService] Building itinerary for city=" << request.city
              << ", country=" << request.country
              << ", theme=" << domain::ThemeToString(request.theme)
              << ", plan_size=" << request.planSize
              << ", window=" << request.startTime.toString() << "-" << request.endTime.toString()
              << ", lang=" << request.language << std::endl;

    if (!(request.startTime < request.endTime)) {
        return GenerationResult::Failure(ItineraryErrorKind::InvalidWindow,
                                         "Start time " + request.startTime.toString() +
                                         " is not before end time " + request.endTime.toString() + ".");
    }

    const auto catalog = m_catalog->findByLocation(request.city, request.country, request.language);
    if (catalog.empty()) {
        std::cerr << "[ItineraryService] No places found for " << request.city << ", " << request.country << std::endl;
        logAvailableLocations();
        return GenerationResult::Failure(ItineraryErrorKind::NoPoisFound,
                                         "No places found for " + request.city + ", " + request.country + ".");
    }

    const auto& descriptor = m_themes.get(request.theme);
    auto outcome = m_selector.select(catalog, descriptor, request.planSize);
    if (outcome.error) {
        std::cerr << "[ItineraryService] Selection failed: " << domain::ErrorKindToString(outcome.error->kind)
                  << " (" << outcome.error->message << ")" << std::endl;
        return GenerationResult::Failure(outcome.error->kind, outcome.error->message);
    }

    const auto& selection = *outcome.selection;
    const auto ordered = selection.ordered();
    if (static_cast<int>(ordered.size()) < request.planSize) {
        std::clog << "[ItineraryService] Only " << ordered.size() << " of " << request.planSize
                  << " slots can be filled; shrinking itinerary." << std::endl;
    }
    if (selection.backfilled) {
        std::clog << "[ItineraryService] Category cap " << selection.categoryCap
                  << " relaxed to fill the plan." << std::endl;
    }

    const auto timeSlots = m_scheduler.schedule(request.startTime, request.endTime, ordered.size());
    if (timeSlots.size() != ordered.size()) {
        return GenerationResult::Failure(ItineraryErrorKind::InvalidWindow,
                                         "Window " + request.startTime.toString() + "-" + request.endTime.toString() +
                                         " cannot hold " + std::to_string(ordered.size()) + " slots.");
    }

    domain::Itinerary itinerary;
    itinerary.request = request;
    itinerary.name = BuildName(request.city);
    itinerary.shortDescription = BuildShortDescription(request, ordered.size());
    itinerary.slots.reserve(ordered.size());
    for (size_t i = 0; i < ordered.size(); ++i) {
        const auto& scored = ordered[i];
        domain::ScheduledSlot slot;
        slot.start = timeSlots[i].start;
        slot.end = timeSlots[i].end;
        slot.poi.id = scored.poi->id;
        slot.poi.name = scored.poi->displayName();
        slot.poi.category = scored.poi->category;
        slot.poi.matchedThemes = m_scorer.classifyThemes(*scored.poi, m_themes);
        slot.relevanceScore = RoundScore(scored.score);
        itinerary.slots.push_back(std::move(slot));
    }

    const auto check = m_validator.Validate(itinerary);
    if (!check.valid) {
        std::string message;
        for (const auto& violation : check.violations) {
            std::cerr << "[ItineraryService] FATAL invariant violation: " << violation << std::endl;
            if (!message.empty()) message += "; ";
            message += violation;
        }
        return GenerationResult::Failure(ItineraryErrorKind::SchedulingInvariantViolation, message);
    }

    std::clog << "[ItineraryService] Scheduled " << itinerary.slots.size() << " slots for "
              << request.city << ", " << request.country << std::endl;
    return GenerationResult::Success(std::move(itinerary));
}

} // namespace trekplanner::application
