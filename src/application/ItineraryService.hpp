/**
 * @file ItineraryService.hpp
 * @brief Application service that turns a request into a validated itinerary.
 */

#pragma once

#include <memory>
#include <string>

#include "application/CandidateSelector.hpp"
#include "application/ItineraryValidator.hpp"
#include "application/RelevanceScorer.hpp"
#include "application/TimeSlotScheduler.hpp"
#include "domain/CatalogRepository.hpp"
#include "domain/Itinerary.hpp"
#include "domain/ItineraryRequest.hpp"
#include "domain/ThemeDescriptor.hpp"

namespace trekplanner::application {

/**
 * @class ItineraryService
 * @brief Orchestrates catalog lookup, candidate selection and scheduling.
 *
 * generate() is const and touches no shared mutable state, so one instance can
 * serve concurrent requests as long as the catalog allows concurrent reads.
 */
class ItineraryService {
public:
    ItineraryService(std::shared_ptr<const domain::CatalogRepository> catalog,
                     domain::ThemeDescriptorTable themes,
                     ScoringWeights weights = {},
                     SchedulerOptions schedulerOptions = {});

    /**
     * @brief Builds one itinerary.
     * @return The itinerary, or a classified error. Never a partially valid plan.
     */
    domain::GenerationResult generate(const domain::ItineraryRequest& request) const;

    const domain::ThemeDescriptorTable& themes() const { return m_themes; }

    /** @brief "1-Day Cairo Explorer" style title. */
    static std::string BuildName(const std::string& city);

    static std::string BuildShortDescription(const domain::ItineraryRequest& request, size_t places);

private:
    void logAvailableLocations() const;

    std::shared_ptr<const domain::CatalogRepository> m_catalog;
    domain::ThemeDescriptorTable m_themes;
    RelevanceScorer m_scorer;
    CandidateSelector m_selector;
    TimeSlotScheduler m_scheduler;
    ItineraryValidator m_validator;
};

} // namespace trekplanner::application
