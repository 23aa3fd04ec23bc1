/**
 * @file CandidateSelector.hpp
 * @brief Chooses the hotel and a diverse, theme-ranked set of activities.
 */

#pragma once

#include <optional>
#include <vector>

#include "application/RelevanceScorer.hpp"
#include "domain/ItineraryError.hpp"
#include "domain/Poi.hpp"
#include "domain/ThemeDescriptor.hpp"

namespace trekplanner::application {

/**
 * @struct CandidateSelection
 * @brief One hotel plus up to planSize - 1 activities, in visiting order.
 */
struct CandidateSelection {
    ScoredPoi hotel;
    std::vector<ScoredPoi> activities;
    size_t categoryCap = 0;  ///< Per-category limit applied in the first pass.
    bool backfilled = false; ///< True if the cap had to be relaxed to fill slots.

    /** @brief [hotel, activity_1, ..., activity_k]. */
    std::vector<ScoredPoi> ordered() const {
        std::vector<ScoredPoi> out;
        out.reserve(activities.size() + 1);
        out.push_back(hotel);
        out.insert(out.end(), activities.begin(), activities.end());
        return out;
    }
};

struct SelectionOutcome {
    std::optional<CandidateSelection> selection;
    std::optional<domain::ItineraryError> error;
};

/**
 * @class CandidateSelector
 * @brief Partitions the catalog, picks the best hotel and walks the ranked
 *        activities under a per-category cap.
 *
 * When the cap leaves slots empty, skipped activities are admitted in rank
 * order, so the plan only shrinks when the catalog itself is too small.
 */
class CandidateSelector {
public:
    explicit CandidateSelector(RelevanceScorer scorer);

    /**
     * @param catalog POIs of one (city, country), in catalog order. Must outlive the result.
     * @param descriptor Descriptor of the requested theme.
     * @param planSize Requested slot count including the hotel.
     */
    SelectionOutcome select(const std::vector<domain::Poi>& catalog,
                            const domain::ThemeDescriptor& descriptor,
                            int planSize) const;

    /** @brief ceil(activitySlots / distinctCategories), at least 1. */
    static size_t CategoryCap(size_t activitySlots, size_t distinctCategories);

    /**
     * @brief Reorders picks so neighbours differ in category where possible.
     *
     * Each position takes the best-ranked remaining pick whose category differs
     * from the previous one and still leaves an alternating order for the rest.
     * When no such order exists, the category with most picks left goes next.
     */
    static std::vector<ScoredPoi> ArrangeForVariety(const std::vector<ScoredPoi>& picks);

private:
    RelevanceScorer m_scorer;
};

} // namespace trekplanner::application
