/**
 * @file CandidateSelector.cpp
 * @brief Implementation of CandidateSelector.
 */

#include "application/CandidateSelector.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace trekplanner::application {

CandidateSelector::CandidateSelector(RelevanceScorer scorer) : m_scorer(scorer) {}

size_t CandidateSelector::CategoryCap(size_t activitySlots, size_t distinctCategories) {
    if (distinctCategories == 0) return std::max<size_t>(activitySlots, 1);
    const size_t cap = (activitySlots + distinctCategories - 1) / distinctCategories;
    return std::max<size_t>(cap, 1);
}

namespace {

// True when the picks can be ordered with no two neighbours sharing a
// category, given the category placed just before them.
bool CanAlternate(const std::map<domain::PoiCategory, size_t>& counts, size_t total,
                  const std::optional<domain::PoiCategory>& previous) {
    for (const auto& [category, count] : counts) {
        const size_t others = total - count;
        const size_t allowed = (previous && *previous == category) ? others : others + 1;
        if (count > allowed) return false;
    }
    return true;
}

} // namespace

std::vector<ScoredPoi> CandidateSelector::ArrangeForVariety(const std::vector<ScoredPoi>& picks) {
    std::vector<ScoredPoi> remaining = picks;
    std::vector<ScoredPoi> arranged;
    arranged.reserve(picks.size());

    std::map<domain::PoiCategory, size_t> counts;
    for (const auto& p : picks) counts[p.poi->category]++;

    std::optional<domain::PoiCategory> previous;
    while (!remaining.empty()) {
        auto next = remaining.end();

        // Best-ranked pick that differs from the previous one and keeps the rest alternating.
        for (auto it = remaining.begin(); it != remaining.end(); ++it) {
            const auto category = it->poi->category;
            if (previous && *previous == category) continue;
            counts[category]--;
            const bool feasible = CanAlternate(counts, remaining.size() - 1, category);
            counts[category]++;
            if (feasible) {
                next = it;
                break;
            }
        }

        // No perfect order left: take the category with most picks remaining, other than the previous one.
        if (next == remaining.end()) {
            size_t best = 0;
            for (auto it = remaining.begin(); it != remaining.end(); ++it) {
                const auto category = it->poi->category;
                if (previous && *previous == category) continue;
                if (counts[category] > best) {
                    best = counts[category];
                    next = it;
                }
            }
        }
        if (next == remaining.end()) {
            next = remaining.begin();
        }

        previous = next->poi->category;
        counts[next->poi->category]--;
        arranged.push_back(*next);
        remaining.erase(next);
    }
    return arranged;
}

SelectionOutcome CandidateSelector::select(const std::vector<domain::Poi>& catalog,
                                           const domain::ThemeDescriptor& descriptor,
                                           int planSize) const {
    SelectionOutcome outcome;
    if (catalog.empty()) {
        outcome.error = domain::ItineraryError{domain::ItineraryErrorKind::NoPoisFound,
                                               "Catalog has no POIs for the requested location."};
        return outcome;
    }

    // Step 1: partition.
    std::vector<size_t> hotelIdx;
    std::vector<size_t> activityIdx;
    for (size_t i = 0; i < catalog.size(); ++i) {
        (catalog[i].isHotel() ? hotelIdx : activityIdx).push_back(i);
    }

    // Step 2: exactly one hotel.
    if (hotelIdx.empty()) {
        outcome.error = domain::ItineraryError{domain::ItineraryErrorKind::NoHotelAvailable,
                                               "Catalog has " + std::to_string(activityIdx.size()) +
                                               " activities but no hotel."};
        return outcome;
    }
    const auto rankedHotels = m_scorer.rank(catalog, hotelIdx, descriptor);

    CandidateSelection selection;
    selection.hotel = rankedHotels.front();

    const size_t activitySlots = planSize > 1 ? static_cast<size_t>(planSize - 1) : 0;
    if (activitySlots == 0) {
        outcome.selection = selection;
        return outcome;
    }
    if (activityIdx.empty()) {
        outcome.error = domain::ItineraryError{domain::ItineraryErrorKind::InsufficientCandidates,
                                               "Catalog has a hotel but no activities; " +
                                               std::to_string(activitySlots) + " requested."};
        return outcome;
    }

    // Step 3: rank activities.
    const auto ranked = m_scorer.rank(catalog, activityIdx, descriptor);

    std::set<domain::PoiCategory> categories;
    for (const auto& sp : ranked) categories.insert(sp.poi->category);
    selection.categoryCap = CategoryCap(activitySlots, categories.size());

    // Step 4: capped walk, then backfill from what the cap skipped.
    std::map<domain::PoiCategory, size_t> perCategory;
    std::set<long long> seenIds{selection.hotel.poi->id};
    std::vector<ScoredPoi> picks;
    std::vector<ScoredPoi> skipped;

    for (const auto& candidate : ranked) {
        if (picks.size() >= activitySlots) break;
        if (seenIds.count(candidate.poi->id)) continue;
        if (perCategory[candidate.poi->category] >= selection.categoryCap) {
            skipped.push_back(candidate);
            continue;
        }
        picks.push_back(candidate);
        perCategory[candidate.poi->category]++;
        seenIds.insert(candidate.poi->id);
    }

    for (const auto& candidate : skipped) {
        if (picks.size() >= activitySlots) break;
        if (seenIds.count(candidate.poi->id)) continue;
        picks.push_back(candidate);
        seenIds.insert(candidate.poi->id);
        selection.backfilled = true;
    }

    if (picks.empty()) {
        outcome.error = domain::ItineraryError{domain::ItineraryErrorKind::InsufficientCandidates,
                                               "No activity distinct from the chosen hotel."};
        return outcome;
    }

    std::stable_sort(picks.begin(), picks.end(), RanksBefore);
    selection.activities = ArrangeForVariety(picks);
    outcome.selection = selection;
    return outcome;
}

} // namespace trekplanner::application
