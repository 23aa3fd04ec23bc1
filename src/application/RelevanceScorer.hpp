/**
 * @file RelevanceScorer.hpp
 * @brief Scores POIs against a theme descriptor.
 */

#pragma once

#include <vector>

#include "domain/Poi.hpp"
#include "domain/ThemeDescriptor.hpp"

namespace trekplanner::application {

/**
 * @struct ScoringWeights
 * @brief Blend of semantic and keyword similarity when both are available.
 */
struct ScoringWeights {
    double semantic = 0.5;
    double keyword = 0.5;
};

/**
 * @struct ScoredPoi
 * @brief A POI with its relevance to the requested theme.
 */
struct ScoredPoi {
    const domain::Poi* poi = nullptr; ///< Points into the caller's candidate list.
    double score = 0.0;               ///< In [0, 1].
    size_t catalogIndex = 0;          ///< Position in catalog order, for stable tie-breaks.
};

/**
 * @class RelevanceScorer
 * @brief Deterministic theme relevance: keyword overlap, optionally blended with
 *        cosine similarity of precomputed embeddings.
 *
 * Stateless apart from its weights; safe to share across threads.
 */
class RelevanceScorer {
public:
    explicit RelevanceScorer(ScoringWeights weights = {});

    /** @brief Relevance of one POI in [0, 1]. */
    double score(const domain::Poi& poi, const domain::ThemeDescriptor& descriptor) const;

    /** @brief Fraction of descriptor keywords found in the POI (weighted). */
    double keywordScore(const domain::Poi& poi, const domain::ThemeDescriptor& descriptor) const;

    /** @brief Every theme whose keywords appear in the POI text. */
    std::vector<domain::Theme> classifyThemes(const domain::Poi& poi,
                                              const domain::ThemeDescriptorTable& table) const;

    /**
     * @brief Scores and ranks a subset of the catalog.
     * @param catalog POIs in catalog order.
     * @param indices Positions in catalog to rank.
     * @return Score descending, then popularity, then catalog order.
     */
    std::vector<ScoredPoi> rank(const std::vector<domain::Poi>& catalog,
                                const std::vector<size_t>& indices,
                                const domain::ThemeDescriptor& descriptor) const;

    static float cosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2);

private:
    static std::string scoringText(const domain::Poi& poi);

    ScoringWeights m_weights;
};

/** @brief Ranking order used for both hotels and activities. */
bool RanksBefore(const ScoredPoi& a, const ScoredPoi& b);

} // namespace trekplanner::application
