/**
 * @file RelevanceScorer.cpp
 * @brief Implementation of RelevanceScorer.
 */

#include "application/RelevanceScorer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace trekplanner::application {

RelevanceScorer::RelevanceScorer(ScoringWeights weights) : m_weights(weights) {
    if (m_weights.semantic < 0) m_weights.semantic = 0;
    if (m_weights.keyword < 0) m_weights.keyword = 0;
    const double total = m_weights.semantic + m_weights.keyword;
    if (total <= 0) {
        m_weights = ScoringWeights{};
    } else {
        m_weights.semantic /= total;
        m_weights.keyword /= total;
    }
}

std::string RelevanceScorer::scoringText(const domain::Poi& poi) {
    const auto& text = poi.text();
    std::string out = domain::CategoryToString(poi.category) + " " + text.name + " " +
                      text.shortDescription + " " + text.description;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

double RelevanceScorer::keywordScore(const domain::Poi& poi, const domain::ThemeDescriptor& descriptor) const {
    if (descriptor.keywords.empty()) return 0.0;

    const std::string text = scoringText(poi);
    double matched = 0.0;
    for (const auto& keyword : descriptor.keywords) {
        double weight = text.find(keyword) != std::string::npos ? 1.0 : 0.0;
        if (poi.features) {
            auto it = poi.features->keywordWeights.find(keyword);
            if (it != poi.features->keywordWeights.end()) {
                weight = std::max(weight, std::clamp(static_cast<double>(it->second), 0.0, 1.0));
            }
        }
        matched += weight;
    }
    return matched / static_cast<double>(descriptor.keywords.size());
}

double RelevanceScorer::score(const domain::Poi& poi, const domain::ThemeDescriptor& descriptor) const {
    double similarity = keywordScore(poi, descriptor);

    const bool hasEmbedding = poi.features && !poi.features->embedding.empty() &&
                              poi.features->embedding.size() == descriptor.embedding.size();
    if (hasEmbedding) {
        const double semantic = std::max(0.0f, cosineSimilarity(poi.features->embedding, descriptor.embedding));
        similarity = m_weights.semantic * semantic + m_weights.keyword * similarity;
    }

    if (poi.hasThemeTag(descriptor.theme)) {
        similarity += descriptor.boost;
    }
    return std::clamp(similarity, 0.0, 1.0);
}

std::vector<domain::Theme> RelevanceScorer::classifyThemes(const domain::Poi& poi,
                                                           const domain::ThemeDescriptorTable& table) const {
    const std::string text = scoringText(poi);
    std::vector<domain::Theme> hits;
    for (const auto& [theme, descriptor] : table.all()) {
        for (const auto& keyword : descriptor.keywords) {
            if (text.find(keyword) != std::string::npos) {
                hits.push_back(theme);
                break;
            }
        }
    }
    return hits;
}

bool RanksBefore(const ScoredPoi& a, const ScoredPoi& b) {
    if (a.score != b.score) return a.score > b.score;
    const double popA = a.poi->popularity.value_or(0.0);
    const double popB = b.poi->popularity.value_or(0.0);
    if (popA != popB) return popA > popB;
    return a.catalogIndex < b.catalogIndex;
}

std::vector<ScoredPoi> RelevanceScorer::rank(const std::vector<domain::Poi>& catalog,
                                             const std::vector<size_t>& indices,
                                             const domain::ThemeDescriptor& descriptor) const {
    std::vector<ScoredPoi> ranked;
    ranked.reserve(indices.size());
    for (size_t idx : indices) {
        const domain::Poi& poi = catalog.at(idx);
        ranked.push_back({&poi, score(poi, descriptor), idx});
    }
    std::stable_sort(ranked.begin(), ranked.end(), RanksBefore);
    return ranked;
}

float RelevanceScorer::cosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2) {
    if (v1.size() != v2.size() || v1.empty()) return 0.0f;
    float dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < v1.size(); ++i) {
        dot += v1[i] * v2[i];
        n1 += v1[i] * v1[i];
        n2 += v2[i] * v2[i];
    }
    float norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0f;
}

} // namespace trekplanner::application
