#include <cassert>
#include <cmath>
#include <iostream>

#include "application/RelevanceScorer.hpp"
#include "test/TestSupport.hpp"

using namespace trekplanner;
using application::RelevanceScorer;
using domain::PoiCategory;
using domain::Theme;
using test::MakePoi;

namespace {

bool Near(double a, double b) {
    return std::fabs(a - b) < 1e-6;
}

} // namespace

int main() {
    std::cout << "[Test] Starting RelevanceScorer Test..." << std::endl;

    const auto table = domain::ThemeDescriptorTable::Defaults();
    const auto& cultural = table.get(Theme::Cultural);
    RelevanceScorer scorer;

    // Keyword overlap: "museum" and "historic" out of ten cultural keywords.
    auto museum = MakePoi(1, PoiCategory::TouristPlace, "Egyptian Museum", "historic museum of antiquities");
    assert(Near(scorer.keywordScore(museum, cultural), 0.2));
    assert(Near(scorer.score(museum, cultural), 0.2));
    assert(Near(scorer.score(museum, table.get(Theme::Adventure)), 0.0));

    // Deterministic.
    assert(scorer.score(museum, cultural) == scorer.score(museum, cultural));

    // Category name takes part in matching: foodies "restaurant".
    auto diner = MakePoi(2, PoiCategory::Restaurant, "Abou Tarek", "koshary");
    assert(Near(scorer.keywordScore(diner, table.get(Theme::Foodies)), 1.0 / 7.0));

    // Precomputed keyword weights count even when the text lacks the word.
    auto ruins = MakePoi(3, PoiCategory::TouristPlace, "Old Town", "walls");
    ruins.features = domain::FeatureVector{{}, {{"ruins", 0.5f}, {"museum", 2.0f}}};
    assert(Near(scorer.keywordScore(ruins, cultural), (0.5 + 1.0) / 10.0));

    // Theme tag adds the descriptor boost; the result is clamped to 1.
    auto tagged = museum;
    tagged.themeTags.push_back(Theme::Cultural);
    assert(Near(scorer.score(tagged, cultural), 0.2 + cultural.boost));
    auto everything = MakePoi(4, PoiCategory::TouristPlace, "All",
                              "museum monument historic temple gallery heritage church mosque castle ruins");
    everything.themeTags.push_back(Theme::Cultural);
    assert(Near(scorer.score(everything, cultural), 1.0));

    // Embedding blend: cosine 1 with keyword 0 -> 0.5 under default weights.
    auto withEmbedding = MakePoi(5, PoiCategory::Other, "Somewhere", "nothing in particular");
    withEmbedding.features = domain::FeatureVector{{1.0f, 0.0f}, {}};
    auto embeddedCultural = cultural;
    embeddedCultural.embedding = {2.0f, 0.0f};
    assert(Near(scorer.score(withEmbedding, embeddedCultural), 0.5));

    withEmbedding.features->embedding = {0.0f, 1.0f};
    assert(Near(scorer.score(withEmbedding, embeddedCultural), 0.0));

    // Opposite direction does not go negative.
    withEmbedding.features->embedding = {-1.0f, 0.0f};
    assert(Near(scorer.score(withEmbedding, embeddedCultural), 0.0));

    // Dimension mismatch falls back to keywords.
    withEmbedding.features->embedding = {1.0f, 0.0f, 0.0f};
    assert(Near(scorer.score(withEmbedding, embeddedCultural), 0.0));
    assert(Near(scorer.score(museum, embeddedCultural), 0.2));

    // Custom weights are normalised.
    RelevanceScorer semanticOnly(application::ScoringWeights{3.0, 0.0});
    withEmbedding.features->embedding = {1.0f, 0.0f};
    assert(Near(semanticOnly.score(withEmbedding, embeddedCultural), 1.0));

    assert(RelevanceScorer::cosineSimilarity({0.0f, 0.0f}, {1.0f, 0.0f}) == 0.0f);
    assert(RelevanceScorer::cosineSimilarity({}, {}) == 0.0f);

    // Heuristic multi-label classification.
    auto street = MakePoi(6, PoiCategory::Restaurant, "Koshary Abou Tarek", "street food restaurant");
    auto themes = scorer.classifyThemes(street, table);
    assert(themes.size() == 1 && themes[0] == Theme::Foodies);
    themes = scorer.classifyThemes(museum, table);
    assert(themes.size() == 1 && themes[0] == Theme::Cultural);

    // Ranking: score, then popularity, then catalog order.
    std::vector<domain::Poi> catalog = {
        MakePoi(10, PoiCategory::Shop, "Plain A", "nothing"),
        MakePoi(11, PoiCategory::Shop, "Plain B", "nothing"),
        MakePoi(12, PoiCategory::Shop, "Plain C", "nothing"),
        museum,
    };
    catalog[2].popularity = 4.5;
    auto ranked = scorer.rank(catalog, {0, 1, 2, 3}, cultural);
    assert(ranked.size() == 4);
    assert(ranked[0].poi->id == 1);
    assert(ranked[1].poi->id == 12);
    assert(ranked[2].poi->id == 10 && ranked[2].catalogIndex == 0);
    assert(ranked[3].poi->id == 11);

    // Theme names: case and surrounding blanks ignored, inner blanks rejected.
    assert(domain::ThemeFromString("  Cultural\t") == Theme::Cultural);
    assert(domain::ThemeFromString("FOODIES") == Theme::Foodies);
    assert(!domain::ThemeFromString("cul tural"));
    assert(!domain::ThemeFromString(""));

    std::cout << "[PASS] RelevanceScorer Test." << std::endl;
    return 0;
}
