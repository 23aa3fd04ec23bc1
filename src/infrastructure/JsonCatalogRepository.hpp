/**
 * @file JsonCatalogRepository.hpp
 * @brief CatalogRepository loaded from a JSON catalog file.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/CatalogRepository.hpp"

namespace trekplanner::infrastructure {

/**
 * @class JsonCatalogRepository
 * @brief In-memory catalog built once from JSON and never modified afterwards.
 *
 * Expected layout:
 * @code
 * { "pois": [ { "id": 1, "city": "Cairo", "country": "Egypt", "type": "Museum",
 *               "popularity": 4.6, "themes": ["cultural"],
 *               "texts": { "en": { "name": "...", "short_description": "...", "description": "..." } },
 *               "embedding": [0.1, ...], "keywords": { "museum": 0.9 } } ] }
 * @endcode
 */
class JsonCatalogRepository : public domain::CatalogRepository {
public:
    /**
     * @brief Loads the catalog file.
     * @throws std::runtime_error if the file cannot be opened or is not a catalog.
     */
    JsonCatalogRepository(const std::string& catalogPath, const std::string& defaultLanguage = "en");

    /**
     * @brief Builds a catalog from an already parsed document.
     * @throws std::runtime_error if the document is not a catalog.
     */
    static std::shared_ptr<JsonCatalogRepository> FromDocument(const nlohmann::json& document,
                                                               const std::string& defaultLanguage = "en");

    std::vector<domain::Poi> findByLocation(const std::string& city,
                                            const std::string& country,
                                            const std::string& language) const override;

    std::vector<domain::LocationSummary> listLocations() const override;

    std::vector<domain::LocationSummary> suggestLocations(const std::string& partialCity,
                                                          const std::string& partialCountry) const override;

    size_t size() const { return m_pois.size(); }

private:
    struct EmptyTag {};
    JsonCatalogRepository(EmptyTag, const std::string& defaultLanguage);

    void loadDocument(const nlohmann::json& document);
    std::string resolveLanguage(const domain::Poi& poi, const std::string& requested) const;

    std::string m_defaultLanguage;
    std::vector<domain::Poi> m_pois;
    std::map<std::pair<std::string, std::string>, std::vector<size_t>> m_byLocation;
};

} // namespace trekplanner::infrastructure
