/**
 * @file CatalogRepository.hpp
 * @brief Interface for read-only access to the POI catalog.
 */

#pragma once

#include <string>
#include <vector>

#include "Poi.hpp"

namespace trekplanner::domain {

/**
 * @struct LocationSummary
 * @brief A (city, country) pair present in the catalog and how many POIs it has.
 */
struct LocationSummary {
    std::string city;
    std::string country;
    size_t poiCount = 0;
};

/**
 * @class CatalogRepository
 * @brief Read-only POI catalog. Implementations must allow concurrent const calls.
 */
class CatalogRepository {
public:
    virtual ~CatalogRepository() = default;

    /**
     * @brief All POIs of (city, country), matched case-insensitively, in catalog order.
     * @param language Preferred text language; each POI's resolvedLanguage is set
     *        to it or to a fallback language.
     * @return Possibly empty list. Empty is not an error.
     */
    virtual std::vector<Poi> findByLocation(const std::string& city,
                                            const std::string& country,
                                            const std::string& language) const = 0;

    /** @brief Every location, most POIs first. */
    virtual std::vector<LocationSummary> listLocations() const = 0;

    /** @brief Locations whose city or country contains the given fragments. */
    virtual std::vector<LocationSummary> suggestLocations(const std::string& partialCity,
                                                          const std::string& partialCountry) const = 0;
};

} // namespace trekplanner::domain
