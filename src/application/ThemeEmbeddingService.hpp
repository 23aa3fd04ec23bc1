/**
 * @file ThemeEmbeddingService.hpp
 * @brief Attaches semantic embeddings to theme descriptors at startup.
 */

#pragma once

#include <memory>
#include <string>

#include "domain/EmbeddingProvider.hpp"
#include "domain/ThemeDescriptor.hpp"
#include "infrastructure/EmbeddingCache.hpp"

namespace trekplanner::application {

/**
 * @class ThemeEmbeddingService
 * @brief Embeds each theme descriptor once, reusing cached vectors whose
 *        descriptor text and model are unchanged.
 *
 * Runs before requests are served; the per-request core never calls it.
 */
class ThemeEmbeddingService {
public:
    ThemeEmbeddingService(std::shared_ptr<domain::EmbeddingProvider> provider, const std::string& cacheFile);

    /**
     * @brief Returns a copy of the table with embeddings filled in.
     *
     * Themes whose embedding cannot be obtained keep an empty vector and are
     * scored by keywords alone.
     */
    domain::ThemeDescriptorTable enrich(const domain::ThemeDescriptorTable& table);

private:
    std::string computeHash(const std::string& text) const;

    std::shared_ptr<domain::EmbeddingProvider> m_provider;
    std::unique_ptr<infrastructure::EmbeddingCache> m_cache;
};

} // namespace trekplanner::application
