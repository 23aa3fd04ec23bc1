/**
 * @file ThemeEmbeddingService.cpp
 * @brief Implementation of ThemeEmbeddingService.
 */

#include "application/ThemeEmbeddingService.hpp"

#include <functional>
#include <iostream>

namespace trekplanner::application {

ThemeEmbeddingService::ThemeEmbeddingService(std::shared_ptr<domain::EmbeddingProvider> provider,
                                             const std::string& cacheFile)
    : m_provider(std::move(provider)) {
    m_cache = std::make_unique<infrastructure::EmbeddingCache>(cacheFile);
    m_cache->load();
}

domain::ThemeDescriptorTable ThemeEmbeddingService::enrich(const domain::ThemeDescriptorTable& table) {
    domain::ThemeDescriptorTable result = table;
    bool changed = false;

    for (const auto& [theme, descriptor] : table.all()) {
        const std::string key = domain::ThemeToString(theme);
        const std::string text = descriptor.descriptorText();
        const std::string hash = computeHash(m_provider->getCurrentModel() + "\n" + text);

        auto cached = m_cache->get(key, hash);
        std::vector<float> vec;
        if (cached) {
            vec = *cached;
        } else {
            vec = m_provider->getEmbedding(text);
            if (vec.empty()) {
                std::cerr << "[ThemeEmbeddingService] No embedding for theme '" << key
                          << "'; keyword scoring only." << std::endl;
                continue;
            }
            m_cache->update(key, hash, vec);
            changed = true;
        }

        domain::ThemeDescriptor enriched = descriptor;
        enriched.embedding = std::move(vec);
        result = result.with(enriched);
    }

    if (changed) {
        m_cache->persist();
    }
    return result;
}

std::string ThemeEmbeddingService::computeHash(const std::string& text) const {
    return std::to_string(std::hash<std::string>{}(text));
}

} // namespace trekplanner::application
