/**
 * @file EmbeddingProvider.hpp
 * @brief Interface for services that turn text into a semantic embedding.
 */

#pragma once

#include <string>
#include <vector>

namespace trekplanner::domain {

class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /**
     * @brief Generates a semantic embedding vector for the given text.
     * @return The embedding, or an empty vector if the provider failed.
     */
    virtual std::vector<float> getEmbedding(const std::string& text) = 0;

    /** @brief Name of the model producing the vectors (part of cache keys). */
    virtual std::string getCurrentModel() const = 0;
};

} // namespace trekplanner::domain
