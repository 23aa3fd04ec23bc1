/**
 * @file OllamaEmbeddingAdapter.hpp
 * @brief EmbeddingProvider backed by a local Ollama server.
 */

#pragma once
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace trekplanner::infrastructure {

/**
 * @class OllamaEmbeddingAdapter
 * @brief Implements EmbeddingProvider using the Ollama REST API.
 */
class OllamaEmbeddingAdapter : public domain::EmbeddingProvider {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Preferred embedding model; replaced by an installed one if absent.
     */
    OllamaEmbeddingAdapter(const std::string& host, int port, const std::string& model);

    /** @see domain::EmbeddingProvider::getEmbedding */
    std::vector<float> getEmbedding(const std::string& text) override;

    std::string getCurrentModel() const override { return m_model; }

private:
    void detectModel();

    OllamaClient m_client;
    std::string m_model; ///< Target model name.
};

} // namespace trekplanner::infrastructure
