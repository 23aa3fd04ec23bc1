/**
 * @file OllamaEmbeddingAdapter.cpp
 * @brief Implementation of the OllamaEmbeddingAdapter class.
 */
#include "infrastructure/OllamaEmbeddingAdapter.hpp"
#include <iostream>

namespace trekplanner::infrastructure {

OllamaEmbeddingAdapter::OllamaEmbeddingAdapter(const std::string& host, int port, const std::string& model)
    : m_client(host, port), m_model(model) {
    detectModel();
}

void OllamaEmbeddingAdapter::detectModel() {
    const auto available = m_client.getAvailableModels();
    if (available.empty()) {
        std::cerr << "[OllamaEmbeddingAdapter] Failed to list models. Is Ollama running? Keeping: " << m_model << std::endl;
        return;
    }

    for (const auto& name : available) {
        if (name.find(m_model) != std::string::npos) {
            m_model = name;
            std::clog << "[OllamaEmbeddingAdapter] Using model: " << m_model << std::endl;
            return;
        }
    }

    // Priority Hierarchy for embedding-capable models
    const std::vector<std::string> priorities = {
        "nomic-embed-text",
        "mxbai-embed-large",
        "all-minilm",
        "bge-m3"
    };
    for (const auto& priority : priorities) {
        for (const auto& name : available) {
            if (name.find(priority) != std::string::npos) {
                m_model = name;
                std::clog << "[OllamaEmbeddingAdapter] Auto-selected model: " << m_model << std::endl;
                return;
            }
        }
    }
    std::cerr << "[OllamaEmbeddingAdapter] No embedding model installed. Keeping: " << m_model << std::endl;
}

std::vector<float> OllamaEmbeddingAdapter::getEmbedding(const std::string& text) {
    return m_client.getEmbedding(m_model, text);
}

} // namespace trekplanner::infrastructure
