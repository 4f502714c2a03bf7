/**
 * @file OllamaEmbeddingProvider.cpp
 * @brief Implementation of OllamaEmbeddingProvider.
 */
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include <iostream>

namespace ledgerwise::infrastructure {

OllamaEmbeddingProvider::OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model)
    : m_client(host, port), m_model(model) {
    probe();
}

void OllamaEmbeddingProvider::probe() {
    auto models = m_client.getAvailableModels();
    if (!models) {
        std::cerr << "[OllamaEmbeddingProvider] Failed to list models. Is Ollama running? Semantic matching disabled." << std::endl;
        return;
    }

    bool found = false;
    for (const auto& name : *models) {
        // Tags come back as "nomic-embed-text:latest".
        if (name == m_model || name.rfind(m_model + ":", 0) == 0) {
            found = true;
            break;
        }
    }
    if (!found) {
        std::cerr << "[OllamaEmbeddingProvider] Model " << m_model << " not installed. Semantic matching disabled." << std::endl;
        return;
    }

    if (m_client.getEmbedding(m_model, "probe").empty()) {
        std::cerr << "[OllamaEmbeddingProvider] Probe embedding failed. Semantic matching disabled." << std::endl;
        return;
    }

    m_available = true;
    std::cout << "[OllamaEmbeddingProvider] Using embedding model: " << m_model << std::endl;
}

std::vector<float> OllamaEmbeddingProvider::embed(const std::string& text) {
    if (!m_available) return {};
    return m_client.getEmbedding(m_model, text);
}

} // namespace ledgerwise::infrastructure
