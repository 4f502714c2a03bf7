/**
 * @file OllamaEmbeddingProvider.hpp
 * @brief EmbeddingProvider backed by a local Ollama server.
 */

#pragma once
#include "domain/EmbeddingProvider.hpp"
#include "infrastructure/OllamaClient.hpp"
#include <string>

namespace ledgerwise::infrastructure {

/**
 * @class OllamaEmbeddingProvider
 * @brief Probes the server once at construction; if that fails the provider
 * stays unavailable for the life of the process.
 */
class OllamaEmbeddingProvider : public domain::EmbeddingProvider {
public:
    /**
     * @param host Server hostname or IP.
     * @param port Server port.
     * @param model Embedding model name, e.g. "nomic-embed-text".
     */
    OllamaEmbeddingProvider(const std::string& host, int port, const std::string& model);

    bool isAvailable() const override { return m_available; }
    std::vector<float> embed(const std::string& text) override;
    std::string modelName() const override { return m_model; }

private:
    void probe();

    OllamaClient m_client;
    std::string m_model;
    bool m_available = false;
};

} // namespace ledgerwise::infrastructure
