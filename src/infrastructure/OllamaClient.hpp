/**
 * @file OllamaClient.hpp
 * @brief Low-level HTTP client for the Ollama REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ledgerwise::infrastructure {

class OllamaClient {
public:
    OllamaClient(const std::string& host = "localhost", int port = 11434);

    /** @brief Sends a POST request to /api/embeddings. Empty on any failure. */
    std::vector<float> getEmbedding(const std::string& model, const std::string& text);

    /** @brief Fetches available models from /api/tags. nullopt if the server is unreachable. */
    std::optional<std::vector<std::string>> getAvailableModels();

private:
    std::string m_host;
    int m_port;
    int m_readTimeout = 30;
};

} // namespace ledgerwise::infrastructure
