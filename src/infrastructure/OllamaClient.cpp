#include "infrastructure/OllamaClient.hpp"
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace ledgerwise::infrastructure {

using json = nlohmann::json;

OllamaClient::OllamaClient(const std::string& host, int port)
    : m_host(host), m_port(port) {}

std::vector<float> OllamaClient::getEmbedding(const std::string& model, const std::string& text) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(5);
    cli.set_read_timeout(m_readTimeout);

    json requestData = {
        {"model", model},
        {"prompt", text}
    };

    auto res = cli.Post("/api/embeddings", requestData.dump(), "application/json");
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("embedding") && body["embedding"].is_array()) {
                return body["embedding"].get<std::vector<float>>();
            }
        } catch (const json::exception& e) {
            std::cerr << "[OllamaClient] Embedding JSON Parse Error: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[OllamaClient] HTTP Error " << res->status << ": " << res->body << std::endl;
    } else {
        std::cerr << "[OllamaClient] Connection failed: " << httplib::to_string(res.error()) << std::endl;
    }
    return {};
}

std::optional<std::vector<std::string>> OllamaClient::getAvailableModels() {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(2);
    cli.set_read_timeout(5);

    auto res = cli.Get("/api/tags");
    if (!res || res->status != 200) {
        return std::nullopt;
    }

    std::vector<std::string> models;
    try {
        auto body = json::parse(res->body);
        if (body.contains("models") && body["models"].is_array()) {
            for (const auto& item : body["models"]) {
                if (item.contains("name")) {
                    models.push_back(item["name"].get<std::string>());
                }
            }
        }
    } catch (const json::exception& e) {
        std::cerr << "[OllamaClient] Error parsing models: " << e.what() << std::endl;
        return std::nullopt;
    }
    return models;
}

} // namespace ledgerwise::infrastructure
