/**
 * @file SemanticMatcher.cpp
 * @brief Implementation of SemanticMatcher.
 */

#include "application/SemanticMatcher.hpp"
#include <cmath>
#include <iostream>

namespace ledgerwise::application {

SemanticMatcher::SemanticMatcher(std::shared_ptr<domain::EmbeddingProvider> provider,
                                 const std::vector<domain::SemanticExample>& examples,
                                 double similarityThreshold)
    : m_provider(std::move(provider)), m_threshold(similarityThreshold) {
    if (!m_provider || !m_provider->isAvailable()) {
        std::cerr << "[SemanticMatcher] Embedding provider unavailable. Semantic matching disabled." << std::endl;
        return;
    }

    m_cache = infrastructure::EmbeddingCache::Build(*m_provider, examples);
    if (m_cache.empty()) {
        std::cerr << "[SemanticMatcher] No example embeddings available. Semantic matching disabled." << std::endl;
        return;
    }

    m_available = true;
    std::cout << "[SemanticMatcher] Initialized with threshold " << m_threshold << std::endl;
}

std::optional<SemanticMatch> SemanticMatcher::match(const std::string& text) const {
    if (!m_available || text.empty()) {
        return std::nullopt;
    }

    auto query = m_provider->embed(text);
    if (query.empty()) {
        std::cerr << "[SemanticMatcher] Could not embed input text" << std::endl;
        return std::nullopt;
    }

    const infrastructure::EmbeddingCache::Bucket* bestBucket = nullptr;
    size_t bestIndex = 0;
    double bestScore = -1.0;

    for (const auto& bucket : m_cache.buckets()) {
        for (size_t i = 0; i < bucket.vectors.size(); ++i) {
            double sim = CosineSimilarity(query, bucket.vectors[i]);
            if (sim > bestScore) {  // strict: earlier buckets keep ties
                bestScore = sim;
                bestBucket = &bucket;
                bestIndex = i;
            }
        }
    }

    if (!bestBucket || bestScore < m_threshold) {
        return std::nullopt;
    }

    SemanticMatch result;
    result.category = bestBucket->category;
    result.subcategory = bestBucket->subcategory;
    result.similarityScore = bestScore;
    result.bestExample = bestBucket->examples[bestIndex];
    return result;
}

SemanticMatcherStats SemanticMatcher::stats() const {
    SemanticMatcherStats stats;
    stats.modelAvailable = m_available;
    stats.modelName = m_provider ? m_provider->modelName() : std::string();
    stats.categoriesCached = m_cache.size();
    stats.similarityThreshold = m_threshold;
    return stats;
}

double SemanticMatcher::CosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2) {
    if (v1.size() != v2.size() || v1.empty()) return 0.0;
    double dot = 0, n1 = 0, n2 = 0;
    for (size_t i = 0; i < v1.size(); ++i) {
        dot += static_cast<double>(v1[i]) * v2[i];
        n1 += static_cast<double>(v1[i]) * v1[i];
        n2 += static_cast<double>(v2[i]) * v2[i];
    }
    double norm = std::sqrt(n1) * std::sqrt(n2);
    return (norm > 0) ? (dot / norm) : 0.0;
}

} // namespace ledgerwise::application
