/**
 * @file EmbeddingCache.cpp
 * @brief Implementation of EmbeddingCache.
 */

#include "infrastructure/EmbeddingCache.hpp"
#include <iostream>

namespace ledgerwise::infrastructure {

EmbeddingCache EmbeddingCache::Build(domain::EmbeddingProvider& provider,
                                     const std::vector<domain::SemanticExample>& examples) {
    EmbeddingCache cache;
    if (!provider.isAvailable()) {
        return cache;
    }

    std::cout << "[EmbeddingCache] Computing embeddings for " << examples.size() << " example sets..." << std::endl;
    for (const auto& example : examples) {
        Bucket bucket;
        bucket.category = example.category;
        bucket.subcategory = example.subcategory;

        for (const auto& phrase : example.phrases) {
            auto vec = provider.embed(phrase);
            if (vec.empty()) {
                std::cerr << "[EmbeddingCache] Failed to embed example for "
                          << example.category << "/" << example.subcategory << ": " << phrase << std::endl;
                continue;
            }
            bucket.examples.push_back(phrase);
            bucket.vectors.push_back(std::move(vec));
        }

        if (!bucket.vectors.empty()) {
            cache.m_buckets.push_back(std::move(bucket));
        }
    }
    std::cout << "[EmbeddingCache] Computed embeddings for " << cache.m_buckets.size() << " categories" << std::endl;
    return cache;
}

} // namespace ledgerwise::infrastructure
