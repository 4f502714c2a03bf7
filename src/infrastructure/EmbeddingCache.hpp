/**
 * @file EmbeddingCache.hpp
 * @brief Precomputed embeddings for the semantic example buckets.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/EmbeddingProvider.hpp"
#include "domain/SemanticExample.hpp"

namespace ledgerwise::infrastructure {

/**
 * @class EmbeddingCache
 * @brief Holds one vector per example phrase, grouped by bucket in the order
 * the buckets were added.
 *
 * Built once and read-only afterwards; it is never persisted, so a restart
 * recomputes it.
 */
class EmbeddingCache {
public:
    struct Bucket {
        std::string category;
        std::string subcategory;
        std::vector<std::string> examples;
        std::vector<std::vector<float>> vectors; ///< Parallel to examples.
    };

    EmbeddingCache() = default;

    /**
     * @brief Embeds every phrase of every example set.
     *
     * Phrases whose embedding fails are left out; a bucket with no vectors is
     * dropped entirely.
     */
    static EmbeddingCache Build(domain::EmbeddingProvider& provider,
                                const std::vector<domain::SemanticExample>& examples);

    const std::vector<Bucket>& buckets() const { return m_buckets; }
    bool empty() const { return m_buckets.empty(); }
    size_t size() const { return m_buckets.size(); }

private:
    std::vector<Bucket> m_buckets;
};

} // namespace ledgerwise::infrastructure
