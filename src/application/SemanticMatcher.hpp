/**
 * @file SemanticMatcher.hpp
 * @brief Embedding-similarity lookup against curated example phrases.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/EmbeddingProvider.hpp"
#include "domain/SemanticExample.hpp"
#include "infrastructure/EmbeddingCache.hpp"

namespace ledgerwise::application {

struct SemanticMatch {
    std::string category;
    std::string subcategory;
    double similarityScore = 0.0;
    std::string bestExample;
};

struct SemanticMatcherStats {
    bool modelAvailable = false;
    std::string modelName;
    size_t categoriesCached = 0;
    double similarityThreshold = 0.0;
};

/**
 * @class SemanticMatcher
 * @brief Returns the example bucket closest (cosine) to the input text.
 *
 * Example embeddings are computed once in the constructor. If the provider is
 * unavailable then, or no example could be embedded, the matcher is disabled
 * for its whole lifetime and match() always returns nullopt.
 */
class SemanticMatcher {
public:
    SemanticMatcher(std::shared_ptr<domain::EmbeddingProvider> provider,
                    const std::vector<domain::SemanticExample>& examples,
                    double similarityThreshold = 0.75);

    /**
     * @brief Finds the globally most similar example.
     * @return The match if its similarity reaches the threshold. Ties go to the
     * bucket cached first.
     */
    std::optional<SemanticMatch> match(const std::string& text) const;

    bool isAvailable() const { return m_available; }
    double similarityThreshold() const { return m_threshold; }
    SemanticMatcherStats stats() const;

    static double CosineSimilarity(const std::vector<float>& v1, const std::vector<float>& v2);

private:
    std::shared_ptr<domain::EmbeddingProvider> m_provider;
    infrastructure::EmbeddingCache m_cache;
    double m_threshold;
    bool m_available = false;
};

} // namespace ledgerwise::application
