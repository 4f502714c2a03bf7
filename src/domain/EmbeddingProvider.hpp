/**
 * @file EmbeddingProvider.hpp
 * @brief Interface for services that turn text into a fixed-length vector.
 */

#pragma once
#include <string>
#include <vector>

namespace ledgerwise::domain {

/**
 * @class EmbeddingProvider
 * @brief Best-effort external embedding model.
 *
 * Callers check isAvailable() before use. An empty vector from embed() means
 * the call failed.
 */
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    /** @brief Whether the provider initialized and can serve requests. */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Generates a semantic embedding vector for the given text.
     * @return The vector, or empty on failure.
     */
    virtual std::vector<float> embed(const std::string& text) = 0;

    /** @brief Name of the model producing the vectors. */
    virtual std::string modelName() const = 0;
};

} // namespace ledgerwise::domain
