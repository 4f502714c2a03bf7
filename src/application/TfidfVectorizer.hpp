/**
 * @file TfidfVectorizer.hpp
 * @brief Bag-of-terms feature extraction with TF-IDF weighting.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace ledgerwise::application {

/** @brief (feature index, weight) pairs sorted by index. */
using SparseVector = std::vector<std::pair<size_t, double>>;

/**
 * @class TfidfVectorizer
 * @brief Unigrams and bigrams of lowercase word tokens (2+ characters).
 *
 * The vocabulary keeps the maxFeatures terms with the highest corpus
 * frequency (ties: alphabetical). Weights are raw counts times
 * idf = ln((1 + n) / (1 + df)) + 1, and every row is L2-normalized.
 */
class TfidfVectorizer {
public:
    struct Options {
        size_t maxFeatures = 500;
        size_t ngramMax = 2;
    };

    TfidfVectorizer();
    explicit TfidfVectorizer(Options options);

    /** @brief Learns vocabulary and idf from the corpus. */
    void fit(const std::vector<std::string>& documents);

    /** @brief Maps a document onto the learned vocabulary. Unknown terms are ignored. */
    SparseVector transform(const std::string& document) const;

    size_t vocabularySize() const { return m_vocabulary.size(); }

    /** @brief Terms produced for a document before vocabulary filtering. */
    std::vector<std::string> analyze(const std::string& document) const;

    nlohmann::json toJson() const;
    static std::optional<TfidfVectorizer> FromJson(const nlohmann::json& j);

private:
    Options m_options;
    std::map<std::string, size_t> m_vocabulary;
    std::vector<double> m_idf;
};

} // namespace ledgerwise::application
