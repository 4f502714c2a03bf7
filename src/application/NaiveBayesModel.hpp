/**
 * @file NaiveBayesModel.hpp
 * @brief Multinomial naive Bayes over TF-IDF features, with a JSON blob format.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "application/TfidfVectorizer.hpp"

namespace ledgerwise::application {

/**
 * @class NaiveBayesModel
 * @brief A fitted vectorizer plus per-class parameters.
 *
 * Serialize() and Deserialize() are the only persistence boundary: one JSON
 * string out, one typed model back.
 */
class NaiveBayesModel {
public:
    struct Posterior {
        std::string label;
        double probability = 0.0;
    };

    /**
     * @brief Fits the model.
     * @param documents Training texts.
     * @param labels Category per text (parallel to documents).
     * @param subcategories Subcategory per text (parallel, may hold empty strings).
     * @param alpha Additive smoothing.
     */
    static NaiveBayesModel Fit(const std::vector<std::string>& documents,
                               const std::vector<std::string>& labels,
                               const std::vector<std::string>& subcategories,
                               double alpha = 0.1);

    /** @brief Most probable label and its posterior in [0,1]. nullopt for an empty model. */
    std::optional<Posterior> predict(const std::string& text) const;

    /** @brief Most frequent training subcategory for the label, empty if none. */
    std::string subcategoryFor(const std::string& label) const;

    const std::vector<std::string>& classes() const { return m_classes; }
    size_t vocabularySize() const { return m_vectorizer.vocabularySize(); }

    std::string Serialize() const;
    static std::optional<NaiveBayesModel> Deserialize(const std::string& blob);

private:
    TfidfVectorizer m_vectorizer;
    double m_alpha = 0.1;
    std::vector<std::string> m_classes;                ///< Sorted.
    std::vector<double> m_classLogPrior;
    std::vector<std::vector<double>> m_featureLogProb; ///< [class][feature]
    std::map<std::string, std::string> m_subcategories;
};

} // namespace ledgerwise::application
