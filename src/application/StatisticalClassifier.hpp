/**
 * @file StatisticalClassifier.hpp
 * @brief Trainable text classifier with on-disk persistence.
 */

#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/NaiveBayesModel.hpp"
#include "domain/CategoryTaxonomy.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/TrainingSampleStore.hpp"

namespace ledgerwise::application {

/**
 * @struct TrainResult
 * @brief Reported outcome of train(). Insufficient data is a failure result, not an error.
 */
struct TrainResult {
    bool success = false;
    std::string message;
    size_t samplesUsed = 0;
    bool persisted = false; ///< model.json written; false means the model lives only in memory.
    std::vector<std::string> categories;
    std::map<std::string, size_t> categoryCounts;
};

struct Prediction {
    std::string category;
    std::string subcategory;
    std::optional<double> confidence; ///< Set when the probability was requested.
};

struct ModelInfo {
    bool isTrained = false;
    size_t totalSamples = 0;
    std::vector<std::string> categories;
    size_t vocabularySize = 0;
    bool modelFileExists = false;
    std::map<std::string, size_t> categoryDistribution;
};

/**
 * @class StatisticalClassifier
 * @brief Multinomial naive Bayes trained from the training sample log.
 *
 * The fitted model is written to model.json after every successful training
 * and loaded again at construction, so a restart does not require retraining.
 */
class StatisticalClassifier {
public:
    /**
     * @param samples Training corpus.
     * @param persistence File I/O for the model document.
     * @param modelPath Where model.json lives.
     * @param taxonomy Labels outside a non-empty taxonomy are not trained on.
     */
    StatisticalClassifier(std::shared_ptr<infrastructure::TrainingSampleStore> samples,
                          std::shared_ptr<infrastructure::PersistenceService> persistence,
                          std::string modelPath,
                          domain::CategoryTaxonomy taxonomy = {});

    /**
     * @brief Fits a new model from the current corpus.
     *
     * Needs at least two categories with minSamplesPerCategory samples each;
     * samples of smaller categories are left out of this fit.
     */
    TrainResult train(int minSamplesPerCategory = 2);

    /** @brief nullopt when untrained or the text is blank. */
    std::optional<Prediction> predict(const std::string& text, bool returnProbability = false) const;

    std::vector<std::optional<Prediction>> predictBatch(const std::vector<std::string>& texts) const;

    bool isTrained() const { return m_model.has_value(); }

    ModelInfo modelInfo() const;

    /** @brief Re-reads model.json. Returns false if no usable model was found. */
    bool reload();

private:
    std::shared_ptr<infrastructure::TrainingSampleStore> m_samples;
    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::string m_modelPath;
    domain::CategoryTaxonomy m_taxonomy;
    std::optional<NaiveBayesModel> m_model;
};

} // namespace ledgerwise::application
