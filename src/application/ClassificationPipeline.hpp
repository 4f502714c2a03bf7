/**
 * @file ClassificationPipeline.hpp
 * @brief Tiered classification of transactions with a manual override loop.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/EngineConfig.hpp"
#include "application/RetrainingService.hpp"
#include "domain/CategoryTaxonomy.hpp"
#include "domain/ClassificationStrategy.hpp"
#include "domain/Transaction.hpp"
#include "infrastructure/TrainingSampleStore.hpp"

namespace ledgerwise::application {

/**
 * @struct ClassificationResult
 * @brief Category decision for one transaction text.
 */
struct ClassificationResult {
    std::string category;
    std::string subcategory;
    double confidenceScore = 0.0;
    domain::ClassificationSource source = domain::ClassificationSource::Default;
    bool flagged = true;   ///< Needs a human look.
    std::string evidence;
};

/** @brief Per-call switches, combined (AND) with the configured ones. */
struct ClassifyOptions {
    bool useAi = true;
    bool useSemantic = true;
};

struct OverrideResult {
    bool sampleStored = false;
    size_t overrideCount = 0;                   ///< Counter after this override.
    std::optional<RetrainingResult> retraining; ///< Set when this override triggered a retrain.
};

struct PipelineStats {
    double confidenceThreshold = 0.0;
    double semanticThreshold = 0.0;
    double semanticReviewThreshold = 0.0;
    size_t overrideCount = 0;
    int retrainTrigger = 0;
    std::vector<std::string> strategies; ///< Registered sources, in evaluation order.
};

/**
 * @class ClassificationPipeline
 * @brief Asks the statistical, semantic and rule strategies in that order and
 * falls back to the default bucket.
 *
 * The override counter belongs to this instance. Any strategy may be null.
 */
class ClassificationPipeline {
public:
    ClassificationPipeline(CategorizationSettings settings,
                           std::shared_ptr<domain::ClassificationStrategy> ai,
                           std::shared_ptr<domain::ClassificationStrategy> semantic,
                           std::shared_ptr<domain::ClassificationStrategy> rules,
                           std::shared_ptr<infrastructure::TrainingSampleStore> samples,
                           std::shared_ptr<RetrainingService> retraining,
                           domain::CategoryTaxonomy taxonomy = {});

    ClassificationResult classify(const std::string& description,
                                  const std::string& merchant = "",
                                  ClassifyOptions options = {});

    /** @brief Classifies and writes category, subcategory, score and source onto the transaction. */
    ClassificationResult classify(domain::Transaction& transaction, ClassifyOptions options = {});

    std::vector<ClassificationResult> classifyBatch(std::vector<domain::Transaction>& transactions,
                                                    ClassifyOptions options = {});

    /**
     * @brief Records a human correction as a manual training sample.
     *
     * Every retrainTrigger-th override runs the retraining service synchronously;
     * the counter then restarts at zero whatever the outcome.
     */
    OverrideResult registerOverride(const std::string& category,
                                    const std::string& subcategory,
                                    const std::string& description);

    /** @brief Same, and marks the transaction as manually classified. */
    OverrideResult registerOverride(domain::Transaction& transaction,
                                    const std::string& category,
                                    const std::string& subcategory);

    size_t overrideCount() const { return m_overrideCount; }

    PipelineStats stats() const;

private:
    struct Stage {
        std::shared_ptr<domain::ClassificationStrategy> strategy;
        double acceptThreshold = 0.0;
        double reviewThreshold = 0.0;
        bool checkTaxonomy = false;
    };

    bool stageEnabled(const Stage& stage, const ClassifyOptions& options) const;
    std::optional<domain::StrategyResult> runStage(const Stage& stage, const std::string& text) const;
    ClassificationResult defaultResult() const;

    CategorizationSettings m_settings;
    std::vector<Stage> m_stages;
    std::shared_ptr<infrastructure::TrainingSampleStore> m_samples;
    std::shared_ptr<RetrainingService> m_retraining;
    domain::CategoryTaxonomy m_taxonomy;
    size_t m_overrideCount = 0;
};

} // namespace ledgerwise::application
