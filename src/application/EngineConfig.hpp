/**
 * @file EngineConfig.hpp
 * @brief Tunable thresholds for classification, retraining and reconciliation.
 *
 * Every field carries its default so a missing settings.json still yields a
 * working engine.
 */

#pragma once
#include <string>

namespace ledgerwise::application {

struct CategorizationSettings {
    double confidenceThreshold = 0.65;      ///< Minimum AI posterior to accept.
    double semanticThreshold = 0.75;        ///< Minimum similarity to accept.
    double semanticReviewThreshold = 0.85;  ///< Accepted semantic results below this are flagged.
    int retrainTrigger = 10;                ///< Manual overrides between automatic retrains.
    bool useAi = true;
    bool useSemantic = true;
    std::string defaultCategory = "Other";
    std::string defaultSubcategory = "Unknown";
};

struct SemanticSettings {
    double similarityThreshold = 0.75;
    std::string host = "localhost";
    int port = 11434;
    std::string model = "nomic-embed-text";
};

struct RetrainingSettings {
    int triggerThreshold = 10;
    std::string modelType = "MultinomialNB";
    int minSamplesPerCategory = 2;
};

struct ReconciliationSettings {
    int dateToleranceDays = 7;
    double amountTolerancePercent = 5.0;
    double acceptanceThreshold = 0.7;
};

struct EngineConfig {
    CategorizationSettings categorization;
    SemanticSettings semantic;
    RetrainingSettings retraining;
    ReconciliationSettings reconciliation;
};

} // namespace ledgerwise::application
