/**
 * @file RetrainingService.cpp
 * @brief Implementation of RetrainingService.
 */

#include "application/RetrainingService.hpp"
#include <algorithm>
#include <iostream>

namespace ledgerwise::application {

namespace {

constexpr size_t kMinCorpusSize = 4;

} // namespace

RetrainingService::RetrainingService(std::shared_ptr<StatisticalClassifier> classifier,
                                     std::shared_ptr<infrastructure::TrainingSampleStore> samples,
                                     std::shared_ptr<infrastructure::RetrainingAuditLog> audit,
                                     RetrainingSettings settings)
    : m_classifier(std::move(classifier)),
      m_samples(std::move(samples)),
      m_audit(std::move(audit)),
      m_settings(std::move(settings)) {}

bool RetrainingService::shouldRetrain() const {
    size_t total = m_samples->loadAll().size();
    return total >= static_cast<size_t>(std::max(0, m_settings.triggerThreshold));
}

RetrainingResult RetrainingService::run() {
    std::cout << "[RetrainingService] Starting retraining run" << std::endl;

    RetrainingResult result;
    try {
        result = execute();
    } catch (const std::exception& e) {
        result.success = false;
        result.message = std::string("Retraining error: ") + e.what();
        std::cerr << "[RetrainingService] " << result.message << std::endl;
    }

    if (result.timestamp.empty()) result.timestamp = infrastructure::CurrentTimestamp();
    if (result.modelType.empty()) result.modelType = m_settings.modelType;

    logAudit(result);
    return result;
}

RetrainingResult RetrainingService::execute() {
    RetrainingResult result;
    result.timestamp = infrastructure::CurrentTimestamp();
    result.modelType = m_settings.modelType;

    // Step 1: load the corpus
    const size_t corpusSize = m_samples->loadAll().size();
    if (corpusSize < kMinCorpusSize) {
        result.message = "Insufficient training data: " + std::to_string(corpusSize) +
                         " samples (need at least " + std::to_string(kMinCorpusSize) + ")";
        std::cerr << "[RetrainingService] " << result.message << std::endl;
        return result;
    }
    result.samplesUsed = corpusSize;

    // Step 2: train
    TrainResult trained = m_classifier->train(m_settings.minSamplesPerCategory);
    if (!trained.success) {
        result.message = "ML training failed: " + trained.message;
        std::cerr << "[RetrainingService] " << result.message << std::endl;
        return result;
    }

    // Step 3: coarse accuracy proxy, share of the corpus the model could use
    result.samplesUsed = trained.samplesUsed;
    result.accuracy = static_cast<double>(trained.samplesUsed) / static_cast<double>(corpusSize);

    result.success = true;
    result.message = "Successfully retrained model with " + std::to_string(result.samplesUsed) + " samples";
    std::cout << "[RetrainingService] Retraining complete: " << result.message << std::endl;
    return result;
}

void RetrainingService::logAudit(const RetrainingResult& result) {
    infrastructure::AuditEntry entry;
    entry.timestamp = result.timestamp;
    entry.modelType = result.modelType;
    entry.samplesUsed = result.samplesUsed;
    entry.accuracy = result.accuracy;
    entry.success = result.success;
    entry.message = result.message;
    if (!m_audit->append(entry)) {
        std::cerr << "[RetrainingService] Failed to log audit information" << std::endl;
    }
}

RetrainingStats RetrainingService::stats() const {
    RetrainingStats stats;
    stats.triggerThreshold = m_settings.triggerThreshold;
    stats.modelType = m_settings.modelType;
    stats.shouldRetrain = shouldRetrain();
    stats.lastRun = m_audit->last();
    return stats;
}

} // namespace ledgerwise::application
