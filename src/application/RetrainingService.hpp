/**
 * @file RetrainingService.hpp
 * @brief Retrains the statistical classifier and keeps an audit trail.
 */

#pragma once
#include <memory>
#include <optional>
#include <string>
#include "application/EngineConfig.hpp"
#include "application/StatisticalClassifier.hpp"
#include "infrastructure/RetrainingAuditLog.hpp"
#include "infrastructure/TrainingSampleStore.hpp"

namespace ledgerwise::application {

struct RetrainingResult {
    bool success = false;
    std::string timestamp;
    std::string modelType;
    size_t samplesUsed = 0;
    double accuracy = 0.0;
    std::string message;
};

struct RetrainingStats {
    int triggerThreshold = 0;
    std::string modelType;
    bool shouldRetrain = false;
    std::optional<infrastructure::AuditEntry> lastRun;
};

/**
 * @class RetrainingService
 * @brief One-shot, synchronous retraining run.
 *
 * run() never throws. Every run, successful or not, leaves one audit entry.
 */
class RetrainingService {
public:
    RetrainingService(std::shared_ptr<StatisticalClassifier> classifier,
                      std::shared_ptr<infrastructure::TrainingSampleStore> samples,
                      std::shared_ptr<infrastructure::RetrainingAuditLog> audit,
                      RetrainingSettings settings = {});

    /** @brief True when the corpus holds at least the configured number of samples. */
    bool shouldRetrain() const;

    RetrainingResult run();

    RetrainingStats stats() const;

private:
    RetrainingResult execute();
    void logAudit(const RetrainingResult& result);

    std::shared_ptr<StatisticalClassifier> m_classifier;
    std::shared_ptr<infrastructure::TrainingSampleStore> m_samples;
    std::shared_ptr<infrastructure::RetrainingAuditLog> m_audit;
    RetrainingSettings m_settings;
};

} // namespace ledgerwise::application
