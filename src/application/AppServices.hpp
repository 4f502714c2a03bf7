/**
 * @file AppServices.hpp
 * @brief Container for application-level services to facilitate dependency injection.
 */

#pragma once

#include <memory>
#include "application/ClassificationPipeline.hpp"
#include "application/EngineConfig.hpp"
#include "application/LoanLedger.hpp"
#include "application/ReconciliationMatcher.hpp"
#include "application/RetrainingService.hpp"
#include "application/RuleMatcher.hpp"
#include "application/SemanticMatcher.hpp"
#include "application/StatisticalClassifier.hpp"
#include "domain/CategoryTaxonomy.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RetrainingAuditLog.hpp"
#include "infrastructure/TrainingSampleStore.hpp"

namespace ledgerwise::application {

struct AppServices {
    EngineConfig config;
    domain::CategoryTaxonomy taxonomy;
    std::shared_ptr<infrastructure::PersistenceService> persistenceService;
    std::shared_ptr<infrastructure::TrainingSampleStore> trainingSamples;
    std::shared_ptr<infrastructure::RetrainingAuditLog> auditLog;
    std::shared_ptr<RuleMatcher> ruleMatcher;
    std::shared_ptr<StatisticalClassifier> classifier;
    std::shared_ptr<SemanticMatcher> semanticMatcher; ///< Null when semantic matching is switched off.
    std::shared_ptr<RetrainingService> retrainingService;
    std::unique_ptr<ClassificationPipeline> pipeline;
    std::unique_ptr<ReconciliationMatcher> reconciliationMatcher;
};

} // namespace ledgerwise::application
