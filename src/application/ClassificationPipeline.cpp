/**
 * @file ClassificationPipeline.cpp
 * @brief Implementation of ClassificationPipeline.
 */

#include "application/ClassificationPipeline.hpp"
#include "application/TextUtils.hpp"
#include <algorithm>
#include <iostream>

namespace ledgerwise::application {

using domain::ClassificationSource;

ClassificationPipeline::ClassificationPipeline(CategorizationSettings settings,
                                               std::shared_ptr<domain::ClassificationStrategy> ai,
                                               std::shared_ptr<domain::ClassificationStrategy> semantic,
                                               std::shared_ptr<domain::ClassificationStrategy> rules,
                                               std::shared_ptr<infrastructure::TrainingSampleStore> samples,
                                               std::shared_ptr<RetrainingService> retraining,
                                               domain::CategoryTaxonomy taxonomy)
    : m_settings(std::move(settings)),
      m_samples(std::move(samples)),
      m_retraining(std::move(retraining)),
      m_taxonomy(std::move(taxonomy)) {
    // Fixed priority: statistical, semantic, rules.
    if (ai) {
        m_stages.push_back({std::move(ai), m_settings.confidenceThreshold, m_settings.confidenceThreshold, true});
    }
    if (semantic) {
        m_stages.push_back({std::move(semantic), m_settings.semanticThreshold,
                            m_settings.semanticReviewThreshold, true});
    }
    if (rules) {
        m_stages.push_back({std::move(rules), 0.0, 0.0, false});
    }
}

bool ClassificationPipeline::stageEnabled(const Stage& stage, const ClassifyOptions& options) const {
    switch (stage.strategy->source()) {
        case ClassificationSource::Ai: return m_settings.useAi && options.useAi;
        case ClassificationSource::Semantic: return m_settings.useSemantic && options.useSemantic;
        default: return true;
    }
}

std::optional<domain::StrategyResult> ClassificationPipeline::runStage(const Stage& stage,
                                                                       const std::string& text) const {
    const std::string name = domain::SourceToString(stage.strategy->source());
    std::optional<domain::StrategyResult> result;
    try {
        result = stage.strategy->tryClassify(text);
    } catch (const std::exception& e) {
        std::cerr << "[ClassificationPipeline] Strategy '" << name << "' failed: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!result || result->category.empty()) return std::nullopt;

    if (stage.checkTaxonomy && !m_taxonomy.accepts(result->category)) {
        std::cerr << "[ClassificationPipeline] Strategy '" << name << "' proposed unknown category '"
                  << result->category << "', ignoring" << std::endl;
        return std::nullopt;
    }
    if (result->confidence < stage.acceptThreshold) return std::nullopt;
    return result;
}

ClassificationResult ClassificationPipeline::defaultResult() const {
    ClassificationResult result;
    result.category = m_settings.defaultCategory;
    result.subcategory = m_settings.defaultSubcategory;
    result.confidenceScore = 0.0;
    result.source = ClassificationSource::Default;
    result.flagged = true;
    return result;
}

ClassificationResult ClassificationPipeline::classify(const std::string& description,
                                                      const std::string& merchant,
                                                      ClassifyOptions options) {
    std::string text = text::Trim(description);
    std::string trimmedMerchant = text::Trim(merchant);
    if (!trimmedMerchant.empty()) {
        text = text.empty() ? trimmedMerchant : text + " " + trimmedMerchant;
    }
    if (text.empty()) return defaultResult();

    for (const auto& stage : m_stages) {
        if (!stageEnabled(stage, options)) continue;

        auto proposal = runStage(stage, text);
        if (!proposal) continue;

        ClassificationResult result;
        result.category = proposal->category;
        result.subcategory = proposal->subcategory;
        result.source = stage.strategy->source();
        result.evidence = proposal->evidence;
        if (result.source == ClassificationSource::Rule) {
            result.confidenceScore = 1.0;
            result.flagged = false;
        } else {
            result.confidenceScore = proposal->confidence;
            result.flagged = proposal->confidence < stage.reviewThreshold;
        }
        return result;
    }

    return defaultResult();
}

ClassificationResult ClassificationPipeline::classify(domain::Transaction& transaction, ClassifyOptions options) {
    ClassificationResult result = classify(transaction.description, transaction.merchant, options);
    transaction.category = result.category;
    transaction.subcategory = result.subcategory;
    transaction.confidenceScore = result.confidenceScore;
    transaction.classificationSource = result.source;
    return result;
}

std::vector<ClassificationResult> ClassificationPipeline::classifyBatch(std::vector<domain::Transaction>& transactions,
                                                                        ClassifyOptions options) {
    std::vector<ClassificationResult> results;
    results.reserve(transactions.size());
    for (auto& tx : transactions) {
        results.push_back(classify(tx, options));
    }

    size_t flagged = 0;
    for (const auto& r : results) {
        if (r.flagged) ++flagged;
    }
    std::cout << "[ClassificationPipeline] Classified " << results.size() << " transactions, "
              << flagged << " flagged for review" << std::endl;
    return results;
}

OverrideResult ClassificationPipeline::registerOverride(const std::string& category,
                                                        const std::string& subcategory,
                                                        const std::string& description) {
    OverrideResult result;

    domain::TrainingSample sample;
    sample.description = description;
    sample.category = category;
    sample.subcategory = subcategory;
    sample.isManual = true;
    result.sampleStored = m_samples && m_samples->append(sample);
    if (!result.sampleStored) {
        std::cerr << "[ClassificationPipeline] Could not store override for '" << description << "'" << std::endl;
    }

    ++m_overrideCount;
    const size_t trigger = static_cast<size_t>(std::max(1, m_settings.retrainTrigger));
    if (m_overrideCount >= trigger) {
        std::cout << "[ClassificationPipeline] " << m_overrideCount << " overrides, retraining" << std::endl;
        if (m_retraining) {
            result.retraining = m_retraining->run();
        } else {
            std::cerr << "[ClassificationPipeline] No retraining service configured" << std::endl;
        }
        m_overrideCount = 0;
    }

    result.overrideCount = m_overrideCount;
    return result;
}

OverrideResult ClassificationPipeline::registerOverride(domain::Transaction& transaction,
                                                        const std::string& category,
                                                        const std::string& subcategory) {
    std::string text = transaction.description;
    if (!transaction.merchant.empty()) text += " " + transaction.merchant;

    transaction.category = category;
    transaction.subcategory = subcategory;
    transaction.confidenceScore = 1.0;
    transaction.classificationSource = ClassificationSource::Manual;
    return registerOverride(category, subcategory, text);
}

PipelineStats ClassificationPipeline::stats() const {
    PipelineStats stats;
    stats.confidenceThreshold = m_settings.confidenceThreshold;
    stats.semanticThreshold = m_settings.semanticThreshold;
    stats.semanticReviewThreshold = m_settings.semanticReviewThreshold;
    stats.overrideCount = m_overrideCount;
    stats.retrainTrigger = m_settings.retrainTrigger;
    for (const auto& stage : m_stages) {
        stats.strategies.push_back(domain::SourceToString(stage.strategy->source()));
    }
    return stats;
}

} // namespace ledgerwise::application
