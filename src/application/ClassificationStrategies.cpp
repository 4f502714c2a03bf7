/**
 * @file ClassificationStrategies.cpp
 * @brief Implementation of the strategy adapters.
 */

#include "application/ClassificationStrategies.hpp"

namespace ledgerwise::application {

StatisticalStrategy::StatisticalStrategy(std::shared_ptr<StatisticalClassifier> classifier)
    : m_classifier(std::move(classifier)) {}

std::optional<domain::StrategyResult> StatisticalStrategy::tryClassify(const std::string& text) {
    if (!m_classifier || !m_classifier->isTrained()) return std::nullopt;

    auto prediction = m_classifier->predict(text, true);
    if (!prediction) return std::nullopt;

    domain::StrategyResult result;
    result.category = prediction->category;
    result.subcategory = prediction->subcategory;
    result.confidence = prediction->confidence.value_or(0.0);
    result.evidence = "naive bayes posterior";
    return result;
}

SemanticStrategy::SemanticStrategy(std::shared_ptr<SemanticMatcher> matcher)
    : m_matcher(std::move(matcher)) {}

std::optional<domain::StrategyResult> SemanticStrategy::tryClassify(const std::string& text) {
    if (!m_matcher || !m_matcher->isAvailable()) return std::nullopt;

    auto match = m_matcher->match(text);
    if (!match) return std::nullopt;

    return domain::StrategyResult{match->category, match->subcategory, match->similarityScore, match->bestExample};
}

RuleStrategy::RuleStrategy(std::shared_ptr<RuleMatcher> matcher)
    : m_matcher(std::move(matcher)) {}

std::optional<domain::StrategyResult> RuleStrategy::tryClassify(const std::string& text) {
    if (!m_matcher) return std::nullopt;

    auto hit = m_matcher->match(text);
    if (!hit) return std::nullopt;

    return domain::StrategyResult{hit->category, hit->subcategory, 1.0, hit->pattern};
}

} // namespace ledgerwise::application
