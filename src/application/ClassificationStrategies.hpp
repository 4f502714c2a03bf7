/**
 * @file ClassificationStrategies.hpp
 * @brief Adapters exposing the three matchers through domain::ClassificationStrategy.
 */

#pragma once
#include <memory>
#include "application/RuleMatcher.hpp"
#include "application/SemanticMatcher.hpp"
#include "application/StatisticalClassifier.hpp"
#include "domain/ClassificationStrategy.hpp"

namespace ledgerwise::application {

/**
 * @class StatisticalStrategy
 * @brief Proposes the classifier's label with its posterior as confidence.
 */
class StatisticalStrategy : public domain::ClassificationStrategy {
public:
    explicit StatisticalStrategy(std::shared_ptr<StatisticalClassifier> classifier);

    domain::ClassificationSource source() const override { return domain::ClassificationSource::Ai; }
    std::optional<domain::StrategyResult> tryClassify(const std::string& text) override;

private:
    std::shared_ptr<StatisticalClassifier> m_classifier;
};

class SemanticStrategy : public domain::ClassificationStrategy {
public:
    explicit SemanticStrategy(std::shared_ptr<SemanticMatcher> matcher);

    domain::ClassificationSource source() const override { return domain::ClassificationSource::Semantic; }
    std::optional<domain::StrategyResult> tryClassify(const std::string& text) override;

private:
    std::shared_ptr<SemanticMatcher> m_matcher;
};

/**
 * @class RuleStrategy
 * @brief A rule hit is certain: confidence is always 1.0.
 */
class RuleStrategy : public domain::ClassificationStrategy {
public:
    explicit RuleStrategy(std::shared_ptr<RuleMatcher> matcher);

    domain::ClassificationSource source() const override { return domain::ClassificationSource::Rule; }
    std::optional<domain::StrategyResult> tryClassify(const std::string& text) override;

private:
    std::shared_ptr<RuleMatcher> m_matcher;
};

} // namespace ledgerwise::application
