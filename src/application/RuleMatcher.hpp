/**
 * @file RuleMatcher.hpp
 * @brief Priority-ordered pattern rules for transaction text.
 */

#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include "domain/ClassificationRule.hpp"
#include "domain/TrainingSample.hpp"

namespace ledgerwise::application {

struct RuleMatch {
    std::string category;
    std::string subcategory;
    std::string pattern; ///< The rule that fired.
};

/**
 * @struct RuleLearningResult
 * @brief Outcome of deriving rules from manual training samples.
 */
struct RuleLearningResult {
    bool success = false;
    std::string message;
    size_t rulesCreated = 0;
    std::vector<std::string> categoriesTrained;
};

/**
 * @class RuleMatcher
 * @brief Evaluates rules from highest to lowest priority; the first rule whose
 * pattern occurs in the text wins.
 *
 * Patterns are regular expressions matched case-insensitively. A pattern that
 * does not compile is matched as a plain case-insensitive substring instead.
 * Equal priorities keep their original list order.
 */
class RuleMatcher {
public:
    explicit RuleMatcher(std::vector<domain::ClassificationRule> rules = {});

    /** @brief Rules in their original (file) order. */
    const std::vector<domain::ClassificationRule>& rules() const { return m_rules; }

    std::optional<RuleMatch> match(const std::string& text) const;

    /**
     * @brief Derives keyword rules (priority 60, marked generated) from manual samples.
     *
     * A keyword already contained in an existing pattern is skipped. Needs at
     * least two manual samples.
     */
    RuleLearningResult learnFromSamples(const std::vector<domain::TrainingSample>& samples);

    /** @brief Drops every generated rule. Returns how many were removed. */
    size_t removeGeneratedRules();

    /** @brief Up to five lowercase keywords longer than two characters, noise words removed. */
    static std::vector<std::string> ExtractKeywords(const std::string& description);

private:
    struct CompiledRule {
        size_t index;                    ///< Position in m_rules.
        std::optional<std::regex> regex; ///< nullopt: substring fallback.
    };

    void compile();

    std::vector<domain::ClassificationRule> m_rules;
    std::vector<CompiledRule> m_ordered; ///< Sorted by priority, stable.
};

} // namespace ledgerwise::application
