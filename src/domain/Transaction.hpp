/**
 * @file Transaction.hpp
 * @brief Domain entity for a single bank or card transaction.
 */

#pragma once
#include <optional>
#include <string>

namespace ledgerwise::domain {

/**
 * @enum ClassificationSource
 * @brief Which strategy produced a transaction's category.
 */
enum class ClassificationSource {
    None,     ///< Not classified yet.
    Ai,       ///< Statistical classifier.
    Semantic, ///< Embedding similarity against curated examples.
    Rule,     ///< Pattern rule.
    Default,  ///< Nothing matched; fallback bucket.
    Manual    ///< Set by a human override.
};

inline std::string SourceToString(ClassificationSource source) {
    switch (source) {
        case ClassificationSource::None: return "";
        case ClassificationSource::Ai: return "ai";
        case ClassificationSource::Semantic: return "semantic";
        case ClassificationSource::Rule: return "rule";
        case ClassificationSource::Default: return "default";
        case ClassificationSource::Manual: return "manual";
    }
    return "";
}

inline ClassificationSource SourceFromString(const std::string& value) {
    if (value == "ai") return ClassificationSource::Ai;
    if (value == "semantic") return ClassificationSource::Semantic;
    if (value == "rule") return ClassificationSource::Rule;
    if (value == "default") return ClassificationSource::Default;
    if (value == "manual") return ClassificationSource::Manual;
    return ClassificationSource::None;
}

/**
 * @struct Transaction
 * @brief A raw transaction plus the fields the core writes back.
 *
 * Amounts are signed: negative is money leaving the account.
 */
struct Transaction {
    std::string id;
    std::string description;
    double amount = 0.0;
    std::string date;         ///< YYYY-MM-DD
    std::string accountRef;   ///< Account number as printed by the bank.
    std::string merchant;

    // Written by the classification pipeline.
    std::string category;
    std::string subcategory;
    double confidenceScore = 0.0;
    ClassificationSource classificationSource = ClassificationSource::None;

    // Written by reconciliation. Set at most once.
    std::optional<std::string> matchedObligationRef;
    bool reconciled = false;

    /** @brief Stable reference: the id, or a key derived from date, description and amount. */
    std::string reference() const {
        if (!id.empty()) return id;
        return "TX-" + date + "-" + description.substr(0, 20) + "-" + std::to_string(amount);
    }
};

} // namespace ledgerwise::domain
