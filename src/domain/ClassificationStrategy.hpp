/**
 * @file ClassificationStrategy.hpp
 * @brief Interface for one way of turning transaction text into a category.
 */

#pragma once
#include <optional>
#include <string>
#include "domain/Transaction.hpp"

namespace ledgerwise::domain {

/**
 * @struct StrategyResult
 * @brief What a single strategy proposes for a piece of text.
 */
struct StrategyResult {
    std::string category;
    std::string subcategory;
    double confidence = 0.0;  ///< In [0,1].
    std::string evidence;     ///< e.g. the closest example phrase, or the rule pattern.
};

/**
 * @class ClassificationStrategy
 * @brief A capability queried by the classification pipeline in a fixed priority order.
 *
 * Implementations report "no opinion" with nullopt; they must not throw for
 * expected conditions such as an untrained model or a missing provider.
 */
class ClassificationStrategy {
public:
    virtual ~ClassificationStrategy() = default;

    /** @brief Which source tag an accepted result carries. */
    virtual ClassificationSource source() const = 0;

    /** @brief Proposes a category for the text, or nullopt. */
    virtual std::optional<StrategyResult> tryClassify(const std::string& text) = 0;
};

} // namespace ledgerwise::domain
