/**
 * @file ClassificationRule.hpp
 * @brief A pattern → category rule.
 */

#pragma once
#include <string>

namespace ledgerwise::domain {

struct ClassificationRule {
    std::string pattern;      ///< Regular expression, or plain text if it does not compile.
    std::string category;
    std::string subcategory;
    int priority = 50;        ///< Higher runs first.
    bool generated = false;   ///< Derived from manual samples rather than written by hand.
    std::string createdAt;
};

} // namespace ledgerwise::domain
