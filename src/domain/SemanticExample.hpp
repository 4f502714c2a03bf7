/**
 * @file SemanticExample.hpp
 * @brief Curated example phrases for one category/subcategory bucket.
 */

#pragma once
#include <string>
#include <vector>

namespace ledgerwise::domain {

struct SemanticExample {
    std::string category;
    std::string subcategory;
    std::vector<std::string> phrases;
};

} // namespace ledgerwise::domain
