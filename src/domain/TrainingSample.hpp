/**
 * @file TrainingSample.hpp
 * @brief Labeled description used to train the statistical classifier.
 */

#pragma once
#include <string>

namespace ledgerwise::domain {

struct TrainingSample {
    std::string description;
    std::string category;
    std::string subcategory;
    bool isManual = false;
    std::string timestamp; ///< "YYYY-MM-DD HH:MM:SS", local time.
};

} // namespace ledgerwise::domain
