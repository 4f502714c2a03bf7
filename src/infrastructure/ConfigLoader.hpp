/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading the engine's configuration documents.
 *
 * Provides a unified way to read settings.json, rules.json, taxonomy.json and
 * semantic_examples.json without scattering JSON parsing logic throughout the
 * codebase. Every loader falls back to defaults instead of failing.
 */

#pragma once

#include <string>
#include <vector>
#include "application/EngineConfig.hpp"
#include "domain/CategoryTaxonomy.hpp"
#include "domain/ClassificationRule.hpp"
#include "domain/SemanticExample.hpp"

namespace ledgerwise::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Reads settings.json from the data directory.
     * @param dataDir Directory holding the engine's documents.
     * @return Parsed configuration; defaults for every missing key.
     */
    static application::EngineConfig Load(const std::string& dataDir);

    /** @brief Writes settings.json, replacing the previous document. */
    static bool Save(const std::string& dataDir, const application::EngineConfig& config);

    /** @brief Reads rules.json. Entries without a pattern or category are skipped. */
    static std::vector<domain::ClassificationRule> LoadRules(const std::string& dataDir);

    /** @brief Writes rules.json. */
    static bool SaveRules(const std::string& dataDir, const std::vector<domain::ClassificationRule>& rules);

    /**
     * @brief Reads semantic_examples.json.
     * Buckets are returned in file order, which is the matcher's tie-break order.
     */
    static std::vector<domain::SemanticExample> LoadSemanticExamples(const std::string& dataDir);

    /** @brief Reads taxonomy.json, or the built-in taxonomy if absent. */
    static domain::CategoryTaxonomy LoadTaxonomy(const std::string& dataDir);
};

} // namespace ledgerwise::infrastructure
