/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>

namespace ledgerwise::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

constexpr const char* kSettingsFile = "settings.json";
constexpr const char* kRulesFile = "rules.json";
constexpr const char* kExamplesFile = "semantic_examples.json";
constexpr const char* kTaxonomyFile = "taxonomy.json";

std::string PathIn(const std::string& dataDir, const char* name) {
    return (fs::path(dataDir) / name).string();
}

template <typename T>
void ReadInto(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

} // namespace

application::EngineConfig ConfigLoader::Load(const std::string& dataDir) {
    application::EngineConfig config;
    PersistenceService io;
    auto text = io.readText(PathIn(dataDir, kSettingsFile));
    if (!text) {
        return config;
    }

    try {
        json j = json::parse(*text);

        if (j.contains("categorization")) {
            const auto& s = j["categorization"];
            auto& c = config.categorization;
            ReadInto(s, "confidence_threshold", c.confidenceThreshold);
            ReadInto(s, "semantic_threshold", c.semanticThreshold);
            ReadInto(s, "semantic_review_threshold", c.semanticReviewThreshold);
            ReadInto(s, "retrain_trigger", c.retrainTrigger);
            ReadInto(s, "use_ai", c.useAi);
            ReadInto(s, "use_semantic", c.useSemantic);
            ReadInto(s, "default_category", c.defaultCategory);
            ReadInto(s, "default_subcategory", c.defaultSubcategory);
        }
        if (j.contains("semantic_matcher")) {
            const auto& s = j["semantic_matcher"];
            auto& c = config.semantic;
            ReadInto(s, "similarity_threshold", c.similarityThreshold);
            ReadInto(s, "host", c.host);
            ReadInto(s, "port", c.port);
            ReadInto(s, "model", c.model);
        }
        if (j.contains("retraining")) {
            const auto& s = j["retraining"];
            auto& c = config.retraining;
            ReadInto(s, "trigger_threshold", c.triggerThreshold);
            ReadInto(s, "model_type", c.modelType);
            ReadInto(s, "min_samples_per_category", c.minSamplesPerCategory);
        }
        if (j.contains("reconciliation")) {
            const auto& s = j["reconciliation"];
            auto& c = config.reconciliation;
            ReadInto(s, "date_tolerance_days", c.dateToleranceDays);
            ReadInto(s, "amount_tolerance_percent", c.amountTolerancePercent);
            ReadInto(s, "acceptance_threshold", c.acceptanceThreshold);
        }
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json, using defaults: " << e.what() << std::endl;
        return application::EngineConfig{};
    }

    return config;
}

bool ConfigLoader::Save(const std::string& dataDir, const application::EngineConfig& config) {
    const auto& c = config.categorization;
    const auto& s = config.semantic;
    const auto& r = config.retraining;
    const auto& m = config.reconciliation;

    json j = {
        {"categorization", {
            {"confidence_threshold", c.confidenceThreshold},
            {"semantic_threshold", c.semanticThreshold},
            {"semantic_review_threshold", c.semanticReviewThreshold},
            {"retrain_trigger", c.retrainTrigger},
            {"use_ai", c.useAi},
            {"use_semantic", c.useSemantic},
            {"default_category", c.defaultCategory},
            {"default_subcategory", c.defaultSubcategory}
        }},
        {"semantic_matcher", {
            {"similarity_threshold", s.similarityThreshold},
            {"host", s.host},
            {"port", s.port},
            {"model", s.model}
        }},
        {"retraining", {
            {"trigger_threshold", r.triggerThreshold},
            {"model_type", r.modelType},
            {"min_samples_per_category", r.minSamplesPerCategory}
        }},
        {"reconciliation", {
            {"date_tolerance_days", m.dateToleranceDays},
            {"amount_tolerance_percent", m.amountTolerancePercent},
            {"acceptance_threshold", m.acceptanceThreshold}
        }}
    };

    PersistenceService io;
    return io.saveText(PathIn(dataDir, kSettingsFile), j.dump(4));
}

std::vector<domain::ClassificationRule> ConfigLoader::LoadRules(const std::string& dataDir) {
    std::vector<domain::ClassificationRule> rules;
    PersistenceService io;
    auto text = io.readText(PathIn(dataDir, kRulesFile));
    if (!text) {
        return rules;
    }

    try {
        json j = json::parse(*text);
        if (!j.contains("rules") || !j["rules"].is_array()) {
            return rules;
        }
        for (const auto& item : j["rules"]) {
            domain::ClassificationRule rule;
            rule.pattern = item.value("pattern", "");
            rule.category = item.value("category", "");
            rule.subcategory = item.value("subcategory", "");
            rule.priority = item.value("priority", 50);
            rule.generated = item.value("generated", false);
            rule.createdAt = item.value("created_at", "");
            if (rule.pattern.empty() || rule.category.empty()) continue;
            rules.push_back(rule);
        }
    } catch (const json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading rules.json: " << e.what() << std::endl;
        rules.clear();
    }
    return rules;
}

bool ConfigLoader::SaveRules(const std::string& dataDir, const std::vector<domain::ClassificationRule>& rules) {
    json arr = json::array();
    for (const auto& rule : rules) {
        json item = {
            {"pattern", rule.pattern},
            {"category", rule.category},
            {"subcategory", rule.subcategory},
            {"priority", rule.priority}
        };
        if (rule.generated) {
            item["generated"] = true;
            item["created_at"] = rule.createdAt;
        }
        arr.push_back(item);
    }
    PersistenceService io;
    return io.saveText(PathIn(dataDir, kRulesFile), json{{"rules", arr}}.dump(4));
}

std::vector<domain::SemanticExample> ConfigLoader::LoadSemanticExamples(const std::string& dataDir) {
    std::vector<domain::SemanticExample> examples;
    PersistenceService io;
    auto text = io.readText(PathIn(dataDir, kExamplesFile));
    if (!text) {
        return examples;
    }

    try {
        // ordered_json keeps the file's bucket order.
        auto j = nlohmann::ordered_json::parse(*text);
        for (auto cat = j.begin(); cat != j.end(); ++cat) {
            if (!cat.value().is_object()) continue;
            for (auto sub = cat.value().begin(); sub != cat.value().end(); ++sub) {
                if (!sub.value().is_array()) continue;
                domain::SemanticExample example;
                example.category = cat.key();
                example.subcategory = sub.key();
                for (const auto& phrase : sub.value()) {
                    if (phrase.is_string()) {
                        example.phrases.push_back(phrase.get<std::string>());
                    }
                }
                if (!example.phrases.empty()) {
                    examples.push_back(std::move(example));
                }
            }
        }
    } catch (const nlohmann::ordered_json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading semantic_examples.json: " << e.what() << std::endl;
        examples.clear();
    }
    return examples;
}

domain::CategoryTaxonomy ConfigLoader::LoadTaxonomy(const std::string& dataDir) {
    PersistenceService io;
    auto text = io.readText(PathIn(dataDir, kTaxonomyFile));
    if (!text) {
        return domain::CategoryTaxonomy::Defaults();
    }

    try {
        auto j = nlohmann::ordered_json::parse(*text);
        if (!j.contains("categories") || !j["categories"].is_object()) {
            return domain::CategoryTaxonomy::Defaults();
        }
        std::vector<domain::CategoryTaxonomy::Entry> entries;
        for (auto it = j["categories"].begin(); it != j["categories"].end(); ++it) {
            entries.emplace_back(it.key(), it.value().get<std::vector<std::string>>());
        }
        return domain::CategoryTaxonomy(std::move(entries));
    } catch (const nlohmann::ordered_json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading taxonomy.json, using defaults: " << e.what() << std::endl;
    }
    return domain::CategoryTaxonomy::Defaults();
}

} // namespace ledgerwise::infrastructure
