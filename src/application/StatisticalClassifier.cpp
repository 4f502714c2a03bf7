/**
 * @file StatisticalClassifier.cpp
 * @brief Implementation of StatisticalClassifier.
 */

#include "application/StatisticalClassifier.hpp"
#include "application/TextUtils.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace ledgerwise::application {

namespace {

constexpr size_t kMinTotalSamples = 2;
constexpr size_t kMinCategories = 2;
constexpr double kSmoothing = 0.1;

} // namespace

StatisticalClassifier::StatisticalClassifier(std::shared_ptr<infrastructure::TrainingSampleStore> samples,
                                             std::shared_ptr<infrastructure::PersistenceService> persistence,
                                             std::string modelPath,
                                             domain::CategoryTaxonomy taxonomy)
    : m_samples(std::move(samples)),
      m_persistence(std::move(persistence)),
      m_modelPath(std::move(modelPath)),
      m_taxonomy(std::move(taxonomy)) {
    reload();
}

bool StatisticalClassifier::reload() {
    auto blob = m_persistence->readText(m_modelPath);
    if (!blob) {
        return false;
    }
    auto model = NaiveBayesModel::Deserialize(*blob);
    if (!model) {
        std::cerr << "[StatisticalClassifier] Error loading model from " << m_modelPath << std::endl;
        return false;
    }
    m_model = std::move(model);
    std::cout << "[StatisticalClassifier] Loaded model with " << m_model->classes().size() << " categories" << std::endl;
    return true;
}

TrainResult StatisticalClassifier::train(int minSamplesPerCategory) {
    TrainResult result;

    std::vector<std::string> descriptions;
    std::vector<std::string> categories;
    std::vector<std::string> subcategories;
    for (const auto& sample : m_samples->loadAll()) {
        std::string desc = text::Trim(sample.description);
        std::string cat = text::Trim(sample.category);
        if (desc.empty() || cat.empty()) continue;
        descriptions.push_back(std::move(desc));
        categories.push_back(std::move(cat));
        subcategories.push_back(text::Trim(sample.subcategory));
    }

    if (descriptions.size() < kMinTotalSamples) {
        result.message = "Need at least " + std::to_string(kMinTotalSamples) +
                         " training samples. Currently have " + std::to_string(descriptions.size()) + ".";
        return result;
    }

    for (const auto& cat : categories) {
        ++result.categoryCounts[cat];
    }

    const size_t minPerCategory = static_cast<size_t>(std::max(1, minSamplesPerCategory));
    std::set<std::string> valid;
    for (const auto& [cat, count] : result.categoryCounts) {
        if (count >= minPerCategory && m_taxonomy.accepts(cat)) {
            valid.insert(cat);
        }
    }

    if (valid.size() < kMinCategories) {
        result.message = "Need at least " + std::to_string(kMinCategories) + " categories with " +
                         std::to_string(minPerCategory) + "+ samples each. Currently have " +
                         std::to_string(valid.size()) + " valid categories.";
        result.categories.assign(valid.begin(), valid.end());
        return result;
    }

    std::vector<std::string> fitDocs;
    std::vector<std::string> fitLabels;
    std::vector<std::string> fitSubs;
    for (size_t i = 0; i < descriptions.size(); ++i) {
        if (!valid.count(categories[i])) continue;
        fitDocs.push_back(descriptions[i]);
        fitLabels.push_back(categories[i]);
        fitSubs.push_back(subcategories[i]);
    }

    NaiveBayesModel model = NaiveBayesModel::Fit(fitDocs, fitLabels, fitSubs, kSmoothing);
    result.persisted = m_persistence->saveText(m_modelPath, model.Serialize());
    if (!result.persisted) {
        std::cerr << "[StatisticalClassifier] Model trained but could not be saved to " << m_modelPath << std::endl;
    }
    m_model = std::move(model);

    result.success = true;
    result.samplesUsed = fitDocs.size();
    result.categories.assign(valid.begin(), valid.end());
    result.message = "Model trained successfully with " + std::to_string(result.samplesUsed) +
                     " samples across " + std::to_string(result.categories.size()) + " categories.";
    if (!result.persisted) result.message += " (model not persisted)";
    std::cout << "[StatisticalClassifier] " << result.message << std::endl;
    return result;
}

std::optional<Prediction> StatisticalClassifier::predict(const std::string& text, bool returnProbability) const {
    if (!m_model) return std::nullopt;
    if (text::Trim(text).empty()) return std::nullopt;

    auto posterior = m_model->predict(text);
    if (!posterior) return std::nullopt;

    Prediction prediction;
    prediction.category = posterior->label;
    prediction.subcategory = m_model->subcategoryFor(posterior->label);
    if (returnProbability) {
        prediction.confidence = posterior->probability;
    }
    return prediction;
}

std::vector<std::optional<Prediction>> StatisticalClassifier::predictBatch(const std::vector<std::string>& texts) const {
    std::vector<std::optional<Prediction>> results;
    results.reserve(texts.size());
    for (const auto& t : texts) {
        results.push_back(predict(t));
    }
    return results;
}

ModelInfo StatisticalClassifier::modelInfo() const {
    ModelInfo info;
    auto stats = m_samples->stats();
    info.totalSamples = stats.totalSamples;
    info.categoryDistribution = stats.categoryCounts;
    info.isTrained = m_model.has_value();
    info.modelFileExists = m_persistence->exists(m_modelPath);
    if (m_model) {
        info.categories = m_model->classes();
        info.vocabularySize = m_model->vocabularySize();
    }
    return info;
}

} // namespace ledgerwise::application
