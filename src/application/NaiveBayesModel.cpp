/**
 * @file NaiveBayesModel.cpp
 * @brief Implementation of NaiveBayesModel.
 */

#include "application/NaiveBayesModel.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <nlohmann/json.hpp>

namespace ledgerwise::application {

using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;

} // namespace

NaiveBayesModel NaiveBayesModel::Fit(const std::vector<std::string>& documents,
                                     const std::vector<std::string>& labels,
                                     const std::vector<std::string>& subcategories,
                                     double alpha) {
    NaiveBayesModel model;
    model.m_alpha = alpha;
    model.m_vectorizer.fit(documents);

    model.m_classes = labels;
    std::sort(model.m_classes.begin(), model.m_classes.end());
    model.m_classes.erase(std::unique(model.m_classes.begin(), model.m_classes.end()), model.m_classes.end());

    const size_t numClasses = model.m_classes.size();
    const size_t numFeatures = model.m_vectorizer.vocabularySize();
    std::vector<double> classCount(numClasses, 0.0);
    std::vector<std::vector<double>> featureCount(numClasses, std::vector<double>(numFeatures, 0.0));

    // Subcategory votes, first seen wins ties.
    std::map<std::string, std::vector<std::pair<std::string, size_t>>> votes;

    for (size_t i = 0; i < documents.size(); ++i) {
        size_t c = static_cast<size_t>(std::lower_bound(model.m_classes.begin(), model.m_classes.end(), labels[i]) -
                                       model.m_classes.begin());
        classCount[c] += 1.0;
        for (const auto& [index, weight] : model.m_vectorizer.transform(documents[i])) {
            featureCount[c][index] += weight;
        }

        const std::string& sub = i < subcategories.size() ? subcategories[i] : std::string();
        if (sub.empty()) continue;
        auto& tally = votes[labels[i]];
        auto it = std::find_if(tally.begin(), tally.end(), [&](const auto& v) { return v.first == sub; });
        if (it == tally.end()) {
            tally.emplace_back(sub, 1);
        } else {
            ++it->second;
        }
    }

    const double total = static_cast<double>(documents.size());
    model.m_classLogPrior.resize(numClasses);
    model.m_featureLogProb.assign(numClasses, std::vector<double>(numFeatures, 0.0));
    for (size_t c = 0; c < numClasses; ++c) {
        model.m_classLogPrior[c] = std::log(classCount[c] / total);
        double rowSum = 0.0;
        for (double v : featureCount[c]) rowSum += v;
        const double denom = rowSum + alpha * static_cast<double>(numFeatures);
        for (size_t f = 0; f < numFeatures; ++f) {
            model.m_featureLogProb[c][f] = std::log((featureCount[c][f] + alpha) / denom);
        }
    }

    for (const auto& [label, tally] : votes) {
        const auto* best = &tally.front();
        for (const auto& entry : tally) {
            if (entry.second > best->second) best = &entry;
        }
        model.m_subcategories[label] = best->first;
    }

    return model;
}

std::optional<NaiveBayesModel::Posterior> NaiveBayesModel::predict(const std::string& text) const {
    if (m_classes.empty()) return std::nullopt;

    auto features = m_vectorizer.transform(text);
    std::vector<double> jointLog(m_classes.size());
    for (size_t c = 0; c < m_classes.size(); ++c) {
        double score = m_classLogPrior[c];
        for (const auto& [index, weight] : features) {
            score += weight * m_featureLogProb[c][index];
        }
        jointLog[c] = score;
    }

    // Softmax with the max subtracted for stability.
    size_t best = 0;
    for (size_t c = 1; c < jointLog.size(); ++c) {
        if (jointLog[c] > jointLog[best]) best = c;
    }
    double sum = 0.0;
    for (double v : jointLog) sum += std::exp(v - jointLog[best]);

    Posterior posterior;
    posterior.label = m_classes[best];
    posterior.probability = std::clamp(1.0 / sum, 0.0, 1.0);
    return posterior;
}

std::string NaiveBayesModel::subcategoryFor(const std::string& label) const {
    auto it = m_subcategories.find(label);
    return it == m_subcategories.end() ? std::string() : it->second;
}

std::string NaiveBayesModel::Serialize() const {
    json j = {
        {"format_version", kFormatVersion},
        {"model_type", "MultinomialNB"},
        {"alpha", m_alpha},
        {"vectorizer", m_vectorizer.toJson()},
        {"classes", m_classes},
        {"class_log_prior", m_classLogPrior},
        {"feature_log_prob", m_featureLogProb},
        {"subcategories", m_subcategories}
    };
    return j.dump();
}

std::optional<NaiveBayesModel> NaiveBayesModel::Deserialize(const std::string& blob) {
    try {
        auto j = json::parse(blob);
        if (j.value("format_version", 0) != kFormatVersion) {
            std::cerr << "[NaiveBayesModel] Unsupported model format" << std::endl;
            return std::nullopt;
        }

        auto vectorizer = TfidfVectorizer::FromJson(j.at("vectorizer"));
        if (!vectorizer) {
            std::cerr << "[NaiveBayesModel] Inconsistent vectorizer vocabulary" << std::endl;
            return std::nullopt;
        }

        NaiveBayesModel model;
        model.m_vectorizer = std::move(*vectorizer);
        model.m_alpha = j.value("alpha", 0.1);
        model.m_classes = j.at("classes").get<std::vector<std::string>>();
        model.m_classLogPrior = j.at("class_log_prior").get<std::vector<double>>();
        model.m_featureLogProb = j.at("feature_log_prob").get<std::vector<std::vector<double>>>();
        model.m_subcategories = j.value("subcategories", std::map<std::string, std::string>{});

        const size_t numFeatures = model.m_vectorizer.vocabularySize();
        bool shapeOk = model.m_classLogPrior.size() == model.m_classes.size() &&
                       model.m_featureLogProb.size() == model.m_classes.size();
        for (const auto& row : model.m_featureLogProb) {
            shapeOk = shapeOk && row.size() == numFeatures;
        }
        if (!shapeOk) {
            std::cerr << "[NaiveBayesModel] Parameter shapes do not match the vocabulary" << std::endl;
            return std::nullopt;
        }
        return model;
    } catch (const json::exception& e) {
        std::cerr << "[NaiveBayesModel] Failed to load model: " << e.what() << std::endl;
    }
    return std::nullopt;
}

} // namespace ledgerwise::application
