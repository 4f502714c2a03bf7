/**
 * @file TfidfVectorizer.cpp
 * @brief Implementation of TfidfVectorizer.
 */

#include "application/TfidfVectorizer.hpp"
#include "application/TextUtils.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_map>

namespace ledgerwise::application {

using json = nlohmann::json;

TfidfVectorizer::TfidfVectorizer() : TfidfVectorizer(Options{}) {}

TfidfVectorizer::TfidfVectorizer(Options options) : m_options(options) {}

std::vector<std::string> TfidfVectorizer::analyze(const std::string& document) const {
    auto tokens = text::WordTokens(document, 2);
    std::vector<std::string> terms = tokens;
    for (size_t n = 2; n <= m_options.ngramMax; ++n) {
        for (size_t i = 0; i + n <= tokens.size(); ++i) {
            std::string gram = tokens[i];
            for (size_t k = 1; k < n; ++k) {
                gram += " " + tokens[i + k];
            }
            terms.push_back(std::move(gram));
        }
    }
    return terms;
}

void TfidfVectorizer::fit(const std::vector<std::string>& documents) {
    std::unordered_map<std::string, size_t> termFrequency;
    std::unordered_map<std::string, size_t> documentFrequency;

    for (const auto& doc : documents) {
        auto terms = analyze(doc);
        std::set<std::string> seen;
        for (const auto& term : terms) {
            ++termFrequency[term];
            if (seen.insert(term).second) {
                ++documentFrequency[term];
            }
        }
    }

    std::vector<std::pair<std::string, size_t>> ranked(termFrequency.begin(), termFrequency.end());
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });
    if (ranked.size() > m_options.maxFeatures) {
        ranked.resize(m_options.maxFeatures);
    }

    // Feature indices follow alphabetical order of the kept terms.
    std::vector<std::string> kept;
    kept.reserve(ranked.size());
    for (const auto& entry : ranked) kept.push_back(entry.first);
    std::sort(kept.begin(), kept.end());

    m_vocabulary.clear();
    m_idf.assign(kept.size(), 0.0);
    const double n = static_cast<double>(documents.size());
    for (size_t i = 0; i < kept.size(); ++i) {
        m_vocabulary[kept[i]] = i;
        double df = static_cast<double>(documentFrequency[kept[i]]);
        m_idf[i] = std::log((1.0 + n) / (1.0 + df)) + 1.0;
    }
}

SparseVector TfidfVectorizer::transform(const std::string& document) const {
    std::map<size_t, double> counts;
    for (const auto& term : analyze(document)) {
        auto it = m_vocabulary.find(term);
        if (it != m_vocabulary.end()) {
            counts[it->second] += 1.0;
        }
    }

    SparseVector row;
    row.reserve(counts.size());
    double norm = 0.0;
    for (const auto& [index, count] : counts) {
        double weight = count * m_idf[index];
        row.emplace_back(index, weight);
        norm += weight * weight;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (auto& entry : row) entry.second /= norm;
    }
    return row;
}

json TfidfVectorizer::toJson() const {
    json vocab = json::object();
    for (const auto& [term, index] : m_vocabulary) {
        vocab[term] = index;
    }
    return json{
        {"max_features", m_options.maxFeatures},
        {"ngram_max", m_options.ngramMax},
        {"vocabulary", vocab},
        {"idf", m_idf}
    };
}

std::optional<TfidfVectorizer> TfidfVectorizer::FromJson(const json& j) {
    Options options;
    options.maxFeatures = j.value("max_features", options.maxFeatures);
    options.ngramMax = j.value("ngram_max", options.ngramMax);

    TfidfVectorizer vectorizer(options);
    vectorizer.m_idf = j.at("idf").get<std::vector<double>>();
    for (auto it = j.at("vocabulary").begin(); it != j.at("vocabulary").end(); ++it) {
        size_t index = it.value().get<size_t>();
        if (index >= vectorizer.m_idf.size()) {
            return std::nullopt;
        }
        vectorizer.m_vocabulary[it.key()] = index;
    }
    if (vectorizer.m_vocabulary.size() != vectorizer.m_idf.size()) {
        return std::nullopt;
    }
    return vectorizer;
}

} // namespace ledgerwise::application
