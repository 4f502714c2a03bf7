/**
 * @file RuleMatcher.cpp
 * @brief Implementation of RuleMatcher.
 */

#include "application/RuleMatcher.hpp"
#include "application/TextUtils.hpp"
#include "infrastructure/TrainingSampleStore.hpp"
#include <algorithm>
#include <iostream>
#include <set>

namespace ledgerwise::application {

namespace {

constexpr int kGeneratedRulePriority = 60;
constexpr size_t kMaxKeywords = 5;
constexpr size_t kMinManualSamples = 2;

const std::set<std::string>& NoiseWords() {
    static const std::set<std::string> words = {
        "och", "eller", "för", "från", "till", "med", "av", "på", "en", "ett", "den", "det",
        "the", "and", "for", "from", "with", "via"
    };
    return words;
}

std::string ToUpperAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

RuleMatcher::RuleMatcher(std::vector<domain::ClassificationRule> rules) : m_rules(std::move(rules)) {
    compile();
}

void RuleMatcher::compile() {
    m_ordered.clear();
    m_ordered.reserve(m_rules.size());
    for (size_t i = 0; i < m_rules.size(); ++i) {
        CompiledRule compiled{i, std::nullopt};
        try {
            // icase only folds ASCII; Latin-1 letters are folded on both sides instead.
            compiled.regex.emplace(text::FoldLatin1(m_rules[i].pattern), std::regex::ECMAScript | std::regex::icase);
        } catch (const std::regex_error& e) {
            std::cerr << "[RuleMatcher] Pattern '" << m_rules[i].pattern
                      << "' is not a valid expression (" << e.what() << "), using substring match" << std::endl;
        }
        m_ordered.push_back(std::move(compiled));
    }
    std::stable_sort(m_ordered.begin(), m_ordered.end(), [this](const CompiledRule& a, const CompiledRule& b) {
        return m_rules[a.index].priority > m_rules[b.index].priority;
    });
}

std::optional<RuleMatch> RuleMatcher::match(const std::string& text) const {
    if (text.empty()) return std::nullopt;
    const std::string folded = text::FoldLatin1(text);

    for (const auto& compiled : m_ordered) {
        const auto& rule = m_rules[compiled.index];
        bool hit = false;
        if (compiled.regex) {
            hit = std::regex_search(folded, *compiled.regex);
        } else {
            hit = text::ContainsFolded(text, rule.pattern);
        }
        if (hit) {
            return RuleMatch{rule.category, rule.subcategory, rule.pattern};
        }
    }
    return std::nullopt;
}

std::vector<std::string> RuleMatcher::ExtractKeywords(const std::string& description) {
    std::vector<std::string> keywords;
    for (const auto& token : text::WordTokens(description, 3)) {
        if (NoiseWords().count(token)) continue;
        keywords.push_back(token);
        if (keywords.size() == kMaxKeywords) break;
    }
    return keywords;
}

RuleLearningResult RuleMatcher::learnFromSamples(const std::vector<domain::TrainingSample>& samples) {
    RuleLearningResult result;

    std::vector<const domain::TrainingSample*> manual;
    for (const auto& sample : samples) {
        if (sample.isManual) manual.push_back(&sample);
    }
    if (manual.size() < kMinManualSamples) {
        result.message = "Need at least " + std::to_string(kMinManualSamples) +
                         " manual samples to train. Currently have " + std::to_string(manual.size()) + ".";
        return result;
    }

    const std::string createdAt = infrastructure::CurrentTimestamp();
    std::vector<domain::ClassificationRule> newRules;
    std::set<std::string> trained;

    auto patternExists = [&](const std::string& keyword) {
        auto contains = [&](const domain::ClassificationRule& rule) {
            return text::FoldCase(rule.pattern).find(keyword) != std::string::npos;
        };
        return std::any_of(m_rules.begin(), m_rules.end(), contains) ||
               std::any_of(newRules.begin(), newRules.end(), contains);
    };

    for (const auto* sample : manual) {
        const std::string category = sample->category.empty() ? "Unknown" : sample->category;
        if (trained.insert(category).second) {
            result.categoriesTrained.push_back(category);
        }

        auto keywords = ExtractKeywords(sample->description);
        if (keywords.empty()) continue;

        const std::string& primary = keywords.front();
        if (patternExists(primary)) continue;

        domain::ClassificationRule rule;
        rule.pattern = ToUpperAscii(primary);
        rule.category = category;
        rule.subcategory = sample->subcategory;
        rule.priority = kGeneratedRulePriority;
        rule.generated = true;
        rule.createdAt = createdAt;
        newRules.push_back(std::move(rule));
    }

    result.rulesCreated = newRules.size();
    if (!newRules.empty()) {
        m_rules.insert(m_rules.end(), newRules.begin(), newRules.end());
        compile();
    }
    result.success = true;
    result.message = "Training complete! Created " + std::to_string(result.rulesCreated) + " new categorization rules.";
    return result;
}

size_t RuleMatcher::removeGeneratedRules() {
    size_t before = m_rules.size();
    m_rules.erase(std::remove_if(m_rules.begin(), m_rules.end(),
                                 [](const domain::ClassificationRule& r) { return r.generated; }),
                  m_rules.end());
    size_t removed = before - m_rules.size();
    if (removed > 0) compile();
    return removed;
}

} // namespace ledgerwise::application
