#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include "application/SemanticMatcher.hpp"
#include "test/TestSupport.hpp"

using namespace ledgerwise;
using application::SemanticMatcher;

namespace {

std::vector<domain::SemanticExample> Examples() {
    return {
        {"Food & Drink", "Groceries", {"weekly grocery shopping", "supermarket food"}},
        {"Transport", "Taxi", {"taxi ride downtown", "airport cab"}},
        {"Food & Drink", "Cafe", {"coffee and pastry"}}
    };
}

void TestMatchesClosestExample() {
    std::cout << "[Test] Closest example wins..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    SemanticMatcher matcher(provider, Examples(), 0.75);
    assert(matcher.isAvailable());

    auto match = matcher.match("airport cab");
    assert(match);
    assert(match->category == "Transport");
    assert(match->subcategory == "Taxi");
    assert(match->bestExample == "airport cab");
    assert(std::abs(match->similarityScore - 1.0) < 1e-6);

    auto stats = matcher.stats();
    assert(stats.modelAvailable);
    assert(stats.modelName == "fake-embed");
    assert(stats.categoriesCached == 3);
    std::cout << "[PASS] Exact phrase scores 1.0." << std::endl;
}

void TestHighThresholdRejectsUnrelated() {
    std::cout << "[Test] Threshold 0.99 with an unrelated phrase..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    SemanticMatcher matcher(provider, Examples(), 0.99);
    assert(!matcher.match("quarterly municipal tax statement"));
    assert(!matcher.match(""));
    std::cout << "[PASS] No match below threshold." << std::endl;
}

void TestUnavailableProvider() {
    std::cout << "[Test] Unavailable provider..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>(false);
    SemanticMatcher matcher(provider, Examples(), 0.5);
    assert(!matcher.isAvailable());
    assert(!matcher.match("airport cab"));
    assert(provider->calls == 0);

    SemanticMatcher noProvider(nullptr, Examples(), 0.5);
    assert(!noProvider.isAvailable());
    assert(!noProvider.match("airport cab"));

    auto up = std::make_shared<test::FakeEmbeddingProvider>();
    SemanticMatcher noExamples(up, {}, 0.5);
    assert(!noExamples.isAvailable());
    std::cout << "[PASS] Matcher disabled for its lifetime." << std::endl;
}

void TestEmbeddingsComputedOnce() {
    std::cout << "[Test] Example embeddings cached..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    SemanticMatcher matcher(provider, Examples(), 0.5);
    const int afterBuild = provider->calls;
    assert(afterBuild == 5);

    matcher.match("coffee");
    matcher.match("taxi");
    assert(provider->calls == afterBuild + 2);
    std::cout << "[PASS] One embed per query after construction." << std::endl;
}

void TestTiesKeepFirstBucket() {
    std::cout << "[Test] Tie-break..." << std::endl;
    auto provider = std::make_shared<test::FakeEmbeddingProvider>();
    std::vector<domain::SemanticExample> examples = {
        {"Housing", "Electricity", {"monthly payment"}},
        {"Loans", "Loan Payment", {"monthly payment"}}
    };
    SemanticMatcher matcher(provider, examples, 0.5);
    auto match = matcher.match("monthly payment");
    assert(match && match->category == "Housing");
    std::cout << "[PASS] Earlier bucket keeps the tie." << std::endl;
}

void TestCosineSimilarity() {
    std::cout << "[Test] Cosine similarity..." << std::endl;
    assert(std::abs(SemanticMatcher::CosineSimilarity({1, 2, 3}, {1, 2, 3}) - 1.0) < 1e-9);
    assert(std::abs(SemanticMatcher::CosineSimilarity({1, 0}, {0, 1})) < 1e-9);
    assert(SemanticMatcher::CosineSimilarity({1, 0}, {1, 0, 0}) == 0.0);
    assert(SemanticMatcher::CosineSimilarity({0, 0}, {1, 0}) == 0.0);
    std::cout << "[PASS] Edge cases handled." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] SemanticMatcher suite" << std::endl;
    TestMatchesClosestExample();
    TestHighThresholdRejectsUnrelated();
    TestUnavailableProvider();
    TestEmbeddingsComputedOnce();
    TestTiesKeepFirstBucket();
    TestCosineSimilarity();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
