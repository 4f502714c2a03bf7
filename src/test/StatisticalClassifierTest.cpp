#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <memory>
#include "application/NaiveBayesModel.hpp"
#include "application/StatisticalClassifier.hpp"
#include "application/TfidfVectorizer.hpp"
#include "test/TestSupport.hpp"

using namespace ledgerwise;
using application::StatisticalClassifier;

namespace {

std::shared_ptr<infrastructure::TrainingSampleStore> Store(const test::ScopedTempDir& dir,
                                                           std::shared_ptr<infrastructure::PersistenceService> io) {
    return std::make_shared<infrastructure::TrainingSampleStore>(dir.str(), io);
}

void Add(infrastructure::TrainingSampleStore& store, const std::string& description,
         const std::string& category, const std::string& subcategory) {
    domain::TrainingSample s;
    s.description = description;
    s.category = category;
    s.subcategory = subcategory;
    s.isManual = true;
    assert(store.append(s));
}

void SeedCorpus(infrastructure::TrainingSampleStore& store) {
    Add(store, "ICA Maxi groceries", "Food & Drink", "Groceries");
    Add(store, "ICA Nara food", "Food & Drink", "Groceries");
    Add(store, "Coop groceries Lund", "Food & Drink", "Groceries");
    Add(store, "Max burgers", "Food & Drink", "Restaurant");
    Add(store, "SL monthly ticket", "Transport", "Public Transit");
    Add(store, "SL ticket single", "Transport", "Public Transit");
    Add(store, "Uber ride airport", "Transport", "Taxi");
}

void TestSingleSampleFails() {
    std::cout << "[Test] Training with one sample..." << std::endl;
    test::ScopedTempDir dir("classifier_single");
    auto io = std::make_shared<infrastructure::PersistenceService>();
    auto store = Store(dir, io);
    Add(*store, "ICA Maxi", "Food & Drink", "Groceries");

    StatisticalClassifier classifier(store, io, dir.file("model.json"));
    auto result = classifier.train();
    assert(!result.success);
    assert(result.message == "Need at least 2 training samples. Currently have 1.");
    assert(!classifier.isTrained());
    assert(!classifier.predict("ICA"));
    std::cout << "[PASS] " << result.message << std::endl;
}

void TestSingleCategoryFails() {
    std::cout << "[Test] Training with one usable category..." << std::endl;
    test::ScopedTempDir dir("classifier_one_category");
    auto io = std::make_shared<infrastructure::PersistenceService>();
    auto store = Store(dir, io);
    Add(*store, "ICA Maxi", "Food & Drink", "Groceries");
    Add(*store, "Coop", "Food & Drink", "Groceries");
    Add(*store, "SL", "Transport", "Public Transit");

    StatisticalClassifier classifier(store, io, dir.file("model.json"));
    auto result = classifier.train(2);
    assert(!result.success);
    assert(result.message.find("Currently have 1 valid categories") != std::string::npos);
    std::cout << "[PASS] " << result.message << std::endl;
}

void TestTrainPredictAndReload() {
    std::cout << "[Test] Train, predict, reload..." << std::endl;
    test::ScopedTempDir dir("classifier_reload");
    auto io = std::make_shared<infrastructure::PersistenceService>();
    auto store = Store(dir, io);
    SeedCorpus(*store);
    Add(*store, "Lonely sample", "Shopping", "Clothing"); // below the per-category minimum

    std::string label;
    {
        StatisticalClassifier classifier(store, io, dir.file("model.json"));
        auto result = classifier.train(2);
        assert(result.success);
        assert(result.samplesUsed == 7);
        assert(result.persisted);
        assert(result.categories.size() == 2);
        assert(result.categoryCounts.at("Shopping") == 1);

        auto prediction = classifier.predict("ICA groceries", true);
        assert(prediction);
        assert(prediction->category == "Food & Drink");
        assert(prediction->subcategory == "Groceries");
        assert(prediction->confidence);
        assert(*prediction->confidence > 0.5 && *prediction->confidence <= 1.0);
        label = prediction->category;

        auto withoutProbability = classifier.predict("SL ticket");
        assert(withoutProbability && withoutProbability->category == "Transport");
        assert(!withoutProbability->confidence);

        auto info = classifier.modelInfo();
        assert(info.isTrained && info.modelFileExists);
        assert(info.totalSamples == 8);
        assert(info.vocabularySize > 0);
    }

    StatisticalClassifier fresh(store, io, dir.file("model.json"));
    assert(fresh.isTrained());
    auto again = fresh.predict("ICA groceries", true);
    assert(again && again->category == label);

    auto batch = fresh.predictBatch({"Uber ride", "", "Coop"});
    assert(batch.size() == 3);
    assert(batch[0] && batch[0]->category == "Transport");
    assert(!batch[1]);
    std::cout << "[PASS] Persisted model predicts the same label." << std::endl;
}

void TestUnsavedModelIsReported() {
    std::cout << "[Test] Model that cannot be saved..." << std::endl;
    test::ScopedTempDir dir("classifier_unsaved");
    auto io = std::make_shared<infrastructure::PersistenceService>();
    auto store = Store(dir, io);
    SeedCorpus(*store);

    StatisticalClassifier classifier(store, io, dir.file("model.json"));
    // A non-empty directory where the model file belongs makes the rename fail.
    std::filesystem::create_directories(dir.file("model.json") + "/blocker");

    auto result = classifier.train(1);
    assert(result.success);
    assert(!result.persisted);
    assert(result.message.find("(model not persisted)") != std::string::npos);
    assert(classifier.isTrained());
    std::cout << "[PASS] " << result.message << std::endl;
}

void TestTaxonomyFiltersLabels() {
    std::cout << "[Test] Taxonomy filters training labels..." << std::endl;
    test::ScopedTempDir dir("classifier_taxonomy");
    auto io = std::make_shared<infrastructure::PersistenceService>();
    auto store = Store(dir, io);
    SeedCorpus(*store);
    Add(*store, "Bitcoin exchange", "Crypto", "Coins");
    Add(*store, "Bitcoin purchase", "Crypto", "Coins");

    StatisticalClassifier classifier(store, io, dir.file("model.json"), domain::CategoryTaxonomy::Defaults());
    auto result = classifier.train(2);
    assert(result.success);
    for (const auto& c : result.categories) assert(c != "Crypto");
    std::cout << "[PASS] Unknown categories are not learned." << std::endl;
}

void TestCorruptModelIgnored() {
    std::cout << "[Test] Corrupt model file..." << std::endl;
    test::ScopedTempDir dir("classifier_corrupt");
    auto io = std::make_shared<infrastructure::PersistenceService>();
    assert(io->saveText(dir.file("model.json"), "{\"format_version\": 1, \"classes\": 3"));
    StatisticalClassifier classifier(Store(dir, io), io, dir.file("model.json"));
    assert(!classifier.isTrained());
    assert(!classifier.predict("anything"));
    std::cout << "[PASS] Broken model means untrained." << std::endl;
}

void TestVectorizer() {
    std::cout << "[Test] TF-IDF vectorizer..." << std::endl;
    application::TfidfVectorizer vectorizer;
    vectorizer.fit({"ica maxi", "ica nara", "sl ticket"});

    auto terms = vectorizer.analyze("ICA Maxi a");
    // "a" is shorter than two characters.
    assert(terms.size() == 3);
    assert(terms[0] == "ica" && terms[1] == "maxi" && terms[2] == "ica maxi");

    auto row = vectorizer.transform("ica maxi unknown");
    double norm = 0.0;
    for (const auto& [index, weight] : row) norm += weight * weight;
    assert(std::abs(norm - 1.0) < 1e-9);
    assert(vectorizer.transform("nothing known").empty());

    auto restored = application::TfidfVectorizer::FromJson(vectorizer.toJson());
    assert(restored && restored->vocabularySize() == vectorizer.vocabularySize());
    std::cout << "[PASS] Rows are L2-normalized." << std::endl;
}

void TestModelDeserializeRejectsShapeMismatch() {
    std::cout << "[Test] Model shape validation..." << std::endl;
    auto model = application::NaiveBayesModel::Fit({"ica maxi", "sl ticket"}, {"Food", "Transport"}, {"", ""});
    auto blob = model.Serialize();
    assert(application::NaiveBayesModel::Deserialize(blob));
    assert(!application::NaiveBayesModel::Deserialize("not json"));
    assert(!application::NaiveBayesModel::Deserialize("{\"format_version\": 1}"));
    std::cout << "[PASS] Only well-formed models load." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] StatisticalClassifier suite" << std::endl;
    TestSingleSampleFails();
    TestSingleCategoryFails();
    TestTrainPredictAndReload();
    TestUnsavedModelIsReported();
    TestTaxonomyFiltersLabels();
    TestCorruptModelIgnored();
    TestVectorizer();
    TestModelDeserializeRejectsShapeMismatch();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
