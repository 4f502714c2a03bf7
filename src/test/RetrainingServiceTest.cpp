#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include "application/RetrainingService.hpp"
#include "test/TestSupport.hpp"

using namespace ledgerwise;

namespace {

struct Fixture {
    explicit Fixture(const std::string& name, application::RetrainingSettings settings = {})
        : dir(name),
          io(std::make_shared<infrastructure::PersistenceService>()),
          samples(std::make_shared<infrastructure::TrainingSampleStore>(dir.str(), io)),
          audit(std::make_shared<infrastructure::RetrainingAuditLog>(dir.str(), io)),
          classifier(std::make_shared<application::StatisticalClassifier>(samples, io, dir.file("model.json"))),
          service(classifier, samples, audit, settings) {}

    void Add(const std::string& description, const std::string& category) {
        domain::TrainingSample s;
        s.description = description;
        s.category = category;
        s.subcategory = "General";
        assert(samples->append(s));
    }

    test::ScopedTempDir dir;
    std::shared_ptr<infrastructure::PersistenceService> io;
    std::shared_ptr<infrastructure::TrainingSampleStore> samples;
    std::shared_ptr<infrastructure::RetrainingAuditLog> audit;
    std::shared_ptr<application::StatisticalClassifier> classifier;
    application::RetrainingService service;
};

void TestInsufficientData() {
    std::cout << "[Test] Fewer than four samples..." << std::endl;
    Fixture f("retrain_insufficient");
    f.Add("ICA", "Food & Drink");
    f.Add("Coop", "Food & Drink");
    f.Add("SL", "Transport");

    auto result = f.service.run();
    assert(!result.success);
    assert(result.message == "Insufficient training data: 3 samples (need at least 4)");
    assert(!result.timestamp.empty());
    assert(result.modelType == "MultinomialNB");

    auto entries = f.audit->readAll();
    assert(entries.size() == 1);
    assert(!entries[0].success);
    assert(entries[0].message == result.message);
    std::cout << "[PASS] " << result.message << std::endl;
}

void TestTrainingFailureIsReported() {
    std::cout << "[Test] Training failure..." << std::endl;
    Fixture f("retrain_training_failure");
    for (const char* d : {"ICA", "Coop", "Lidl", "Willys"}) f.Add(d, "Food & Drink");

    auto result = f.service.run();
    assert(!result.success);
    assert(result.message.rfind("ML training failed: ", 0) == 0);
    assert(result.message.find("categories") != std::string::npos);
    assert(f.audit->readAll().size() == 1);
    assert(!f.classifier->isTrained());
    std::cout << "[PASS] " << result.message << std::endl;
}

void TestSuccessfulRun() {
    std::cout << "[Test] Successful retraining..." << std::endl;
    Fixture f("retrain_success");
    f.Add("ICA Maxi", "Food & Drink");
    f.Add("Coop Forum", "Food & Drink");
    f.Add("SL Access", "Transport");
    f.Add("SJ biljett", "Transport");
    f.Add("H&M", "Shopping"); // single sample, left out of the fit

    auto result = f.service.run();
    assert(result.success);
    assert(result.samplesUsed == 4);
    assert(std::abs(result.accuracy - 0.8) < 1e-9);
    assert(result.message == "Successfully retrained model with 4 samples");
    assert(f.classifier->isTrained());

    auto last = f.audit->last();
    assert(last);
    assert(last->success);
    assert(last->samplesUsed == 4);
    assert(std::abs(last->accuracy - 0.8) < 1e-9);
    assert(last->modelType == "MultinomialNB");
    std::cout << "[PASS] accuracy=" << result.accuracy << std::endl;
}

void TestEveryRunIsAudited() {
    std::cout << "[Test] Audit trail is append-only..." << std::endl;
    Fixture f("retrain_audit");
    f.service.run();
    f.Add("ICA Maxi", "Food & Drink");
    f.Add("Coop Forum", "Food & Drink");
    f.Add("SL Access", "Transport");
    f.Add("SJ biljett", "Transport");
    f.service.run();
    f.service.run();

    auto entries = f.audit->readAll();
    assert(entries.size() == 3);
    assert(!entries[0].success);
    assert(entries[1].success && entries[2].success);
    std::cout << "[PASS] Three runs, three entries." << std::endl;
}

void TestShouldRetrain() {
    std::cout << "[Test] Retrain threshold..." << std::endl;
    application::RetrainingSettings settings;
    settings.triggerThreshold = 3;
    Fixture f("retrain_should", settings);

    assert(!f.service.shouldRetrain());
    f.Add("ICA", "Food & Drink");
    f.Add("Coop", "Food & Drink");
    assert(!f.service.shouldRetrain());
    f.Add("SL", "Transport");
    assert(f.service.shouldRetrain());

    auto stats = f.service.stats();
    assert(stats.triggerThreshold == 3);
    assert(stats.shouldRetrain);
    assert(!stats.lastRun);

    assert(f.samples->clear());
    assert(f.samples->loadAll().empty());
    assert(!f.service.shouldRetrain());
    std::cout << "[PASS] shouldRetrain follows the corpus size." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] RetrainingService suite" << std::endl;
    TestInsufficientData();
    TestTrainingFailureIsReported();
    TestSuccessfulRun();
    TestEveryRunIsAudited();
    TestShouldRetrain();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
