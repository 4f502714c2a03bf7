#include <cassert>
#include <iostream>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/RecordCodec.hpp"
#include "test/TestSupport.hpp"

using namespace ledgerwise;
using infrastructure::ConfigLoader;
using infrastructure::RecordCodec;

namespace {

void TestDefaultsWhenMissing() {
    std::cout << "[Test] Missing documents..." << std::endl;
    test::ScopedTempDir dir("config_missing");

    auto config = ConfigLoader::Load(dir.str());
    assert(config.categorization.confidenceThreshold == 0.65);
    assert(config.categorization.semanticThreshold == 0.75);
    assert(config.categorization.semanticReviewThreshold == 0.85);
    assert(config.categorization.retrainTrigger == 10);
    assert(config.categorization.defaultCategory == "Other");
    assert(config.semantic.model == "nomic-embed-text");
    assert(config.retraining.triggerThreshold == 10);
    assert(config.reconciliation.dateToleranceDays == 7);
    assert(config.reconciliation.acceptanceThreshold == 0.7);

    assert(ConfigLoader::LoadRules(dir.str()).empty());
    assert(ConfigLoader::LoadSemanticExamples(dir.str()).empty());
    assert(ConfigLoader::LoadTaxonomy(dir.str()).hasCategory("Loans"));
    std::cout << "[PASS] Defaults used." << std::endl;
}

void TestPartialAndMalformedSettings() {
    std::cout << "[Test] Partial and malformed settings..." << std::endl;
    test::ScopedTempDir dir("config_partial");
    infrastructure::PersistenceService io;

    assert(io.saveText(dir.file("settings.json"),
                       R"({"categorization": {"retrain_trigger": 3, "use_semantic": false},
                           "reconciliation": {"date_tolerance_days": 3}})"));
    auto config = ConfigLoader::Load(dir.str());
    assert(config.categorization.retrainTrigger == 3);
    assert(!config.categorization.useSemantic);
    assert(config.categorization.useAi);
    assert(config.reconciliation.dateToleranceDays == 3);
    assert(config.reconciliation.amountTolerancePercent == 5.0);

    assert(io.saveText(dir.file("settings.json"), "{ not json"));
    auto fallback = ConfigLoader::Load(dir.str());
    assert(fallback.categorization.retrainTrigger == 10);

    config.semantic.port = 11500;
    assert(ConfigLoader::Save(dir.str(), config));
    assert(ConfigLoader::Load(dir.str()).semantic.port == 11500);
    std::cout << "[PASS] Missing keys keep defaults." << std::endl;
}

void TestRulesDocument() {
    std::cout << "[Test] rules.json..." << std::endl;
    test::ScopedTempDir dir("config_rules");
    infrastructure::PersistenceService io;
    assert(io.saveText(dir.file("rules.json"), R"({"rules": [
        {"pattern": "SHELL", "category": "Transport", "subcategory": "Fuel & Parking", "priority": 70},
        {"pattern": "", "category": "Broken"},
        {"pattern": "NETFLIX", "category": "Entertainment", "subcategory": "Cinema & Theatre"}
    ]})"));

    auto rules = ConfigLoader::LoadRules(dir.str());
    assert(rules.size() == 2);
    assert(rules[0].priority == 70);
    assert(rules[1].priority == 50);

    rules[1].generated = true;
    rules[1].createdAt = "2025-11-01 10:00:00";
    assert(ConfigLoader::SaveRules(dir.str(), rules));
    auto again = ConfigLoader::LoadRules(dir.str());
    assert(again.size() == 2 && again[1].generated && !again[0].generated);
    std::cout << "[PASS] Invalid rules skipped." << std::endl;
}

void TestExamplesKeepFileOrder() {
    std::cout << "[Test] semantic_examples.json order..." << std::endl;
    test::ScopedTempDir dir("config_examples");
    infrastructure::PersistenceService io;
    assert(io.saveText(dir.file("semantic_examples.json"), R"({
        "Transport": {"Taxi": ["taxi ride"], "Public Transit": ["bus card"]},
        "Food & Drink": {"Cafe": ["coffee"], "Empty": []}
    })"));

    auto examples = ConfigLoader::LoadSemanticExamples(dir.str());
    assert(examples.size() == 3);
    assert(examples[0].category == "Transport" && examples[0].subcategory == "Taxi");
    assert(examples[1].subcategory == "Public Transit");
    assert(examples[2].category == "Food & Drink");
    std::cout << "[PASS] Buckets in file order." << std::endl;
}

void TestCustomTaxonomy() {
    std::cout << "[Test] taxonomy.json..." << std::endl;
    test::ScopedTempDir dir("config_taxonomy");
    infrastructure::PersistenceService io;
    assert(io.saveText(dir.file("taxonomy.json"),
                       R"({"categories": {"Pets": ["Food", "Vet"], "Travel": []}})"));
    auto taxonomy = ConfigLoader::LoadTaxonomy(dir.str());
    assert(taxonomy.categories().size() == 2);
    assert(taxonomy.categories()[0] == "Pets");
    assert(taxonomy.hasSubcategory("Pets", "Vet"));
    assert(taxonomy.subcategories("Pets").size() == 2);
    assert(taxonomy.subcategories("Travel").empty());
    assert(taxonomy.subcategories("Loans").empty());
    assert(!taxonomy.accepts("Loans"));
    assert(domain::CategoryTaxonomy().accepts("Anything"));
    std::cout << "[PASS] Custom taxonomy replaces the defaults." << std::endl;
}

void TestRecordCodec() {
    std::cout << "[Test] Record codec..." << std::endl;
    auto transactions = RecordCodec::ParseTransactions(R"({"transactions": [
        {"id": "T1", "description": "Shell", "amount": -450.5, "date": "2025-11-01", "account_ref": "1234"},
        {"amount": 10},
        {"description": "Netflix", "amount": -129, "date": "2025-11-02", "account_ref": "", "merchant": null}
    ]})");
    assert(transactions.size() == 2);
    assert(transactions[0].amount == -450.5);
    assert(transactions[1].merchant.empty());
    assert(transactions[1].reference().rfind("TX-2025-11-02-Netflix-", 0) == 0);

    transactions[0].category = "Transport";
    transactions[0].classificationSource = domain::ClassificationSource::Rule;
    auto j = RecordCodec::ToJson(transactions[0]);
    assert(j["classification_source"] == "rule");
    assert(j["matched_obligation_ref"].is_null());

    auto obligations = RecordCodec::ParseObligations(R"([
        {"id": "O1", "name": "Rent", "amount": 8000, "due_date": "2025-11-30", "status": "posted"},
        {"id": "O2", "name": "Loan", "amount": 5000, "due_date": "2025-11-27", "loan_ref": "L1"},
        {"id": "O3", "name": "No date", "amount": 1}
    ])");
    assert(obligations.size() == 2);
    assert(obligations[0].status == domain::ObligationStatus::Posted);
    assert(!obligations[0].accountRef);
    assert(obligations[1].kind == domain::ObligationKind::LoanPayment);

    auto loans = RecordCodec::ParseLoans(R"({"loans": [{"id": "L1", "name": "Bolan", "principal": 100}]})");
    assert(loans.size() == 1);
    assert(loans[0].currentBalance == 100.0);
    assert(RecordCodec::ToJson(loans[0])["status"] == "active");

    assert(RecordCodec::ParseTransactions("garbage").empty());
    assert(RecordCodec::ParseTransactions(R"({"other": []})").empty());
    std::cout << "[PASS] Records decoded and malformed entries skipped." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] ConfigLoader suite" << std::endl;
    TestDefaultsWhenMissing();
    TestPartialAndMalformedSettings();
    TestRulesDocument();
    TestExamplesKeepFileOrder();
    TestCustomTaxonomy();
    TestRecordCodec();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
