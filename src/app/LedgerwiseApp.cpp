/**
 * @file LedgerwiseApp.cpp
 * @brief Implementation of the Ledgerwise command-line front end.
 */

#include "app/LedgerwiseApp.hpp"

#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <tuple>
#include <nlohmann/json.hpp>

#include "application/ClassificationStrategies.hpp"
#include "domain/CalendarDate.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/OllamaEmbeddingProvider.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/RecordCodec.hpp"

namespace ledgerwise::app {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

struct CommandLine {
    std::string command;
    std::vector<std::string> positional;
    std::map<std::string, std::string> options; ///< "--key value" pairs, "--flag" maps to "".
};

const char* const kFlagOptions[] = {"--no-ai", "--no-semantic"};

bool IsFlag(const std::string& arg) {
    for (const char* flag : kFlagOptions) {
        if (arg == flag) return true;
    }
    return false;
}

CommandLine ParseCommandLine(int argc, char** argv) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.rfind("--", 0) == 0) {
            if (IsFlag(arg) || i + 1 >= argc) {
                cl.options[arg] = "";
            } else {
                cl.options[arg] = argv[++i];
            }
        } else if (cl.command.empty()) {
            cl.command = arg;
        } else {
            cl.positional.push_back(arg);
        }
    }
    return cl;
}

std::optional<std::string> ReadInput(infrastructure::PersistenceService& io, const std::string& path) {
    auto text = io.readText(path);
    if (!text) {
        std::cerr << "[LedgerwiseApp] Cannot read " << path << std::endl;
    }
    return text;
}

json ResultToJson(const application::ClassificationResult& r) {
    return {
        {"category", r.category},
        {"subcategory", r.subcategory},
        {"confidence_score", r.confidenceScore},
        {"classification_source", domain::SourceToString(r.source)},
        {"flagged", r.flagged},
        {"evidence", r.evidence}
    };
}

json RetrainingToJson(const application::RetrainingResult& r) {
    return {
        {"success", r.success},
        {"timestamp", r.timestamp},
        {"model_type", r.modelType},
        {"samples_used", r.samplesUsed},
        {"accuracy", r.accuracy},
        {"message", r.message}
    };
}

} // namespace

int LedgerwiseApp::Run(int argc, char** argv) {
    const CommandLine cl = ParseCommandLine(argc, argv);
    m_command = cl.command;
    m_options = cl.options;

    if (cl.command.empty() || cl.command == "help" || cl.options.count("--help")) {
        PrintUsage();
        return cl.command.empty() ? 1 : 0;
    }

    auto dataDir = cl.options.find("--data-dir");
    m_dataDir = dataDir != cl.options.end() ? dataDir->second
                                            : infrastructure::PathUtils::GetDefaultDataDir().string();
    auto out = cl.options.find("--out");
    if (out != cl.options.end()) m_outPath = out->second;

    if (!Init(m_dataDir)) {
        return 1;
    }

    if (cl.command == "classify") return Classify(cl.positional);
    if (cl.command == "override") return Override(cl.positional);
    if (cl.command == "train") return Train();
    if (cl.command == "retrain") return Retrain();
    if (cl.command == "learn-rules") return LearnRules();
    if (cl.command == "reconcile") return Reconcile(cl.positional);
    if (cl.command == "stats") return Stats();

    std::cerr << "[LedgerwiseApp] Unknown command: " << cl.command << std::endl;
    PrintUsage();
    return 1;
}

bool LedgerwiseApp::Init(const std::string& dataDir) {
    std::error_code ec;
    fs::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "[LedgerwiseApp] Cannot create data directory " << dataDir << ": " << ec.message() << std::endl;
        return false;
    }
    std::cout << "[LedgerwiseApp] Data directory: " << dataDir << std::endl;

    auto& s = m_services;
    s.config = infrastructure::ConfigLoader::Load(dataDir);
    s.taxonomy = infrastructure::ConfigLoader::LoadTaxonomy(dataDir);

    if (m_options.count("--no-ai")) s.config.categorization.useAi = false;
    if (m_options.count("--no-semantic")) s.config.categorization.useSemantic = false;

    s.persistenceService = std::make_shared<infrastructure::PersistenceService>();
    s.trainingSamples = std::make_shared<infrastructure::TrainingSampleStore>(dataDir, s.persistenceService);
    s.auditLog = std::make_shared<infrastructure::RetrainingAuditLog>(dataDir, s.persistenceService);

    s.ruleMatcher = std::make_shared<application::RuleMatcher>(infrastructure::ConfigLoader::LoadRules(dataDir));
    s.classifier = std::make_shared<application::StatisticalClassifier>(
        s.trainingSamples, s.persistenceService, (fs::path(dataDir) / "model.json").string(), s.taxonomy);

    // Only the classify command needs embeddings; the provider probes the server on construction.
    if (s.config.categorization.useSemantic && m_command == "classify") {
        const auto& sem = s.config.semantic;
        auto provider = std::make_shared<infrastructure::OllamaEmbeddingProvider>(sem.host, sem.port, sem.model);
        s.semanticMatcher = std::make_shared<application::SemanticMatcher>(
            provider, infrastructure::ConfigLoader::LoadSemanticExamples(dataDir), sem.similarityThreshold);
    }

    s.retrainingService = std::make_shared<application::RetrainingService>(
        s.classifier, s.trainingSamples, s.auditLog, s.config.retraining);

    std::shared_ptr<domain::ClassificationStrategy> semantic;
    if (s.semanticMatcher) semantic = std::make_shared<application::SemanticStrategy>(s.semanticMatcher);

    s.pipeline = std::make_unique<application::ClassificationPipeline>(
        s.config.categorization,
        std::make_shared<application::StatisticalStrategy>(s.classifier),
        semantic,
        std::make_shared<application::RuleStrategy>(s.ruleMatcher),
        s.trainingSamples,
        s.retrainingService,
        s.taxonomy);

    s.reconciliationMatcher = std::make_unique<application::ReconciliationMatcher>(s.config.reconciliation);
    return true;
}

int LedgerwiseApp::Classify(const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "[LedgerwiseApp] classify needs a transactions file" << std::endl;
        return 1;
    }
    auto text = ReadInput(*m_services.persistenceService, args[0]);
    if (!text) return 1;

    auto transactions = infrastructure::RecordCodec::ParseTransactions(*text);
    auto results = m_services.pipeline->classifyBatch(transactions);

    json out = json::array();
    for (size_t i = 0; i < transactions.size(); ++i) {
        json item = infrastructure::RecordCodec::ToJson(transactions[i]);
        item["flagged"] = results[i].flagged;
        item["evidence"] = results[i].evidence;
        out.push_back(item);
    }
    return Emit(json{{"transactions", out}}.dump(2));
}

int LedgerwiseApp::Override(const std::vector<std::string>& args) {
    std::vector<std::tuple<std::string, std::string, std::string>> overrides;

    auto file = m_options.find("--file");
    if (file != m_options.end()) {
        auto text = ReadInput(*m_services.persistenceService, file->second);
        if (!text) return 1;
        try {
            json j = json::parse(*text);
            const json& list = j.is_object() && j.contains("overrides") ? j["overrides"] : j;
            for (const auto& item : list) {
                overrides.emplace_back(item.value("category", ""), item.value("subcategory", ""),
                                       item.value("description", ""));
            }
        } catch (const json::exception& e) {
            std::cerr << "[LedgerwiseApp] Bad overrides file: " << e.what() << std::endl;
            return 1;
        }
    } else if (args.size() >= 3) {
        std::string description = args[2];
        for (size_t i = 3; i < args.size(); ++i) description += " " + args[i];
        overrides.emplace_back(args[0], args[1], description);
    } else {
        std::cerr << "[LedgerwiseApp] override needs <category> <subcategory> <description> or --file" << std::endl;
        return 1;
    }

    json out = json::array();
    for (const auto& [category, subcategory, description] : overrides) {
        if (category.empty() || description.empty()) {
            std::cerr << "[LedgerwiseApp] Skipping override without category or description" << std::endl;
            continue;
        }
        auto result = m_services.pipeline->registerOverride(category, subcategory, description);
        json item = {
            {"description", description},
            {"category", category},
            {"subcategory", subcategory},
            {"stored", result.sampleStored},
            {"override_count", result.overrideCount}
        };
        if (result.retraining) item["retraining"] = RetrainingToJson(*result.retraining);
        out.push_back(item);
    }
    return Emit(json{{"overrides", out}}.dump(2));
}

int LedgerwiseApp::Train() {
    auto result = m_services.classifier->train(m_services.config.retraining.minSamplesPerCategory);
    json out = {
        {"success", result.success},
        {"message", result.message},
        {"samples_used", result.samplesUsed},
        {"persisted", result.persisted},
        {"categories", result.categories},
        {"category_counts", result.categoryCounts}
    };
    Emit(out.dump(2));
    return result.success ? 0 : 2;
}

int LedgerwiseApp::Retrain() {
    auto result = m_services.retrainingService->run();
    Emit(RetrainingToJson(result).dump(2));
    return result.success ? 0 : 2;
}

int LedgerwiseApp::LearnRules() {
    auto& rules = *m_services.ruleMatcher;
    auto result = rules.learnFromSamples(m_services.trainingSamples->loadAll());
    if (result.success && result.rulesCreated > 0 &&
        !infrastructure::ConfigLoader::SaveRules(m_dataDir, rules.rules())) {
        std::cerr << "[LedgerwiseApp] Failed to save learned rules" << std::endl;
        return 1;
    }
    json out = {
        {"success", result.success},
        {"message", result.message},
        {"rules_created", result.rulesCreated},
        {"categories_trained", result.categoriesTrained}
    };
    Emit(out.dump(2));
    return result.success ? 0 : 2;
}

int LedgerwiseApp::Reconcile(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cerr << "[LedgerwiseApp] reconcile needs <obligations.json> <transactions.json>" << std::endl;
        return 1;
    }
    auto& io = *m_services.persistenceService;
    auto obligationText = ReadInput(io, args[0]);
    auto transactionText = ReadInput(io, args[1]);
    if (!obligationText || !transactionText) return 1;

    auto obligations = infrastructure::RecordCodec::ParseObligations(*obligationText);
    auto transactions = infrastructure::RecordCodec::ParseTransactions(*transactionText);
    const auto& matcher = *m_services.reconciliationMatcher;

    domain::CalendarDate today = domain::CalendarDate::Today();
    auto todayOption = m_options.find("--today");
    if (todayOption != m_options.end()) {
        auto parsed = domain::CalendarDate::Parse(todayOption->second);
        if (!parsed) {
            std::cerr << "[LedgerwiseApp] Invalid --today date: " << todayOption->second << std::endl;
            return 1;
        }
        today = *parsed;
    }

    json out;
    auto loansOption = m_options.find("--loans");
    if (loansOption != m_options.end()) {
        auto loanText = ReadInput(io, loansOption->second);
        if (!loanText) return 1;
        application::LoanLedger ledger(infrastructure::RecordCodec::ParseLoans(*loanText));

        auto loanMatches = matcher.reconcileLoans(obligations, transactions, ledger);
        json matches = json::array();
        for (const auto& m : loanMatches) matches.push_back(infrastructure::RecordCodec::ToJson(m));
        json loans = json::array();
        for (const auto& loan : ledger.loans()) loans.push_back(infrastructure::RecordCodec::ToJson(loan));
        out["loan_matches"] = matches;
        out["loans"] = loans;
    } else {
        auto accepted = matcher.reconcile(obligations, transactions);
        json matches = json::array();
        for (const auto& m : accepted) matches.push_back(infrastructure::RecordCodec::ToJson(m));
        out["matches"] = matches;
    }

    size_t overdue = matcher.markOverdue(obligations, today);
    if (overdue > 0) {
        std::cout << "[LedgerwiseApp] " << overdue << " obligations overdue as of " << today.toString() << std::endl;
    }

    json obligationsJson = json::array();
    for (const auto& o : obligations) obligationsJson.push_back(infrastructure::RecordCodec::ToJson(o));
    json transactionsJson = json::array();
    for (const auto& t : transactions) transactionsJson.push_back(infrastructure::RecordCodec::ToJson(t));
    json unmatchedJson = json::array();
    for (const auto& o : matcher.unmatched(obligations)) unmatchedJson.push_back(o.reference());

    out["obligations"] = obligationsJson;
    out["transactions"] = transactionsJson;
    out["unmatched"] = unmatchedJson;
    return Emit(out.dump(2));
}

int LedgerwiseApp::Stats() {
    const auto& s = m_services;
    auto training = s.trainingSamples->stats();
    auto model = s.classifier->modelInfo();
    auto pipeline = s.pipeline->stats();
    auto retraining = s.retrainingService->stats();

    json out;
    out["training_data"] = {
        {"total_samples", training.totalSamples},
        {"manual_samples", training.manualSamples},
        {"category_counts", training.categoryCounts}
    };
    out["model"] = {
        {"is_trained", model.isTrained},
        {"total_samples", model.totalSamples},
        {"categories", model.categories},
        {"vocabulary_size", model.vocabularySize},
        {"model_file_exists", model.modelFileExists}
    };
    out["pipeline"] = {
        {"confidence_threshold", pipeline.confidenceThreshold},
        {"semantic_threshold", pipeline.semanticThreshold},
        {"semantic_review_threshold", pipeline.semanticReviewThreshold},
        {"retrain_trigger", pipeline.retrainTrigger},
        {"override_count", pipeline.overrideCount},
        {"strategies", pipeline.strategies},
        {"rule_count", s.ruleMatcher->rules().size()},
        {"semantic_available", s.semanticMatcher && s.semanticMatcher->isAvailable()}
    };
    json taxonomy = json::object();
    for (const auto& category : s.taxonomy.categories()) {
        taxonomy[category] = s.taxonomy.subcategories(category);
    }
    out["taxonomy"] = taxonomy;
    out["retraining"] = {
        {"trigger_threshold", retraining.triggerThreshold},
        {"model_type", retraining.modelType},
        {"should_retrain", retraining.shouldRetrain}
    };
    if (retraining.lastRun) {
        out["retraining"]["last_run"] = {
            {"timestamp", retraining.lastRun->timestamp},
            {"accuracy", retraining.lastRun->accuracy},
            {"samples_used", retraining.lastRun->samplesUsed},
            {"success", retraining.lastRun->success}
        };
    }
    return Emit(out.dump(2));
}

int LedgerwiseApp::Emit(const std::string& document) {
    if (m_outPath.empty()) {
        std::cout << document << std::endl;
        return 0;
    }
    if (!m_services.persistenceService->saveText(m_outPath, document + "\n")) {
        std::cerr << "[LedgerwiseApp] Failed to write " << m_outPath << std::endl;
        return 1;
    }
    std::cout << "[LedgerwiseApp] Wrote " << m_outPath << std::endl;
    return 0;
}

void LedgerwiseApp::PrintUsage() const {
    std::cout <<
        "Usage: ledgerwise <command> [options]\n"
        "\n"
        "Commands:\n"
        "  classify <transactions.json> [--no-ai] [--no-semantic]\n"
        "  override <category> <subcategory> <description...> | override --file <overrides.json>\n"
        "  train                 Fit the statistical classifier from training_data.ndjson\n"
        "  retrain               Run an audited retraining pass\n"
        "  learn-rules           Derive keyword rules from manual samples into rules.json\n"
        "  reconcile <obligations.json> <transactions.json> [--loans <loans.json>] [--today YYYY-MM-DD]\n"
        "  stats\n"
        "\n"
        "Options:\n"
        "  --data-dir <dir>      Data directory (default: $XDG_DATA_HOME/Ledgerwise)\n"
        "  --out <file>          Write the JSON result to a file instead of stdout\n";
}

} // namespace ledgerwise::app
