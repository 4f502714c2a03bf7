#include "infrastructure/RetrainingAuditLog.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace ledgerwise::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

RetrainingAuditLog::RetrainingAuditLog(std::string dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_path((fs::path(dataDir) / "retraining_audit.ndjson").string()),
      m_persistence(std::move(persistence)) {}

bool RetrainingAuditLog::append(const AuditEntry& entry) {
    std::string fileContent = m_persistence->readText(m_path).value_or("");
    if (!fileContent.empty() && fileContent.back() != '\n') {
        fileContent += "\n";
    }

    json j = {
        {"timestamp", entry.timestamp},
        {"model_type", entry.modelType},
        {"samples_used", entry.samplesUsed},
        {"accuracy", entry.accuracy},
        {"success", entry.success},
        {"message", entry.message}
    };
    fileContent += j.dump() + "\n";

    if (!m_persistence->saveText(m_path, fileContent)) {
        std::cerr << "[RetrainingAuditLog] Failed to update " << m_path << std::endl;
        return false;
    }
    std::cout << "[RetrainingAuditLog] Audit log updated: " << m_path << std::endl;
    return true;
}

std::vector<AuditEntry> RetrainingAuditLog::readAll() const {
    std::vector<AuditEntry> entries;
    auto content = m_persistence->readText(m_path);
    if (!content) return entries;

    std::istringstream in(*content);
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            AuditEntry entry;
            entry.timestamp = j.value("timestamp", "");
            entry.modelType = j.value("model_type", "");
            entry.samplesUsed = j.value("samples_used", static_cast<size_t>(0));
            entry.accuracy = j.value("accuracy", 0.0);
            entry.success = j.value("success", false);
            entry.message = j.value("message", "");
            entries.push_back(std::move(entry));
        } catch (const json::exception& e) {
            std::cerr << "[RetrainingAuditLog] Skipping malformed entry: " << e.what() << std::endl;
        }
    }
    return entries;
}

std::optional<AuditEntry> RetrainingAuditLog::last() const {
    auto entries = readAll();
    if (entries.empty()) return std::nullopt;
    return entries.back();
}

} // namespace ledgerwise::infrastructure
