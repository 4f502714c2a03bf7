/**
 * @file RetrainingAuditLog.hpp
 * @brief Append-only audit trail of retraining runs.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "infrastructure/PersistenceService.hpp"

namespace ledgerwise::infrastructure {

struct AuditEntry {
    std::string timestamp;
    std::string modelType;
    size_t samplesUsed = 0;
    double accuracy = 0.0;
    bool success = false;
    std::string message;
};

/**
 * @class RetrainingAuditLog
 * @brief Stores entries as NDJSON in retraining_audit.ndjson.
 */
class RetrainingAuditLog {
public:
    RetrainingAuditLog(std::string dataDir, std::shared_ptr<PersistenceService> persistence);

    bool append(const AuditEntry& entry);
    std::vector<AuditEntry> readAll() const;
    std::optional<AuditEntry> last() const;

private:
    std::string m_path;
    std::shared_ptr<PersistenceService> m_persistence;
};

} // namespace ledgerwise::infrastructure
