/**
 * @file TrainingSampleStore.hpp
 * @brief File-backed, append-only log of labeled training samples.
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "domain/TrainingSample.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace ledgerwise::infrastructure {

/**
 * @struct TrainingStats
 * @brief Aggregate view of the training corpus.
 */
struct TrainingStats {
    size_t totalSamples = 0;
    size_t manualSamples = 0;
    std::map<std::string, size_t> categoryCounts;
};

/**
 * @class TrainingSampleStore
 * @brief Stores samples as NDJSON (one sample per line) in training_data.ndjson.
 *
 * Appends read the whole document and rewrite it through PersistenceService.
 */
class TrainingSampleStore {
public:
    TrainingSampleStore(std::string dataDir, std::shared_ptr<PersistenceService> persistence);

    /** @brief Appends one sample. A blank timestamp is filled with the current local time. */
    bool append(domain::TrainingSample sample);

    /** @brief Reads every well-formed sample in insertion order. */
    std::vector<domain::TrainingSample> loadAll() const;

    TrainingStats stats() const;

    /** @brief Empties the log. */
    bool clear();

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
    std::shared_ptr<PersistenceService> m_persistence;
};

/** @brief Local time formatted as "YYYY-MM-DD HH:MM:SS". */
std::string CurrentTimestamp();

} // namespace ledgerwise::infrastructure
