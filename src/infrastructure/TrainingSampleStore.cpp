/**
 * @file TrainingSampleStore.cpp
 * @brief Implementation of TrainingSampleStore.
 */

#include "infrastructure/TrainingSampleStore.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace ledgerwise::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

json SampleToJson(const domain::TrainingSample& sample) {
    return json{
        {"description", sample.description},
        {"category", sample.category},
        {"subcategory", sample.subcategory},
        {"manual", sample.isManual},
        {"added_at", sample.timestamp}
    };
}

} // namespace

std::string CurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(now));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

TrainingSampleStore::TrainingSampleStore(std::string dataDir, std::shared_ptr<PersistenceService> persistence)
    : m_path((fs::path(dataDir) / "training_data.ndjson").string()),
      m_persistence(std::move(persistence)) {}

bool TrainingSampleStore::append(domain::TrainingSample sample) {
    if (sample.timestamp.empty()) {
        sample.timestamp = CurrentTimestamp();
    }

    std::string fileContent = m_persistence->readText(m_path).value_or("");
    if (!fileContent.empty() && fileContent.back() != '\n') {
        fileContent += "\n";
    }
    fileContent += SampleToJson(sample).dump() + "\n";

    if (!m_persistence->saveText(m_path, fileContent)) {
        std::cerr << "[TrainingSampleStore] Failed to append sample to " << m_path << std::endl;
        return false;
    }
    return true;
}

std::vector<domain::TrainingSample> TrainingSampleStore::loadAll() const {
    std::vector<domain::TrainingSample> samples;
    auto content = m_persistence->readText(m_path);
    if (!content) return samples;

    std::istringstream in(*content);
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            auto j = json::parse(line);
            domain::TrainingSample sample;
            sample.description = j.value("description", "");
            sample.category = j.value("category", "");
            sample.subcategory = j.value("subcategory", "");
            sample.isManual = j.value("manual", false);
            sample.timestamp = j.value("added_at", "");
            samples.push_back(std::move(sample));
        } catch (const json::exception& e) {
            std::cerr << "[TrainingSampleStore] Skipping malformed line " << lineNo << ": " << e.what() << std::endl;
        }
    }
    return samples;
}

TrainingStats TrainingSampleStore::stats() const {
    TrainingStats stats;
    for (const auto& sample : loadAll()) {
        ++stats.totalSamples;
        if (sample.isManual) ++stats.manualSamples;
        ++stats.categoryCounts[sample.category.empty() ? "Unknown" : sample.category];
    }
    return stats;
}

bool TrainingSampleStore::clear() {
    return m_persistence->saveText(m_path, "");
}

} // namespace ledgerwise::infrastructure
