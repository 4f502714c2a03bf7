/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace ledgerwise::infrastructure {

namespace fs = std::filesystem;

bool PersistenceService::saveText(const std::string& filename, const std::string& content) {
    return performAtomicWrite(filename, content);
}

std::optional<std::string> PersistenceService::readText(const std::string& filename) const {
    std::error_code ec;
    if (!fs::exists(filename, ec)) {
        return std::nullopt;
    }
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[PersistenceService] Failed to open: " << filename << std::endl;
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

bool PersistenceService::exists(const std::string& filename) const {
    std::error_code ec;
    return fs::exists(filename, ec);
}

bool PersistenceService::performAtomicWrite(const std::string& filename, const std::string& content) {
    fs::path finalPath = filename;

    // filename.<timestamp>.tmp, unique per operation
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    try {
        if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path())) {
            fs::create_directories(finalPath.parent_path());
        }
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[PersistenceService] Error creating directories: " << e.what() << std::endl;
        return false;
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            std::cerr << "[PersistenceService] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[PersistenceService] Write failed during output: " << tempPath << std::endl;
            std::error_code ec;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic rename
    std::error_code ec;
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace ledgerwise::infrastructure
