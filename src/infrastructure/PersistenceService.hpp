/**
 * @file PersistenceService.hpp
 * @brief Centralized service for whole-document, atomic file I/O.
 */

#pragma once
#include <optional>
#include <string>

namespace ledgerwise::infrastructure {

/**
 * @class PersistenceService
 * @brief Reads documents and rewrites them atomically (temp file, then rename).
 *
 * Every artifact the engine owns (model, training log, audit log) goes through
 * here, so a reader never sees a half-written file. Writers in different
 * processes are not coordinated; the last rename wins.
 */
class PersistenceService {
public:
    PersistenceService() = default;

    /**
     * @brief Replaces the file content atomically, creating parent directories.
     * @param filename Path to the target file.
     * @param content The full document.
     * @return True if the new content is in place.
     */
    bool saveText(const std::string& filename, const std::string& content);

    /**
     * @brief Reads a whole file.
     * @return File content, or nullopt if it does not exist or cannot be read.
     */
    std::optional<std::string> readText(const std::string& filename) const;

    /** @brief Whether the file exists. */
    bool exists(const std::string& filename) const;

private:
    bool performAtomicWrite(const std::string& filename, const std::string& content);
};

} // namespace ledgerwise::infrastructure
