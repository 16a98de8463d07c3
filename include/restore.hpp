/**
 * @file restore.hpp
 * @brief Restores database and file tree artifacts.
 *
 * Every restore validates the artifact before touching live data. A database restore
 * replaces the live store in a single SQLite transaction, so a failure leaves it as it
 * was. A files restore writes each file beside its destination and renames it into
 * place, so a reader never sees a half-written file.
 */

#ifndef RESTORE_HPP
#define RESTORE_HPP

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_log.hpp"
#include "operation_lock.hpp"

/**
 * @brief Outcome of a database restore.
 */
struct DatabaseRestoreResult {
    bool success = false;                 ///< Live store replaced.
    bool requiresProcessRestart = true;   ///< Open connections still see the old pages.
};

/**
 * @brief Outcome of a files restore.
 */
struct FilesRestoreResult {
    bool success = false;                    ///< Archive fully processed.
    uint64_t extractedFileCount = 0;         ///< Files written.
    std::vector<std::string> skippedEntries; ///< Unsafe or corrupt entries left out.
};

/**
 * @brief Restore engine.
 */
class RestoreService {
public:
    /**
     * @brief Constructs the engine.
     *
     * @param locks Per-type operation locks shared with the producers.
     */
    RestoreService(const BackupConfig& config, const BackupLog& log, OperationLocks& locks);

    /**
     * @brief Replaces the live database with the snapshot in an artifact.
     *
     * The artifact must exist, be non-empty and, when it has a sidecar, match its
     * checksum. The extracted snapshot must pass PRAGMA quick_check. The engine never
     * restarts the host process.
     *
     * @param backupPath Database artifact (.db.zip or .db).
     * @return std::expected<DatabaseRestoreResult, BackupError> Result, or NotFound, Empty,
     *         ChecksumMismatch, CorruptArchive, RestoreConflict or IOFailure.
     */
    std::expected<DatabaseRestoreResult, BackupError> restoreDatabase(const std::string& backupPath);

    /**
     * @brief Extracts a files artifact.
     *
     * Entries with absolute paths or ".." components are rejected and skipped. A
     * corrupt entry is logged and skipped.
     *
     * @param backupPath Files artifact (.zip).
     * @param targetDir Destination; config.filesRoot() when unset.
     * @return std::expected<FilesRestoreResult, BackupError> Result, or NotFound, Empty,
     *         ChecksumMismatch, CorruptArchive, RestoreConflict or IOFailure.
     */
    std::expected<FilesRestoreResult, BackupError> restoreFiles(const std::string& backupPath,
                                                                const std::optional<std::string>& targetDir = std::nullopt);

private:
    const BackupConfig& config;
    const BackupLog& log;
    OperationLocks& locks;

    /**
     * @brief Checks existence, size and the sidecar checksum of an artifact.
     */
    std::expected<void, BackupError> checkArtifact(const std::string& backupPath) const;
};

/**
 * @brief Returns true if an archive entry name is safe to extract below a target directory.
 *
 * Rejects empty names, absolute paths and names with a ".." component.
 */
bool isSafeEntryPath(const std::string& entryName);

#endif // RESTORE_HPP
