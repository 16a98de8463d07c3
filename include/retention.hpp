/**
 * @file retention.hpp
 * @brief Listing and age-based cleanup of stored artifacts.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <expected>
#include "backup_config.hpp"
#include "backup_log.hpp"
#include "backup_metadata.hpp"
#include "operation_lock.hpp"

/**
 * @brief Retention tier used to compute a cutoff.
 */
enum class RetentionTier {
    Daily,
    Weekly,
    Monthly
};

/**
 * @brief Oldest modification time an artifact may have and still be kept.
 *
 * Daily counts days, weekly counts weeks of 7 days, monthly counts months of 30 days.
 */
std::chrono::system_clock::time_point retentionCutoff(const RetentionPolicy& policy, RetentionTier tier,
                                                      std::chrono::system_clock::time_point now);

/**
 * @brief An artifact found in the storage directory.
 */
struct BackupEntry {
    std::string path;                                  ///< Artifact path.
    BackupType type = BackupType::Database;            ///< Type from the file name.
    std::uintmax_t size = 0;                           ///< Size in bytes.
    std::chrono::system_clock::time_point modified;    ///< Filesystem modification time.
    std::optional<BackupMetadata> metadata;            ///< Sidecar, if present and readable.
};

/**
 * @brief Lists stored artifacts, newest first.
 *
 * Sidecars, temporary files and unrelated files are ignored.
 *
 * @param type Restrict to one type; all types when unset.
 */
std::vector<BackupEntry> listBackups(const BackupConfig& config, std::optional<BackupType> type = std::nullopt);

/**
 * @brief Outcome of a cleanup pass.
 */
struct CleanupResult {
    int deletedCount = 0;             ///< Artifacts removed.
    std::vector<std::string> errors;  ///< One message per artifact that could not be removed.
};

/**
 * @brief Deletes artifacts of a type older than the daily retention cutoff, with their sidecars.
 *
 * The pass holds the type's operation lock so it never removes an artifact a restore is
 * reading. A failure to delete one artifact is recorded and the pass continues.
 *
 * @param locks Per-type locks shared with the producers and the restore engine.
 * @param now Reference time for the cutoff.
 * @return std::expected<CleanupResult, BackupError> The pass outcome, or the lock error when
 *         another operation on the type is in progress.
 */
std::expected<CleanupResult, BackupError> cleanupBackups(const BackupConfig& config, BackupType type, const BackupLog& log,
                                                         OperationLocks& locks,
                                                         std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

#endif // RETENTION_HPP
