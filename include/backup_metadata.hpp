/**
 * @file backup_metadata.hpp
 * @brief Sidecar descriptors written beside every backup artifact.
 *
 * A sidecar shares the artifact's name with a ".meta.json" suffix and records what was
 * backed up together with the SHA-256 checksum of the artifact bytes. Each artifact type
 * has its own closed record shape.
 */

#ifndef BACKUP_METADATA_HPP
#define BACKUP_METADATA_HPP

#include <string>
#include <vector>
#include <map>
#include <variant>
#include <chrono>
#include <cstdint>
#include <expected>
#include <json/json.h>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief Database snapshot details.
 */
struct DatabaseDetails {
    std::vector<std::string> tables;               ///< User tables in the snapshot.
    std::map<std::string, int64_t> recordCounts;   ///< Row count per table.
};

/**
 * @brief File tree archive details.
 */
struct FilesDetails {
    std::vector<std::string> directories;   ///< Configured include directories.
    std::vector<std::string> exclusions;    ///< Configured exclusion globs.
    uint64_t fileCount = 0;                 ///< Files written to the archive.
    uint64_t totalSize = 0;                 ///< Uncompressed bytes written.
    std::vector<std::string> skippedFiles;  ///< Files that could not be read.
};

/**
 * @brief Sidecar record.
 */
struct BackupMetadata {
    std::chrono::system_clock::time_point timestamp;     ///< Backup start time.
    BackupType type = BackupType::Database;              ///< Artifact type.
    std::string version = "1.0";                         ///< Sidecar schema version.
    std::string backupPath;                              ///< Artifact path.
    std::string checksum;                                ///< Hex SHA-256 of the artifact.
    std::variant<DatabaseDetails, FilesDetails> details; ///< Type-specific record.
};

/**
 * @brief Returns "<artifactPath>.meta.json".
 */
std::string getSidecarPath(const std::string& artifactPath);

/**
 * @brief Formats a time point as an ISO-8601 UTC string with milliseconds.
 */
std::string formatTimestamp(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Serializes a sidecar record.
 */
Json::Value toJson(const BackupMetadata& metadata);

/**
 * @brief Deserializes a sidecar record.
 *
 * @return std::expected<BackupMetadata, std::string> The record or the reason it is malformed.
 */
std::expected<BackupMetadata, std::string> metadataFromJson(const Json::Value& json);

/**
 * @brief Writes the sidecar for metadata.backupPath.
 *
 * The document is written to a temporary file first and renamed into place, so a
 * reader never sees a half-written sidecar.
 *
 * @return std::expected<void, BackupError> Success or IOFailure.
 */
std::expected<void, BackupError> writeSidecar(const BackupMetadata& metadata);

/**
 * @brief Reads the sidecar of an artifact.
 *
 * @param artifactPath Artifact path (not the sidecar path).
 * @return std::expected<BackupMetadata, BackupError> The record, NotFound if there is no
 *         sidecar, or ChecksumMismatch if the sidecar is malformed and cannot vouch for
 *         the artifact.
 */
std::expected<BackupMetadata, BackupError> readSidecar(const std::string& artifactPath);

#endif // BACKUP_METADATA_HPP
