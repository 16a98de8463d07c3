/**
 * @file backup_config.hpp
 * @brief Configuration management for the VaultKeeper backup engine.
 *
 * Defines the typed configuration consumed by every component: what to back up, on
 * which cadence, where artifacts are stored and how long they are kept. The
 * configuration is loaded once at startup from a JSON file, overridden from the
 * environment, and validated eagerly so that a bad cadence or an unwritable storage
 * directory stops the process instead of failing at the first firing.
 *
 * @note Relative paths are resolved against the process working directory.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>
#include <json/json.h>

/**
 * @brief Kind of artifact produced by the engine.
 */
enum class BackupType {
    Database,
    Files
};

/**
 * @brief Returns "database" or "files".
 */
std::string toString(BackupType type);

/**
 * @brief Parses "database" or "files".
 *
 * @return std::optional<BackupType> The type, or std::nullopt for any other name.
 */
std::optional<BackupType> parseBackupType(const std::string& name);

/**
 * @brief Retention tiers, in artifacts-per-tier units (days, weeks, months).
 */
struct RetentionPolicy {
    int daily = 7;    ///< Keep artifacts younger than this many days.
    int weekly = 4;   ///< Weekly tier, in weeks.
    int monthly = 12; ///< Monthly tier, in months (30 days).
};

/**
 * @brief Database snapshot settings.
 */
struct DatabaseSettings {
    bool enabled = true;                 ///< Schedule the database-backup job.
    std::string schedule = "0 2 * * *";  ///< Cron cadence (daily at 02:00).
    RetentionPolicy retention;           ///< Retention tiers.
    bool compression = true;             ///< Store the snapshot as a .db.zip.
    std::string path = "./dev.db";       ///< Live SQLite database file.
};

/**
 * @brief File tree archive settings.
 */
struct FilesSettings {
    bool enabled = true;                                  ///< Schedule the files-backup job.
    std::string schedule = "0 3 * * 0";                   ///< Cron cadence (Sundays at 03:00).
    std::vector<std::string> directories{"uploads", "logs", "config"}; ///< Included directories.
    std::vector<std::string> exclusions{"*.log", "*.tmp", "node_modules", ".git", "coverage", "dist"}; ///< Glob exclusions.
    bool compression = true;                              ///< Deflate entries; store them when false.
    std::optional<RetentionPolicy> retention;             ///< Files-specific tiers; database tiers when unset.
    std::string root;                                     ///< Base for relative directories and entry names; cwd when empty.
};

/**
 * @brief Local artifact storage.
 */
struct StorageSettings {
    std::string localPath = "./backups"; ///< Directory holding artifacts and sidecars.
};

/**
 * @brief Toggles for the notification collaborator.
 */
struct NotificationSettings {
    bool enabled = true;                 ///< Master switch.
    bool onSuccess = false;              ///< Notify after successful jobs.
    bool onFailure = true;               ///< Notify after failed jobs.
    std::optional<std::string> email;    ///< Operator mailbox (log-only delivery).
    std::optional<std::string> webhook;  ///< HTTP endpoint receiving JSON events.
};

/**
 * @brief Log destinations.
 */
struct LoggingSettings {
    std::string logFile;       ///< Activity log; "<storage>/backup.log" when empty.
    std::string errorLogFile;  ///< Error log; "<storage>/errors.log" when empty.
    std::string level = "info";
};

/**
 * @brief Configuration for the backup engine.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration holding the built-in defaults.
     */
    BackupConfig() = default;

    /**
     * @brief Loads a configuration from a JSON file and the environment, then validates it.
     *
     * Missing keys keep their defaults. Environment variables (BACKUP_ENABLED,
     * BACKUP_DATABASE_SCHEDULE, BACKUP_FILES_SCHEDULE, BACKUP_RETENTION_DAILY,
     * BACKUP_LOCAL_PATH, BACKUP_NOTIFICATION_EMAIL, DATABASE_URL) take precedence.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws ConfigError If the file cannot be read or parsed, or validation fails.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed JSON document.
     *
     * @param json Document with optional "database", "files", "storage", "notifications" and "logging" objects.
     * @return BackupConfig Configuration with defaults applied (not yet validated).
     * @throws ConfigError If a key holds a value of the wrong type.
     */
    static BackupConfig fromJson(const Json::Value& json);

    /**
     * @brief Applies the BACKUP_* and DATABASE_URL environment overrides.
     */
    void applyEnvironment();

    /**
     * @brief Validates cadences and retention, and ensures the storage directory is writable.
     *
     * Creates the storage directory if missing and probes it with a temporary file.
     *
     * @throws ConfigError On the first invalid setting.
     */
    void validate() const;

    /**
     * @brief Returns the retention tiers that govern the given artifact type.
     */
    RetentionPolicy retentionFor(BackupType type) const;

    /**
     * @brief Returns the directory file entries are made relative to.
     */
    std::string filesRoot() const;

    std::string logFile() const;
    std::string errorLogFile() const;

    DatabaseSettings database;          ///< Database snapshot settings.
    FilesSettings files;                ///< File tree settings.
    StorageSettings storage;            ///< Artifact location.
    NotificationSettings notifications; ///< Notification toggles.
    LoggingSettings logging;            ///< Log destinations.
};

/**
 * @brief Base name of an artifact, e.g. "database_backup_2025-09-14_02-00-00".
 *
 * @param type Artifact type.
 * @param timestamp Creation time, rendered in local time.
 */
std::string getBackupFileName(BackupType type, std::chrono::system_clock::time_point timestamp);

/**
 * @brief Artifact extension for a type (".db.zip", ".db" or ".zip").
 */
std::string getBackupExtension(BackupType type, bool compression);

/**
 * @brief Full artifact path inside the storage directory that does not exist yet.
 *
 * Appends "_2", "_3", ... to the base name when an artifact of the same second exists.
 */
std::string getBackupFilePath(const BackupConfig& config, const std::string& fileName, const std::string& extension);

/**
 * @brief Human readable size, e.g. "1.5 MB".
 */
std::string formatBackupSize(std::uintmax_t bytes);

#endif // BACKUP_CONFIG_HPP
