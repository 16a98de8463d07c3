/**
 * @file backup_engine.hpp
 * @brief Facade wiring the VaultKeeper components together.
 *
 * The engine owns the configuration, the log, the operation locks, the producers, the
 * restore engine and the scheduler, and exposes the synchronous operations a request
 * layer or the command line invokes. It performs no authorization.
 */

#ifndef BACKUP_ENGINE_HPP
#define BACKUP_ENGINE_HPP

#include <string>
#include <vector>
#include <atomic>
#include <optional>
#include <expected>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_log.hpp"
#include "backup_verifier.hpp"
#include "database_backup.hpp"
#include "file_backup.hpp"
#include "notification.hpp"
#include "operation_lock.hpp"
#include "restore.hpp"
#include "retention.hpp"
#include "scheduler.hpp"

/**
 * @brief Overall state of the scheduled jobs.
 */
struct HealthReport {
    bool healthy = true;                 ///< No job is in the error state.
    std::string status = "healthy";      ///< "healthy" or "degraded".
    std::vector<std::string> failingJobs; ///< Jobs whose last run failed.
};

/**
 * @brief Backup engine facade.
 */
class BackupEngine {
public:
    /**
     * @brief Builds every component from a validated configuration.
     *
     * @param config Configuration; the engine keeps its own copy.
     * @param echo Echo log entries to the console.
     */
    explicit BackupEngine(const BackupConfig& config, bool echo = true);

    /**
     * @brief Cancels running work and stops the scheduler.
     */
    ~BackupEngine();

    BackupEngine(const BackupEngine&) = delete;
    BackupEngine& operator=(const BackupEngine&) = delete;

    /**
     * @brief Registers and starts the built-in scheduled jobs.
     */
    std::expected<void, BackupError> startScheduler();

    std::expected<DatabaseBackupResult, BackupError> createDatabaseBackup();
    std::expected<FilesBackupResult, BackupError> createFilesBackup();
    std::vector<BackupEntry> listBackups(std::optional<BackupType> type = std::nullopt) const;
    std::expected<DatabaseRestoreResult, BackupError> restoreDatabase(const std::string& backupPath);
    std::expected<FilesRestoreResult, BackupError> restoreFiles(const std::string& backupPath,
                                                                const std::optional<std::string>& targetDir = std::nullopt);
    VerificationResult verifyBackup(const std::string& backupPath, BackupType type) const;

    /**
     * @brief Applies retention to one type, or to both when unset.
     */
    CleanupResult cleanup(std::optional<BackupType> type = std::nullopt);

    std::vector<JobStatus> getSchedulerStatus() const;
    HealthReport health() const;
    JobRunResult triggerJob(const std::string& name);
    bool startJob(const std::string& name);
    bool stopJob(const std::string& name);
    bool restartJob(const std::string& name);

    /**
     * @brief Sets the cancellation flag and stops the scheduler, waiting for running jobs.
     */
    void shutdown();

    const BackupConfig& config() const { return settings; }
    const BackupLog& log() const { return logger; }

private:
    BackupConfig settings;
    BackupLog logger;
    std::atomic<bool> cancel{false};
    OperationLocks locks;
    Notifier notifier;
    DatabaseBackupService databaseBackup;
    FilesBackupService filesBackup;
    RestoreService restore;
    BackupScheduler scheduler;
};

#endif // BACKUP_ENGINE_HPP
