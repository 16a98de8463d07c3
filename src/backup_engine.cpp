#include "backup_engine.hpp"

BackupEngine::BackupEngine(const BackupConfig& config, bool echo)
    : settings(config),
      logger(settings.logFile(), settings.errorLogFile(), parseLogLevel(settings.logging.level), echo),
      notifier(settings.notifications, logger),
      databaseBackup(settings, logger, locks),
      filesBackup(settings, logger, locks),
      restore(settings, logger, locks),
      scheduler(logger, &notifier) {
    if (!settings.files.retention) {
        logger.logWarning("files.retention is not set; files backups use the database retention policy (" +
                          std::to_string(settings.database.retention.daily) + " days)");
    }
}

BackupEngine::~BackupEngine() {
    shutdown();
}

std::expected<void, BackupError> BackupEngine::startScheduler() {
    StandardJobs jobs;
    jobs.databaseBackup = [this]() -> std::expected<std::string, BackupError> {
        auto result = databaseBackup.createBackup(&cancel);
        if (!result) {
            return std::unexpected(result.error());
        }
        return "Database backup " + result->backupPath + " (" + formatBackupSize(result->size) + ")";
    };
    jobs.filesBackup = [this]() -> std::expected<std::string, BackupError> {
        auto result = filesBackup.createBackup(&cancel);
        if (!result) {
            return std::unexpected(result.error());
        }
        return "Files backup " + result->backupPath + " (" + std::to_string(result->fileCount) + " files, " +
               formatBackupSize(result->size) + ")";
    };
    auto cleanupJob = [this](BackupType type) -> std::expected<std::string, BackupError> {
        auto result = cleanupBackups(settings, type, logger, locks);
        if (!result) {
            return std::unexpected(result.error());
        }
        if (!result->errors.empty()) {
            return std::unexpected(makeError(BackupErrorCode::IOFailure,
                std::to_string(result->errors.size()) + " old " + toString(type) + " backup(s) could not be removed: " +
                result->errors.front(), false, true));
        }
        return "Deleted " + std::to_string(result->deletedCount) + " old " + toString(type) + " backup(s)";
    };
    jobs.databaseCleanup = [cleanupJob] { return cleanupJob(BackupType::Database); };
    jobs.filesCleanup = [cleanupJob] { return cleanupJob(BackupType::Files); };
    return scheduler.initialize(settings, jobs);
}

std::expected<DatabaseBackupResult, BackupError> BackupEngine::createDatabaseBackup() {
    return databaseBackup.createBackup(&cancel);
}

std::expected<FilesBackupResult, BackupError> BackupEngine::createFilesBackup() {
    return filesBackup.createBackup(&cancel);
}

std::vector<BackupEntry> BackupEngine::listBackups(std::optional<BackupType> type) const {
    return ::listBackups(settings, type);
}

std::expected<DatabaseRestoreResult, BackupError> BackupEngine::restoreDatabase(const std::string& backupPath) {
    return restore.restoreDatabase(backupPath);
}

std::expected<FilesRestoreResult, BackupError> BackupEngine::restoreFiles(const std::string& backupPath,
                                                                          const std::optional<std::string>& targetDir) {
    return restore.restoreFiles(backupPath, targetDir);
}

VerificationResult BackupEngine::verifyBackup(const std::string& backupPath, BackupType type) const {
    auto result = ::verifyBackup(backupPath, type);
    if (result.valid) {
        logger.logMessage("Backup verified: " + backupPath + " (" + std::to_string(result.fileCount) + " file(s)" +
                          (result.checksumMatch ? ", checksum ok)" : ", no metadata)"));
    } else if (result.error) {
        logger.logError("Backup verification failed: " + result.error->describe());
    }
    return result;
}

CleanupResult BackupEngine::cleanup(std::optional<BackupType> type) {
    CleanupResult total;
    for (BackupType each : {BackupType::Database, BackupType::Files}) {
        if (type && *type != each) {
            continue;
        }
        auto result = cleanupBackups(settings, each, logger, locks);
        if (!result) {
            total.errors.push_back(result.error().describe());
            continue;
        }
        total.deletedCount += result->deletedCount;
        total.errors.insert(total.errors.end(), result->errors.begin(), result->errors.end());
    }
    return total;
}

std::vector<JobStatus> BackupEngine::getSchedulerStatus() const {
    return scheduler.getAllStatuses();
}

HealthReport BackupEngine::health() const {
    HealthReport report;
    for (const auto& status : scheduler.getAllStatuses()) {
        if (status.status == JobState::Error) {
            report.failingJobs.push_back(status.name);
        }
    }
    if (!report.failingJobs.empty()) {
        report.healthy = false;
        report.status = "degraded";
    }
    return report;
}

JobRunResult BackupEngine::triggerJob(const std::string& name) {
    return scheduler.triggerJob(name);
}

bool BackupEngine::startJob(const std::string& name) {
    return scheduler.startJob(name);
}

bool BackupEngine::stopJob(const std::string& name) {
    return scheduler.stopJob(name);
}

bool BackupEngine::restartJob(const std::string& name) {
    return scheduler.restartJob(name);
}

void BackupEngine::shutdown() {
    cancel = true;
    scheduler.shutdown();
}
