#include "test_helpers.hpp"
#include "backup_engine.hpp"

class BackupEngineTest : public TempDirTest {
protected:
    void SetUp() override {
        TempDirTest::SetUp();
        config.files.directories = {"uploads"};
        createDatabase(config.database.path, {{"users", 3}, {"products", 5}});
        writeFile(app("uploads/a.png"), "png");
    }
};

TEST_F(BackupEngineTest, SchedulerRegistersStandardJobs) {
    BackupEngine engine(config, false);
    ASSERT_TRUE(engine.startScheduler().has_value());

    auto statuses = engine.getSchedulerStatus();
    ASSERT_EQ(statuses.size(), 4u);
    for (const auto& status : statuses) {
        EXPECT_TRUE(status.active);
        EXPECT_EQ(status.status, JobState::Idle);
        EXPECT_TRUE(status.nextRun.has_value());
    }
    EXPECT_TRUE(engine.health().healthy);
}

TEST_F(BackupEngineTest, TriggeredBackupsProduceListedArtifacts) {
    BackupEngine engine(config, false);
    ASSERT_TRUE(engine.startScheduler().has_value());

    auto database = engine.triggerJob(BackupScheduler::DatabaseBackupJob);
    EXPECT_EQ(database.outcome, JobOutcome::Completed) << (database.error ? database.error->describe() : "");
    auto files = engine.triggerJob(BackupScheduler::FilesBackupJob);
    EXPECT_EQ(files.outcome, JobOutcome::Completed) << (files.error ? files.error->describe() : "");

    auto all = engine.listBackups();
    ASSERT_EQ(all.size(), 2u);
    for (const auto& entry : all) {
        EXPECT_TRUE(entry.metadata.has_value());
        EXPECT_TRUE(engine.verifyBackup(entry.path, entry.type).valid);
    }
    EXPECT_EQ(engine.listBackups(BackupType::Files).size(), 1u);

    auto status = engine.getSchedulerStatus();
    for (const auto& job : status) {
        if (job.name == BackupScheduler::DatabaseBackupJob || job.name == BackupScheduler::FilesBackupJob) {
            EXPECT_EQ(job.runCount, 1u);
        }
    }
}

TEST_F(BackupEngineTest, FailingJobDegradesHealth) {
    config.database.path = (root / "app" / "missing.db").string();
    BackupEngine engine(config, false);
    ASSERT_TRUE(engine.startScheduler().has_value());

    auto result = engine.triggerJob(BackupScheduler::DatabaseBackupJob);
    EXPECT_EQ(result.outcome, JobOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, BackupErrorCode::SourceUnavailable);

    auto report = engine.health();
    EXPECT_FALSE(report.healthy);
    EXPECT_EQ(report.status, "degraded");
    EXPECT_EQ(report.failingJobs, std::vector<std::string>{BackupScheduler::DatabaseBackupJob});
    EXPECT_TRUE(artifactsIn(config.storage.localPath).empty());
}

TEST_F(BackupEngineTest, CleanupCoversBothTypes) {
    config.database.retention.daily = 7;
    writeFile(root / "backups" / "database_backup_old.db.zip", "x");
    writeFile(root / "backups" / "files_backup_old.zip", "x");
    writeFile(root / "backups" / "files_backup_new.zip", "x");
    setAgeDays(root / "backups" / "database_backup_old.db.zip", 20);
    setAgeDays(root / "backups" / "files_backup_old.zip", 20);

    BackupEngine engine(config, false);
    auto result = engine.cleanup();
    EXPECT_EQ(result.deletedCount, 2);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(fs::exists(root / "backups" / "files_backup_new.zip"));
}

TEST_F(BackupEngineTest, CleanupJobReportsDeletedCount) {
    writeFile(root / "backups" / "database_backup_old.db.zip", "x");
    setAgeDays(root / "backups" / "database_backup_old.db.zip", 30);

    BackupEngine engine(config, false);
    ASSERT_TRUE(engine.startScheduler().has_value());
    auto result = engine.triggerJob(BackupScheduler::DatabaseCleanupJob);
    EXPECT_EQ(result.outcome, JobOutcome::Completed);
    EXPECT_NE(result.summary.find("Deleted 1"), std::string::npos);
}

TEST_F(BackupEngineTest, RestoreThroughEngine) {
    BackupEngine engine(config, false);
    auto backup = engine.createDatabaseBackup();
    ASSERT_TRUE(backup.has_value()) << backup.error().describe();

    execute(config.database.path, "DELETE FROM products;");
    auto restored = engine.restoreDatabase(backup->backupPath);
    ASSERT_TRUE(restored.has_value()) << restored.error().describe();
    EXPECT_EQ(countRows(config.database.path, "products"), 5);
}

TEST_F(BackupEngineTest, ShutdownCancelsLaterWork) {
    BackupEngine engine(config, false);
    ASSERT_TRUE(engine.startScheduler().has_value());
    engine.shutdown();

    EXPECT_TRUE(engine.getSchedulerStatus().empty());
    auto backup = engine.createDatabaseBackup();
    ASSERT_FALSE(backup.has_value());
    EXPECT_EQ(backup.error().code, BackupErrorCode::Cancelled);
    engine.shutdown();
}

TEST_F(BackupEngineTest, JobControlPassesThrough) {
    BackupEngine engine(config, false);
    ASSERT_TRUE(engine.startScheduler().has_value());
    EXPECT_TRUE(engine.stopJob(BackupScheduler::FilesBackupJob));
    EXPECT_TRUE(engine.startJob(BackupScheduler::FilesBackupJob));
    EXPECT_TRUE(engine.restartJob(BackupScheduler::FilesBackupJob));
    EXPECT_FALSE(engine.stopJob("unknown"));
    EXPECT_EQ(engine.triggerJob("unknown").outcome, JobOutcome::UnknownJob);
}
