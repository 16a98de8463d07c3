#include "test_helpers.hpp"
#include "scheduler.hpp"
#include "database_backup.hpp"
#include "operation_lock.hpp"
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

class SchedulerTest : public TempDirTest {
protected:
    static JobBody succeeding(const std::string& summary) {
        return [summary]() -> std::expected<std::string, BackupError> { return summary; };
    }

    static bool waitForState(const BackupScheduler& scheduler, const std::string& name, JobState state) {
        for (int i = 0; i < 500; ++i) {
            auto status = scheduler.getStatus(name);
            if (status && status->status == state) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return false;
    }
};

TEST_F(SchedulerTest, OverlappingTriggerIsSkipped) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    int bodyRuns = 0;
    ASSERT_TRUE(scheduler.registerJob("slow", "0 2 * * *", [&]() -> std::expected<std::string, BackupError> {
        ++bodyRuns;
        released.wait();
        return std::string("done");
    }).has_value());

    auto first = std::async(std::launch::async, [&] { return scheduler.triggerJob("slow"); });
    ASSERT_TRUE(waitForState(scheduler, "slow", JobState::Running));

    auto second = scheduler.triggerJob("slow");
    EXPECT_EQ(second.outcome, JobOutcome::Skipped);
    ASSERT_TRUE(second.error.has_value());
    EXPECT_EQ(second.error->code, BackupErrorCode::AlreadyRunning);

    release.set_value();
    auto firstResult = first.get();
    EXPECT_EQ(firstResult.outcome, JobOutcome::Completed);
    EXPECT_EQ(firstResult.summary, "done");

    auto status = scheduler.getStatus("slow");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(bodyRuns, 1);
    EXPECT_EQ(status->runCount, 1u);
    EXPECT_EQ(status->skippedCount, 1u);
    EXPECT_EQ(status->status, JobState::Idle);
}

TEST_F(SchedulerTest, FailureIsRecordedNotThrown) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    ASSERT_TRUE(scheduler.registerJob("broken", "0 2 * * *", []() -> std::expected<std::string, BackupError> {
        return std::unexpected(makeError(BackupErrorCode::SourceUnavailable, "Database file not found: dev.db"));
    }).has_value());

    JobRunResult result;
    EXPECT_NO_THROW(result = scheduler.triggerJob("broken"));
    EXPECT_EQ(result.outcome, JobOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, BackupErrorCode::SourceUnavailable);

    auto status = scheduler.getStatus("broken");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, JobState::Error);
    EXPECT_NE(status->lastError.find("Database file not found"), std::string::npos);
    EXPECT_TRUE(status->lastRun.has_value());
    EXPECT_EQ(status->runCount, 1u);
}

TEST_F(SchedulerTest, ThrowingBodyIsAFailedRun) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    ASSERT_TRUE(scheduler.registerJob("throws", "0 2 * * *", []() -> std::expected<std::string, BackupError> {
        throw std::runtime_error("boom");
    }).has_value());

    auto result = scheduler.triggerJob("throws");
    EXPECT_EQ(result.outcome, JobOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->message.find("boom"), std::string::npos);

    // The guard is released, so the next run goes through.
    EXPECT_EQ(scheduler.triggerJob("throws").outcome, JobOutcome::Failed);
    EXPECT_EQ(scheduler.getStatus("throws")->runCount, 2u);
}

TEST_F(SchedulerTest, NonStandardExceptionIsAFailedRun) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    ASSERT_TRUE(scheduler.registerJob("throws", "0 2 * * *", []() -> std::expected<std::string, BackupError> {
        throw 42;
    }).has_value());

    JobRunResult result;
    EXPECT_NO_THROW(result = scheduler.triggerJob("throws"));
    EXPECT_EQ(result.outcome, JobOutcome::Failed);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, BackupErrorCode::IOFailure);
    EXPECT_EQ(scheduler.getStatus("throws")->status, JobState::Error);
}

TEST_F(SchedulerTest, SuccessClearsPreviousError) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    bool fail = true;
    ASSERT_TRUE(scheduler.registerJob("flaky", "0 2 * * *", [&]() -> std::expected<std::string, BackupError> {
        if (fail) {
            return std::unexpected(makeError(BackupErrorCode::IOFailure, "disk full"));
        }
        return std::string("ok");
    }).has_value());

    scheduler.triggerJob("flaky");
    EXPECT_EQ(scheduler.getStatus("flaky")->status, JobState::Error);
    fail = false;
    scheduler.triggerJob("flaky");
    EXPECT_EQ(scheduler.getStatus("flaky")->status, JobState::Idle);
    EXPECT_TRUE(scheduler.getStatus("flaky")->lastError.empty());
}

TEST_F(SchedulerTest, UnknownJobIsReported) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    auto result = scheduler.triggerJob("nope");
    EXPECT_EQ(result.outcome, JobOutcome::UnknownJob);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code, BackupErrorCode::NotFound);
    EXPECT_FALSE(scheduler.startJob("nope"));
    EXPECT_FALSE(scheduler.stopJob("nope"));
    EXPECT_FALSE(scheduler.getStatus("nope").has_value());
}

TEST_F(SchedulerTest, RegistrationRejectsBadCadenceAndDuplicates) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    auto bad = scheduler.registerJob("bad", "0 25 * * *", succeeding("x"));
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, BackupErrorCode::ConfigInvalid);

    ASSERT_TRUE(scheduler.registerJob("job", "0 2 * * *", succeeding("x")).has_value());
    auto duplicate = scheduler.registerJob("job", "0 3 * * *", succeeding("y"));
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, BackupErrorCode::ConfigInvalid);
}

TEST_F(SchedulerTest, StartAndStopControlNextRun) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    ASSERT_TRUE(scheduler.registerJob("nightly", "0 2 * * *", succeeding("x")).has_value());

    auto registered = scheduler.getStatus("nightly");
    ASSERT_TRUE(registered.has_value());
    EXPECT_FALSE(registered->active);
    EXPECT_FALSE(registered->nextRun.has_value());

    auto before = std::chrono::system_clock::now();
    ASSERT_TRUE(scheduler.startJob("nightly"));
    auto started = scheduler.getStatus("nightly");
    EXPECT_TRUE(started->active);
    ASSERT_TRUE(started->nextRun.has_value());
    EXPECT_GT(*started->nextRun, before);
    EXPECT_LE(*started->nextRun, before + std::chrono::hours(25));

    ASSERT_TRUE(scheduler.stopJob("nightly"));
    auto stopped = scheduler.getStatus("nightly");
    EXPECT_FALSE(stopped->active);
    EXPECT_FALSE(stopped->nextRun.has_value());

    ASSERT_TRUE(scheduler.restartJob("nightly"));
    EXPECT_TRUE(scheduler.getStatus("nightly")->active);

    // Stopped jobs can still be triggered by hand.
    scheduler.stopJob("nightly");
    EXPECT_EQ(scheduler.triggerJob("nightly").outcome, JobOutcome::Completed);
}

TEST_F(SchedulerTest, InitializeRegistersEnabledJobsAndCleanups) {
    auto log = quietLog();
    StandardJobs standard{succeeding("db"), succeeding("files"), succeeding("db-clean"), succeeding("files-clean")};

    BackupScheduler all(log);
    ASSERT_TRUE(all.initialize(config, standard).has_value());
    auto statuses = all.getAllStatuses();
    ASSERT_EQ(statuses.size(), 4u);
    EXPECT_EQ(statuses[0].name, "database-backup");
    EXPECT_EQ(statuses[1].name, "database-cleanup");
    EXPECT_EQ(statuses[2].name, "files-backup");
    EXPECT_EQ(statuses[3].name, "files-cleanup");
    for (const auto& status : statuses) {
        EXPECT_TRUE(status.active) << status.name;
    }
    EXPECT_EQ(all.getStatus("database-cleanup")->schedule, "0 1 * * *");
    EXPECT_EQ(all.getStatus("files-cleanup")->schedule, "30 1 * * *");

    config.files.enabled = false;
    BackupScheduler partial(log);
    ASSERT_TRUE(partial.initialize(config, standard).has_value());
    EXPECT_EQ(partial.getAllStatuses().size(), 3u);
    EXPECT_FALSE(partial.getStatus("files-backup").has_value());
    EXPECT_TRUE(partial.getStatus("files-cleanup").has_value());
}

TEST_F(SchedulerTest, ShutdownWaitsForRunningJobAndDropsJobs) {
    auto log = quietLog();
    BackupScheduler scheduler(log);
    std::atomic<bool> finished{false};
    ASSERT_TRUE(scheduler.registerJob("slow", "0 2 * * *", [&]() -> std::expected<std::string, BackupError> {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        finished = true;
        return std::string("done");
    }).has_value());

    auto running = std::async(std::launch::async, [&] { return scheduler.triggerJob("slow"); });
    ASSERT_TRUE(waitForState(scheduler, "slow", JobState::Running));
    scheduler.shutdown();
    EXPECT_TRUE(finished);
    EXPECT_EQ(running.get().outcome, JobOutcome::Completed);

    EXPECT_TRUE(scheduler.getAllStatuses().empty());
    EXPECT_EQ(scheduler.triggerJob("slow").outcome, JobOutcome::UnknownJob);
    scheduler.shutdown();
}

namespace {

class RecordingStrategy : public NotificationStrategy {
public:
    explicit RecordingStrategy(std::vector<NotificationEvent>& sink) : sink(sink) {}

    std::expected<void, std::string> notify(const NotificationEvent& event) override {
        sink.push_back(event);
        return {};
    }

private:
    std::vector<NotificationEvent>& sink;
};

} // namespace

TEST_F(SchedulerTest, OutcomesReachTheNotifier) {
    auto log = quietLog();
    std::vector<NotificationEvent> delivered;
    NotificationSettings settings;
    settings.onSuccess = true;
    Notifier notifier(settings, log);
    notifier.addStrategy(std::make_unique<RecordingStrategy>(delivered));

    BackupScheduler scheduler(log, &notifier);
    ASSERT_TRUE(scheduler.registerJob("good", "0 2 * * *", succeeding("3 tables")).has_value());
    ASSERT_TRUE(scheduler.registerJob("bad", "0 2 * * *", []() -> std::expected<std::string, BackupError> {
        return std::unexpected(makeError(BackupErrorCode::IOFailure, "disk full"));
    }).has_value());

    scheduler.triggerJob("good");
    scheduler.triggerJob("bad");
    ASSERT_EQ(delivered.size(), 2u);
    EXPECT_EQ(delivered[0].type, NotificationEventType::Success);
    EXPECT_EQ(delivered[0].jobName, "good");
    EXPECT_EQ(delivered[0].summary, "3 tables");
    EXPECT_EQ(delivered[1].type, NotificationEventType::Failure);
    EXPECT_NE(delivered[1].summary.find("disk full"), std::string::npos);
}

namespace {

class CrashingStrategy : public NotificationStrategy {
public:
    std::expected<void, std::string> notify(const NotificationEvent&) override {
        throw std::runtime_error("smtp client crashed");
    }
};

class GatedSnapshotStrategy : public DatabaseBackupStrategy {
public:
    std::expected<DatabaseDetails, BackupError> snapshot(const std::string& outputPath,
                                                         const std::atomic<bool>*) override {
        entered = true;
        released.wait();
        std::ofstream(outputPath) << "snapshot";
        DatabaseDetails details;
        details.tables = {"users"};
        details.recordCounts["users"] = 1;
        return details;
    }

    std::atomic<bool> entered{false};
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
};

} // namespace

TEST_F(SchedulerTest, ThrowingNotifierDoesNotAffectTheRun) {
    auto log = quietLog();
    NotificationSettings settings;
    settings.onSuccess = true;
    Notifier notifier(settings, log);
    notifier.addStrategy(std::make_unique<CrashingStrategy>());

    BackupScheduler scheduler(log, &notifier);
    ASSERT_TRUE(scheduler.registerJob("good", "0 2 * * *", succeeding("ok")).has_value());

    JobRunResult result;
    EXPECT_NO_THROW(result = scheduler.triggerJob("good"));
    EXPECT_EQ(result.outcome, JobOutcome::Completed);
    EXPECT_EQ(scheduler.getStatus("good")->status, JobState::Idle);
    EXPECT_EQ(scheduler.getStatus("good")->runCount, 1u);
}

TEST_F(SchedulerTest, BackupAlreadyUnderWayIsSkippedNotAnError) {
    auto log = quietLog();
    OperationLocks locks;
    auto gated = std::make_unique<GatedSnapshotStrategy>();
    GatedSnapshotStrategy* strategy = gated.get();
    DatabaseBackupService service(config, log, locks, std::move(gated));

    BackupScheduler scheduler(log);
    ASSERT_TRUE(scheduler.registerJob("database-backup", "0 2 * * *", [&]() -> std::expected<std::string, BackupError> {
        auto result = service.createBackup();
        if (!result) {
            return std::unexpected(result.error());
        }
        return result->backupPath;
    }).has_value());

    auto manual = std::async(std::launch::async, [&] { return service.createBackup(); });
    for (int i = 0; i < 500 && !strategy->entered; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_TRUE(strategy->entered);

    auto run = scheduler.triggerJob("database-backup");
    EXPECT_EQ(run.outcome, JobOutcome::Skipped);
    ASSERT_TRUE(run.error.has_value());
    EXPECT_EQ(run.error->code, BackupErrorCode::AlreadyRunning);

    auto status = scheduler.getStatus("database-backup");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->status, JobState::Idle);
    EXPECT_EQ(status->skippedCount, 1u);
    EXPECT_EQ(status->runCount, 0u);
    EXPECT_FALSE(status->lastRun.has_value());
    EXPECT_TRUE(status->lastError.empty());

    strategy->release.set_value();
    auto manualResult = manual.get();
    EXPECT_TRUE(manualResult.has_value()) << manualResult.error().describe();
}

TEST_F(SchedulerTest, ScheduledFiringRunsTheBodyAndAdvancesNextRun) {
    auto log = quietLog();
    // Wall clock shifted to just before a minute boundary.
    auto boundary = std::chrono::floor<std::chrono::minutes>(std::chrono::system_clock::now()) + std::chrono::minutes(10);
    auto offset = (boundary - std::chrono::milliseconds(200)) - std::chrono::system_clock::now();
    BackupScheduler scheduler(log, nullptr, [offset] { return std::chrono::system_clock::now() + offset; });

    std::atomic<int> bodyRuns{0};
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    ASSERT_TRUE(scheduler.registerJob("every-minute", "* * * * *", [&]() -> std::expected<std::string, BackupError> {
        ++bodyRuns;
        released.wait();
        return std::string("tick");
    }).has_value());
    ASSERT_TRUE(scheduler.startJob("every-minute"));
    auto started = scheduler.getStatus("every-minute");
    ASSERT_TRUE(started->nextRun.has_value());
    EXPECT_EQ(*started->nextRun, boundary);

    ASSERT_TRUE(waitForState(scheduler, "every-minute", JobState::Running));
    auto running = scheduler.getStatus("every-minute");
    ASSERT_TRUE(running->lastRun.has_value());
    EXPECT_GE(*running->lastRun, boundary);
    ASSERT_TRUE(running->nextRun.has_value());
    EXPECT_EQ(*running->nextRun, boundary + std::chrono::minutes(1));

    auto overlapping = scheduler.triggerJob("every-minute");
    EXPECT_EQ(overlapping.outcome, JobOutcome::Skipped);

    release.set_value();
    ASSERT_TRUE(waitForState(scheduler, "every-minute", JobState::Idle));
    auto finished = scheduler.getStatus("every-minute");
    EXPECT_EQ(bodyRuns, 1);
    EXPECT_EQ(finished->runCount, 1u);
    EXPECT_EQ(finished->skippedCount, 1u);
    scheduler.shutdown();
}
