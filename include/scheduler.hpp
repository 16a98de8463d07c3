/**
 * @file scheduler.hpp
 * @brief Cron-driven job scheduler for VaultKeeper.
 *
 * One scheduler instance is constructed by the host and injected where needed. A single
 * scheduler thread sleeps until the earliest due firing; each firing runs on its own
 * worker so a slow archive never delays another job. A job never overlaps itself: a
 * firing that finds the previous run still in progress is skipped and counted, and so is
 * a run whose body reports AlreadyRunning because the same work is already under way
 * elsewhere (a manual backup overlapping the scheduled one).
 */

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <future>
#include <optional>
#include <functional>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <expected>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_log.hpp"
#include "cron_schedule.hpp"
#include "notification.hpp"

/**
 * @brief Lifecycle state of a job.
 */
enum class JobState {
    Idle,
    Running,
    Error
};

/**
 * @brief Returns "idle", "running" or "error".
 */
std::string toString(JobState state);

/**
 * @brief Work performed by a job. Returns a one-line summary on success.
 */
using JobBody = std::function<std::expected<std::string, BackupError>()>;

/**
 * @brief Source of wall-clock time for cadence evaluation.
 */
using SchedulerClock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Snapshot of a job's state.
 */
struct JobStatus {
    std::string name;                                          ///< Job name.
    std::string schedule;                                      ///< Cron expression.
    bool active = false;                                       ///< Scheduled firings enabled.
    JobState status = JobState::Idle;                          ///< Current state.
    std::optional<std::chrono::system_clock::time_point> lastRun; ///< Start of the last run.
    std::optional<std::chrono::system_clock::time_point> nextRun; ///< Next firing while active.
    std::chrono::milliseconds duration{0};                     ///< Duration of the last run.
    std::string lastError;                                     ///< Error of the last failed run.
    uint64_t runCount = 0;                                     ///< Completed runs, successful or not.
    uint64_t skippedCount = 0;                                 ///< Invocations dropped because the work was already running.
};

/**
 * @brief How a single invocation ended.
 */
enum class JobOutcome {
    Completed,
    Failed,
    Skipped,
    UnknownJob
};

/**
 * @brief Result of a synchronous job invocation.
 */
struct JobRunResult {
    JobOutcome outcome = JobOutcome::Completed;
    std::string summary;               ///< Body summary on success.
    std::optional<BackupError> error;  ///< Failure, AlreadyRunning when skipped.
};

/**
 * @brief Bodies of the built-in jobs registered by BackupScheduler::initialize.
 */
struct StandardJobs {
    JobBody databaseBackup;
    JobBody filesBackup;
    JobBody databaseCleanup;
    JobBody filesCleanup;
};

class BackupScheduler {
public:
    static constexpr const char* DatabaseBackupJob = "database-backup";
    static constexpr const char* FilesBackupJob = "files-backup";
    static constexpr const char* DatabaseCleanupJob = "database-cleanup";
    static constexpr const char* FilesCleanupJob = "files-cleanup";
    static constexpr const char* DatabaseCleanupSchedule = "0 1 * * *";
    static constexpr const char* FilesCleanupSchedule = "30 1 * * *";

    /**
     * @brief Constructs the scheduler and starts its thread.
     *
     * @param log Log sink.
     * @param notifier Receives job outcomes; may be null.
     * @param clock Wall clock; std::chrono::system_clock::now when empty.
     */
    explicit BackupScheduler(const BackupLog& log, Notifier* notifier = nullptr, SchedulerClock clock = {});

    /**
     * @brief Calls shutdown().
     */
    ~BackupScheduler();

    BackupScheduler(const BackupScheduler&) = delete;
    BackupScheduler& operator=(const BackupScheduler&) = delete;

    /**
     * @brief Registers the built-in jobs and starts them.
     *
     * database-backup and files-backup are registered when enabled in the configuration;
     * database-cleanup (01:00 daily) and files-cleanup (01:30 daily) always are.
     *
     * @return std::expected<void, BackupError> ConfigInvalid if a cadence does not parse.
     */
    std::expected<void, BackupError> initialize(const BackupConfig& config, const StandardJobs& jobs);

    /**
     * @brief Adds an inactive job.
     *
     * @return std::expected<void, BackupError> ConfigInvalid for a bad cadence or a duplicate name.
     */
    std::expected<void, BackupError> registerJob(const std::string& name, const std::string& schedule, JobBody body);

    /**
     * @brief Enables scheduled firings of a job. No-op if already active.
     *
     * @return bool False if the job is unknown.
     */
    bool startJob(const std::string& name);

    /**
     * @brief Disables scheduled firings of a job. A run in progress is not interrupted.
     *
     * @return bool False if the job is unknown.
     */
    bool stopJob(const std::string& name);

    /**
     * @brief Stops and starts a job, recomputing its next firing.
     */
    bool restartJob(const std::string& name);

    /**
     * @brief Runs a job now on the calling thread, subject to the overlap guard.
     *
     * Never throws: a body that throws is a Failed run, and notifier errors are logged.
     */
    JobRunResult triggerJob(const std::string& name);

    std::optional<JobStatus> getStatus(const std::string& name) const;

    /**
     * @brief Returns every job's status, sorted by name.
     */
    std::vector<JobStatus> getAllStatuses() const;

    /**
     * @brief Stops every job, waits for runs in progress and drops the jobs.
     *
     * Idempotent. Runs in progress are expected to observe the host's cancellation flag.
     */
    void shutdown();

private:
    struct Job {
        Job(const std::string& name, CronSchedule schedule, JobBody body)
            : name(name), schedule(std::move(schedule)), body(std::move(body)) {}

        std::string name;
        CronSchedule schedule;
        JobBody body;
        bool active = false;
        JobState state = JobState::Idle;
        std::optional<std::chrono::system_clock::time_point> lastRun;
        std::optional<std::chrono::system_clock::time_point> nextRun;
        std::chrono::milliseconds duration{0};
        std::string lastError;
        uint64_t runCount = 0;
        uint64_t skippedCount = 0;
        std::mutex runGuard; ///< Held for the whole run; try-locked by each invocation.
    };

    void schedulerLoop();
    JobRunResult runJob(Job& job, const std::string& trigger);
    JobStatus statusOf(const Job& job) const;
    void reapFinished();

    const BackupLog& log;
    Notifier* notifier;
    SchedulerClock clock;

    mutable std::mutex mutex;
    std::condition_variable condition;
    std::map<std::string, std::unique_ptr<Job>> jobs;
    std::vector<std::unique_ptr<Job>> retired; ///< Jobs dropped by shutdown, kept alive for late triggers.
    std::vector<std::future<void>> inFlight;
    uint64_t generation = 0; ///< Bumped on every change the loop must re-plan for.
    bool stopping = false;
    std::thread schedulerThread;
};

#endif // SCHEDULER_HPP
