#include "scheduler.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

std::string formatLocal(std::chrono::system_clock::time_point timePoint) {
    std::time_t t = std::chrono::system_clock::to_time_t(timePoint);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace

std::string toString(JobState state) {
    switch (state) {
    case JobState::Idle:
        return "idle";
    case JobState::Running:
        return "running";
    case JobState::Error:
        return "error";
    }
    return "idle";
}

BackupScheduler::BackupScheduler(const BackupLog& log, Notifier* notifier, SchedulerClock clock)
    : log(log), notifier(notifier), clock(std::move(clock)) {
    if (!this->clock) {
        this->clock = [] { return std::chrono::system_clock::now(); };
    }
    schedulerThread = std::thread(&BackupScheduler::schedulerLoop, this);
}

BackupScheduler::~BackupScheduler() {
    shutdown();
}

std::expected<void, BackupError> BackupScheduler::initialize(const BackupConfig& config, const StandardJobs& standard) {
    struct Entry {
        const char* name;
        std::string schedule;
        const JobBody& body;
        bool enabled;
    };
    const Entry entries[] = {
        {DatabaseBackupJob, config.database.schedule, standard.databaseBackup, config.database.enabled},
        {FilesBackupJob, config.files.schedule, standard.filesBackup, config.files.enabled},
        {DatabaseCleanupJob, DatabaseCleanupSchedule, standard.databaseCleanup, true},
        {FilesCleanupJob, FilesCleanupSchedule, standard.filesCleanup, true},
    };

    size_t registeredJobs = 0;
    for (const auto& entry : entries) {
        if (!entry.enabled) {
            log.logMessage(std::string("Job ") + entry.name + " is disabled in the configuration");
            continue;
        }
        auto registered = registerJob(entry.name, entry.schedule, entry.body);
        if (!registered) {
            return registered;
        }
        startJob(entry.name);
        ++registeredJobs;
    }
    log.logMessage("Scheduler initialized with " + std::to_string(registeredJobs) + " job(s)");
    return {};
}

std::expected<void, BackupError> BackupScheduler::registerJob(const std::string& name, const std::string& schedule, JobBody body) {
    auto cron = CronSchedule::parse(schedule);
    if (!cron) {
        return std::unexpected(makeError(BackupErrorCode::ConfigInvalid,
            "Invalid schedule for job " + name + ": " + cron.error()));
    }
    std::lock_guard<std::mutex> lock(mutex);
    if (jobs.count(name)) {
        return std::unexpected(makeError(BackupErrorCode::ConfigInvalid, "Job already registered: " + name));
    }
    jobs.emplace(name, std::make_unique<Job>(name, std::move(*cron), std::move(body)));
    log.logDebug("Registered job " + name + " (" + schedule + ")");
    return {};
}

bool BackupScheduler::startJob(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = jobs.find(name);
    if (it == jobs.end()) {
        return false;
    }
    Job& job = *it->second;
    if (job.active) {
        return true;
    }
    job.active = true;
    job.nextRun = job.schedule.nextAfter(clock());
    if (job.nextRun) {
        log.logMessage("Job " + name + " started, next run at " + formatLocal(*job.nextRun));
    } else {
        log.logWarning("Job " + name + " started but its schedule " + job.schedule.expression() + " never fires");
    }
    ++generation;
    condition.notify_all();
    return true;
}

bool BackupScheduler::stopJob(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = jobs.find(name);
    if (it == jobs.end()) {
        return false;
    }
    it->second->active = false;
    it->second->nextRun.reset();
    ++generation;
    condition.notify_all();
    log.logMessage("Job " + name + " stopped");
    return true;
}

bool BackupScheduler::restartJob(const std::string& name) {
    return stopJob(name) && startJob(name);
}

JobRunResult BackupScheduler::triggerJob(const std::string& name) {
    Job* job = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = jobs.find(name);
        if (it != jobs.end() && !stopping) {
            job = it->second.get();
        }
    }
    if (!job) {
        JobRunResult result;
        result.outcome = JobOutcome::UnknownJob;
        result.error = makeError(BackupErrorCode::NotFound, "Unknown job: " + name);
        return result;
    }
    return runJob(*job, "manual");
}

JobRunResult BackupScheduler::runJob(Job& job, const std::string& trigger) {
    JobRunResult result;
    std::unique_lock<std::mutex> guard(job.runGuard, std::try_to_lock);
    if (!guard.owns_lock()) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            ++job.skippedCount;
        }
        log.logWarning("Job " + job.name + " is already running, skipping " + trigger + " run");
        result.outcome = JobOutcome::Skipped;
        result.error = makeError(BackupErrorCode::AlreadyRunning, "Job " + job.name + " is already running");
        return result;
    }

    auto startedAt = clock();
    auto startTime = std::chrono::steady_clock::now();
    JobState previousState;
    std::optional<std::chrono::system_clock::time_point> previousRun;
    {
        std::lock_guard<std::mutex> lock(mutex);
        previousState = job.state;
        previousRun = job.lastRun;
        job.state = JobState::Running;
        job.lastRun = startedAt;
    }
    log.logMessage("Running job " + job.name + " (" + trigger + ")");

    try {
        auto outcome = job.body();
        if (outcome) {
            result.outcome = JobOutcome::Completed;
            result.summary = *outcome;
        } else {
            result.outcome = JobOutcome::Failed;
            result.error = outcome.error();
        }
    } catch (const std::exception& e) {
        result.outcome = JobOutcome::Failed;
        result.error = makeError(BackupErrorCode::IOFailure, std::string("Job threw: ") + e.what(), false, true);
    } catch (...) {
        result.outcome = JobOutcome::Failed;
        result.error = makeError(BackupErrorCode::IOFailure, "Job threw an unknown exception", false, true);
    }

    // The same work is already under way elsewhere: drop this run.
    if (result.outcome == JobOutcome::Failed && result.error->code == BackupErrorCode::AlreadyRunning) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            job.state = previousState;
            job.lastRun = previousRun;
            ++job.skippedCount;
        }
        guard.unlock();
        log.logWarning("Job " + job.name + " skipped " + trigger + " run: " + result.error->message);
        result.outcome = JobOutcome::Skipped;
        return result;
    }

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    {
        std::lock_guard<std::mutex> lock(mutex);
        job.duration = duration;
        ++job.runCount;
        if (result.outcome == JobOutcome::Completed) {
            job.state = JobState::Idle;
            job.lastError.clear();
        } else {
            job.state = JobState::Error;
            job.lastError = result.error->describe();
        }
    }
    guard.unlock();

    NotificationEvent event;
    event.jobName = job.name;
    if (result.outcome == JobOutcome::Completed) {
        log.logMessage("Job " + job.name + " completed in " + std::to_string(duration.count()) + "ms: " + result.summary);
        event.type = NotificationEventType::Success;
        event.summary = result.summary;
    } else {
        log.logError("Job " + job.name + " failed after " + std::to_string(duration.count()) + "ms: " + result.error->describe());
        event.type = NotificationEventType::Failure;
        event.summary = result.error->describe();
    }
    if (notifier) {
        notifier->dispatch(event);
    }
    return result;
}

void BackupScheduler::reapFinished() {
    for (auto it = inFlight.begin(); it != inFlight.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->get();
            it = inFlight.erase(it);
        } else {
            ++it;
        }
    }
}

void BackupScheduler::schedulerLoop() {
    std::unique_lock<std::mutex> lock(mutex);
    while (!stopping) {
        reapFinished();

        std::optional<std::chrono::system_clock::time_point> earliest;
        for (const auto& [name, job] : jobs) {
            if (job->active && job->nextRun && (!earliest || *job->nextRun < *earliest)) {
                earliest = job->nextRun;
            }
        }

        uint64_t seen = generation;
        auto changed = [this, seen] { return stopping || generation != seen; };
        if (!earliest) {
            condition.wait(lock, changed);
            continue;
        }
        if (condition.wait_for(lock, *earliest - clock(), changed)) {
            continue;
        }

        auto now = clock();
        for (auto& [name, job] : jobs) {
            if (!job->active || !job->nextRun || *job->nextRun > now) {
                continue;
            }
            job->nextRun = job->schedule.nextAfter(now);
            Job* target = job.get();
            inFlight.push_back(std::async(std::launch::async, [this, target] {
                runJob(*target, "scheduled");
            }));
        }
    }
}

JobStatus BackupScheduler::statusOf(const Job& job) const {
    JobStatus status;
    status.name = job.name;
    status.schedule = job.schedule.expression();
    status.active = job.active;
    status.status = job.state;
    status.lastRun = job.lastRun;
    status.nextRun = job.active ? job.nextRun : std::nullopt;
    status.duration = job.duration;
    status.lastError = job.lastError;
    status.runCount = job.runCount;
    status.skippedCount = job.skippedCount;
    return status;
}

std::optional<JobStatus> BackupScheduler::getStatus(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = jobs.find(name);
    if (it == jobs.end()) {
        return std::nullopt;
    }
    return statusOf(*it->second);
}

std::vector<JobStatus> BackupScheduler::getAllStatuses() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<JobStatus> statuses;
    for (const auto& [name, job] : jobs) {
        statuses.push_back(statusOf(*job));
    }
    return statuses;
}

void BackupScheduler::shutdown() {
    std::vector<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (stopping && !schedulerThread.joinable() && inFlight.empty() && jobs.empty()) {
            return;
        }
        stopping = true;
        for (auto& [name, job] : jobs) {
            job->active = false;
            job->nextRun.reset();
        }
        condition.notify_all();
    }
    if (schedulerThread.joinable()) {
        schedulerThread.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex);
        pending = std::move(inFlight);
        inFlight.clear();
    }
    if (!pending.empty()) {
        log.logMessage("Waiting for " + std::to_string(pending.size()) + " running job(s) to finish");
    }
    for (auto& future : pending) {
        future.get();
    }

    // A manual trigger may still hold a job; taking each guard waits for it.
    std::vector<Job*> held;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (auto& [name, job] : jobs) {
            held.push_back(job.get());
        }
    }
    for (Job* job : held) {
        std::lock_guard<std::mutex> running(job->runGuard);
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (!jobs.empty()) {
        log.logMessage("Scheduler stopped");
    }
    for (auto& [name, job] : jobs) {
        retired.push_back(std::move(job));
    }
    jobs.clear();
}
