#include "scheduler.hpp"
#include "cron_schedule.hpp"
#include "logger.hpp"
#include "time_utils.hpp"
#include <algorithm>
#include <format>

Scheduler::Scheduler(std::vector<Source> sources, JobPipeline& pipeline, SchedulerOptions options)
    : sources_(std::move(sources)), pipeline(pipeline), options(std::move(options)) {}

Scheduler::~Scheduler() {
    stop();
}

std::expected<void, std::string> Scheduler::start() {
    std::vector<CronSchedule> schedules;
    for (const auto& source : sources_) {
        auto schedule = CronSchedule::parse(source.schedule);
        if (!schedule) {
            return std::unexpected(std::format("Invalid schedule for {}: {}", source.name, schedule.error()));
        }
        schedules.push_back(*schedule);
    }

    std::lock_guard<std::mutex> lock(timerMutex);
    if (started) {
        return {};
    }
    started = true;
    stopping = false;
    for (const auto& source : sources_) {
        timers.emplace_back(&Scheduler::timerLoop, this, std::cref(source));
        Logger::logMessage(std::format("Scheduled {} with '{}'", source.name, source.schedule));
    }
    return {};
}

void Scheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(timerMutex);
        if (!started) {
            return;
        }
        stopping = true;
    }
    timerCv.notify_all();
    for (auto& timer : timers) {
        if (timer.joinable()) {
            timer.join();
        }
    }
    timers.clear();

    std::list<Worker> draining;
    {
        std::lock_guard<std::mutex> lock(workerMutex);
        draining.swap(workers);
    }
    if (!draining.empty()) {
        Logger::logMessage(std::format("Waiting for {} running job(s) to finish", draining.size()));
    }
    for (auto& worker : draining) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    std::lock_guard<std::mutex> lock(timerMutex);
    started = false;
}

void Scheduler::timerLoop(const Source& source) {
    // Parsed again here so the thread owns its schedule; start() validated it
    auto schedule = CronSchedule::parse(source.schedule);
    if (!schedule) {
        return;
    }

    std::unique_lock<std::mutex> lock(timerMutex);
    while (!stopping) {
        auto next = schedule->next(Clock::now());
        if (!next) {
            Logger::logWarning(std::format("Schedule of {} never fires again", source.name));
            return;
        }
        if (timerCv.wait_until(lock, *next, [this] { return stopping; })) {
            return;
        }
        if (Clock::now() < *next) {
            continue;
        }
        lock.unlock();
        dispatch(source);
        lock.lock();
    }
}

void Scheduler::dispatch(const Source& source) {
    reapWorkers();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workerMutex);
    workers.push_back(Worker{std::thread([this, &source, done] {
        trigger(source);
        done->store(true);
    }), done});
}

void Scheduler::reapWorkers() {
    std::list<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workerMutex);
        for (auto it = workers.begin(); it != workers.end();) {
            if (it->done->load()) {
                auto next = std::next(it);
                finished.splice(finished.end(), workers, it);
                it = next;
            } else {
                ++it;
            }
        }
    }
    for (auto& worker : finished) {
        worker.thread.join();
    }
}

void Scheduler::evictExpiredLocked(std::chrono::system_clock::time_point now) const {
    for (auto it = running.begin(); it != running.end();) {
        const auto& state = it->second;
        if (state.status != JobStatus::Running && state.completedAt &&
            now - *state.completedAt >= options.gracePeriod) {
            it = running.erase(it);
        } else {
            ++it;
        }
    }
}

bool Scheduler::trigger(const Source& source) {
    const auto startedAt = Clock::now();
    const std::string jobId = std::format("{}_{}", source.name,
        std::chrono::duration_cast<std::chrono::seconds>(startedAt.time_since_epoch()).count());

    {
        std::lock_guard<std::mutex> lock(stateMutex);
        evictExpiredLocked(startedAt);
        auto it = running.find(source.name);
        if (it != running.end() && it->second.status == JobStatus::Running) {
            Logger::logMessage(std::format("Skipping backup for {}: job {} is still running", source.name, it->second.jobId));
            return false;
        }
        RunningJobState state;
        state.jobId = jobId;
        state.sourceName = source.name;
        state.startedAt = startedAt;
        running[source.name] = state;
    }

    Logger::logMessage(std::format("Starting backup job {}", jobId));

    JobRecord record;
    record.jobId = jobId;
    record.sourceName = source.name;
    record.startedAt = startedAt;

    std::expected<PipelineResult, BackupError> result = std::unexpected(BackupError(ErrorKind::Archive, "Job did not run"));
    try {
        result = pipeline.run(source);
    } catch (const std::exception& e) {
        result = std::unexpected(BackupError(ErrorKind::Archive, std::format("Unexpected failure: {}", e.what())));
    }

    record.completedAt = Clock::now();
    if (result) {
        record.status = JobStatus::Success;
        record.metadata = result->metadata;
        record.objectKey = result->objectKey;
        record.retentionDeleted = result->retentionDeleted;
        Logger::logMessage(std::format("Backup job {} completed", jobId));
    } else {
        record.status = JobStatus::Failed;
        record.error = sanitizeErrorMessage(describeError(result.error()), options.diagnosticErrors);
        Logger::logError(std::format("Backup job {} failed: {}", jobId, describeError(result.error())));
    }

    {
        std::lock_guard<std::mutex> lock(stateMutex);
        auto it = running.find(source.name);
        if (it != running.end() && it->second.jobId == jobId) {
            it->second.status = record.status;
            it->second.completedAt = record.completedAt;
            it->second.metadata = record.metadata;
            it->second.error = record.error;
        }
        history.push_back(record);
        while (history.size() > options.historyCap) {
            history.pop_front();
        }
    }

    if (options.onJobComplete) {
        options.onJobComplete(record);
    }
    return true;
}

std::vector<JobRecord> Scheduler::jobHistory(std::size_t limit, const std::optional<std::string>& sourceName) const {
    limit = std::min(limit, options.historyCap);
    std::vector<JobRecord> selected;
    std::lock_guard<std::mutex> lock(stateMutex);
    for (auto it = history.rbegin(); it != history.rend() && selected.size() < limit; ++it) {
        if (!sourceName || it->sourceName == *sourceName) {
            selected.push_back(*it);
        }
    }
    std::reverse(selected.begin(), selected.end());
    return selected;
}

std::map<std::string, RunningJobState> Scheduler::runningJobs() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    evictExpiredLocked(Clock::now());
    return running;
}

const Source* Scheduler::findSource(const std::string& name) const {
    auto it = std::find_if(sources_.begin(), sources_.end(), [&](const Source& s) { return s.name == name; });
    return it == sources_.end() ? nullptr : &*it;
}
