/**
 * @file scheduler.hpp
 * @brief Fires per-source backup jobs on their cron schedules.
 *
 * Every source has its own timer thread; each firing runs the job on a
 * separate thread so slow sources never delay other sources. At most one job
 * per source is in flight: a trigger arriving while the previous job still
 * runs is skipped, never queued. Shared bookkeeping (running markers and job
 * history) is guarded by one mutex held only for short sections; the pipeline
 * itself runs outside the lock.
 */

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "backup_error.hpp"
#include "backup_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <expected>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Successful outcome of one pipeline run.
 */
struct PipelineResult {
    BackupMetadata metadata;
    std::string objectKey;
    std::size_t retentionDeleted = 0;
};

/**
 * @brief The work performed for one triggered job.
 */
class JobPipeline {
public:
    virtual ~JobPipeline() = default;

    /**
     * @brief Runs a complete backup of a source.
     *
     * @param source Source to back up.
     * @return std::expected<PipelineResult, BackupError> Result or the failure.
     */
    virtual std::expected<PipelineResult, BackupError> run(const Source& source) = 0;
};

/**
 * @brief Scheduler tuning.
 */
struct SchedulerOptions {
    std::size_t historyCap = 1000;                       ///< Oldest records are evicted past this size.
    std::chrono::seconds gracePeriod = std::chrono::hours(1); ///< Visibility of completed markers.
    bool diagnosticErrors = false;                       ///< Keep unsanitized error text.
    std::function<void(const JobRecord&)> onJobComplete; ///< Called after every recorded job.
};

class Scheduler {
public:
    /**
     * @brief Constructs a scheduler.
     *
     * @param sources Sources to schedule.
     * @param pipeline Job body; must outlive the scheduler.
     * @param options Tuning.
     */
    Scheduler(std::vector<Source> sources, JobPipeline& pipeline, SchedulerOptions options = {});
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Starts one timer thread per source.
     *
     * @return std::expected<void, std::string> Error when a schedule does not parse.
     */
    std::expected<void, std::string> start();

    /**
     * @brief Stops firing new jobs and waits for in-flight jobs to finish.
     */
    void stop();

    /**
     * @brief Runs one job for a source on the calling thread.
     *
     * @param source Source to back up.
     * @return bool True if the job ran, false if it was skipped because a
     *         job for the same source is still running.
     */
    bool trigger(const Source& source);

    /**
     * @brief Returns the newest records, oldest first.
     *
     * @param limit Maximum number of records (capped at the history size).
     * @param sourceName Optional source filter.
     */
    std::vector<JobRecord> jobHistory(std::size_t limit = 100,
                                      const std::optional<std::string>& sourceName = std::nullopt) const;

    /**
     * @brief Snapshot of the running markers keyed by source name.
     *
     * Completed markers older than the grace period are evicted first.
     */
    std::map<std::string, RunningJobState> runningJobs() const;

    /**
     * @brief Looks up a scheduled source by name.
     */
    const Source* findSource(const std::string& name) const;

    const std::vector<Source>& sources() const { return sources_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void timerLoop(const Source& source);
    void dispatch(const Source& source);
    void reapWorkers();
    void evictExpiredLocked(std::chrono::system_clock::time_point now) const;

    std::vector<Source> sources_;
    JobPipeline& pipeline;
    SchedulerOptions options;

    mutable std::mutex stateMutex;
    mutable std::map<std::string, RunningJobState> running;
    std::deque<JobRecord> history;

    std::mutex timerMutex;
    std::condition_variable timerCv;
    bool stopping = false;
    bool started = false;
    std::vector<std::thread> timers;

    std::mutex workerMutex;
    std::list<Worker> workers;
};

#endif // SCHEDULER_HPP
