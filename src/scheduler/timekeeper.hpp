#pragma once

#include <string>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <vector>
#include <functional>
#include <condition_variable>
#include <core/types.hpp>
#include <managers/state_store.hpp>
#include <tasks/task_registry.hpp>
#include "job.hpp"
#include "worker.hpp"

enum class SchedulerEvent { Added, Cancelled, Fired, Completed, ArchiveCleared };

const char* scheduler_event_name(SchedulerEvent event);

// Time-ordered job scheduler. Pending jobs live in the jobs store and are
// claimed under its file lock when due, so a job fires exactly once even
// with several processes sharing the files. Due jobs are handed to the
// Worker in (schedule_time, insertion order).
//
// A claimed job stays in the jobs store marked "running" until its outcome
// is in the archive store; only then is it removed. An archive write that
// fails is retried on every tick. A running entry whose owner is gone (its
// process exited, or its Timekeeper was destroyed first) is archived as
// failed by the next tick that sees it.
class Timekeeper {
public:
    // Called outside all locks; `job_id` is empty for ArchiveCleared.
    using Callback = std::function<void(SchedulerEvent event, const std::string& job_id)>;

    Timekeeper(StateStore& jobs, StateStore& archive, const TaskRegistry& registry,
               Worker& worker,
               std::chrono::milliseconds tick_interval =
                   std::chrono::milliseconds(TICK_INTERVAL_MS));
    ~Timekeeper();

    Timekeeper(const Timekeeper&) = delete;
    Timekeeper& operator=(const Timekeeper&) = delete;

    // Background evaluation loop.
    void start();
    // Stops the loop and waits for in-flight jobs to be archived.
    void stop();
    bool running() const { return running_.load(); }

    // Persist a new job. Fails for an unknown task. Throws LockTimeout.
    Result<std::string> add_job(const std::string& task, TimePoint schedule_time,
                                const nlohmann::json& kwargs = nlohmann::json::object());

    // Remove a pending job. False (and logged) when the id is not pending,
    // e.g. it already fired or is dispatching. Throws LockTimeout.
    bool cancel_job(const std::string& job_id);

    // Pending jobs, not yet claimed.
    std::map<std::string, Job> get_jobs();

    // Claimed jobs whose outcome is not archived yet.
    std::map<std::string, Job> in_flight_jobs();

    std::map<std::string, ArchiveEntry> archived_jobs();
    std::optional<ArchiveEntry> archive_entry(const std::string& job_id);
    void clear_archive();

    // Single observer; a new registration replaces the previous one.
    void set_callback(Callback cb);

    // Retry unarchived outcomes, recover orphaned claims, then claim and
    // dispatch every job due at `now`. Returns the number fired.
    size_t tick(TimePoint now = Clock::now());

    // Outcomes waiting for a successful archive write.
    size_t unarchived() const;

private:
    StateStore& jobs_;
    StateStore& archive_;
    const TaskRegistry& registry_;
    Worker& worker_;
    std::chrono::milliseconds tick_interval_;
    uint64_t instance_;

    mutable std::mutex unarchived_mutex_;
    std::vector<ArchiveEntry> unarchived_;

    std::mutex callback_mutex_;
    Callback callback_;

    std::atomic<bool> running_{false};
    std::mutex loop_mutex_;
    std::condition_variable loop_cv_;
    bool stop_requested_ = false;
    std::thread loop_;

    void run_loop();
    void notify(SchedulerEvent event, const std::string& job_id);
    void archive_result(const Job& job, const Result<std::string>& result);
    bool commit(const ArchiveEntry& entry);
    void flush_unarchived();
    void recover(const Job& job);
    bool is_orphaned(const Job& job) const;
};
