#pragma once

#include <string>
#include <map>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <utility>
#include <functional>
#include <condition_variable>
#include <core/types.hpp>
#include <tasks/task_registry.hpp>
#include <tasks/task_command.hpp>
#include "job.hpp"

// Runs tasks by name against the instruments. Failures (unknown task, bad
// arguments, absent device, instrument error) come back as an error result
// and are written to the job log; nothing propagates to the caller.
//
// Submitted jobs are queued per target device. Each device has one dispatch
// thread that runs its queue in submission order, so an instrument sees
// commands in the order the jobs fired while other devices proceed
// independently.
class Worker {
public:
    // Value on success is a description of what was done.
    using Completion = std::function<void(const Job&, const Result<std::string>&)>;

    Worker(const TaskRegistry& registry, Instruments instruments);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Validate, bind and run on the calling thread.
    Result<std::string> execute(const std::string& task, const nlohmann::json& kwargs,
                                const std::string& job_id = "");

    // Queue `job` behind earlier jobs for the same device; `done` is called
    // from that device's dispatch thread.
    void submit(Job job, Completion done);

    // Block until every submitted job has finished.
    void wait_idle();

    // Jobs submitted and not yet finished.
    size_t active() const { return active_.load(); }

private:
    struct Lane {
        std::deque<std::pair<Job, Completion>> queue;
        std::condition_variable cv;
        std::thread thread;
    };

    const TaskRegistry& registry_;
    Instruments instruments_;

    std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<std::string, std::unique_ptr<Lane>> lanes_;
    bool stopping_ = false;
    std::atomic<size_t> active_{0};

    Result<void> execute_command(const TaskCommand& command);
    std::string lane_for(const std::string& task) const;
    void drain(Lane& lane);
};
