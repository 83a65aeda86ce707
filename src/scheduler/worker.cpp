#include "worker.hpp"
#include <core/log.hpp>
#include <tasks/task_validator.hpp>
#include <fmt/format.h>

Worker::Worker(const TaskRegistry& registry, Instruments instruments)
    : registry_(registry), instruments_(instruments) {}

Worker::~Worker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        for (auto& [name, lane] : lanes_) {
            lane->cv.notify_all();
        }
    }
    // Lanes finish their queues before exiting
    for (auto& [name, lane] : lanes_) {
        if (lane->thread.joinable()) lane->thread.join();
    }
}

Result<std::string> Worker::execute(const std::string& task, const nlohmann::json& kwargs,
                                    const std::string& job_id) {
    auto fail = [&](const std::string& msg) {
        log_error(fmt::format("Dispatch of {} failed: {}", task, msg));
        if (!job_id.empty()) append_job_log(job_id, "FAILED: " + msg);
        return Result<std::string>::Err(msg);
    };

    const TaskSpec* spec = registry_.find(task);
    if (!spec) {
        return fail(fmt::format("Unknown task: {}", task));
    }

    ValidationReport report = validate_params(*spec, kwargs);
    if (!report.ok) {
        return fail(report.summary());
    }

    if (!job_id.empty()) {
        append_job_log(job_id, fmt::format("Started {} {}", spec->name, kwargs.dump()));
    }

    std::string done;
    try {
        TaskCommand command = spec->bind(apply_defaults(*spec, kwargs));
        done = describe(command);
        auto result = execute_command(command);
        if (result.is_err()) {
            return fail(result.error);
        }
    } catch (const nlohmann::json::exception& e) {
        return fail(fmt::format("Bad arguments for {}: {}", spec->name, e.what()));
    } catch (const std::exception& e) {
        return fail(fmt::format("{} raised: {}", spec->name, e.what()));
    }

    log_info(fmt::format("Ran {}: {}", spec->name, done));
    if (!job_id.empty()) append_job_log(job_id, "Finished: " + done);
    return Result<std::string>::Ok(done);
}

Result<void> Worker::execute_command(const TaskCommand& command) {
    return ::execute(command, instruments_);
}

std::string Worker::lane_for(const std::string& task) const {
    const TaskSpec* spec = registry_.find(task);
    return spec ? spec->device : std::string();
}

void Worker::submit(Job job, Completion done) {
    std::string name = lane_for(job.task);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& lane = lanes_[name];
    if (!lane) {
        lane = std::make_unique<Lane>();
        Lane* raw = lane.get();
        lane->thread = std::thread([this, raw]() { drain(*raw); });
        log_debug(fmt::format("Dispatch lane opened for '{}'", name.empty() ? "?" : name));
    }
    ++active_;
    lane->queue.emplace_back(std::move(job), std::move(done));
    lane->cv.notify_one();
}

void Worker::drain(Lane& lane) {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        lane.cv.wait(lock, [&]() { return stopping_ || !lane.queue.empty(); });
        if (lane.queue.empty()) return;

        auto [job, done] = std::move(lane.queue.front());
        lane.queue.pop_front();
        lock.unlock();

        auto result = execute(job.task, job.kwargs, job.job_id);
        if (done) {
            try {
                done(job, result);
            } catch (const std::exception& e) {
                log_error(fmt::format("Completion handler for {} threw: {}", job.job_id, e.what()));
            }
        }

        lock.lock();
        if (--active_ == 0) idle_cv_.notify_all();
    }
}

void Worker::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return active_.load() == 0; });
}
