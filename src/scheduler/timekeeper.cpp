#include "timekeeper.hpp"
#include <core/log.hpp>
#include <platform/file_lock.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>
#include <vector>

namespace {

// Timekeepers alive in this process, by instance number.
std::mutex g_instances_mutex;
std::set<uint64_t> g_live_instances;
uint64_t g_next_instance = 1;

} // namespace

const char* scheduler_event_name(SchedulerEvent event) {
    switch (event) {
        case SchedulerEvent::Added:          return "added";
        case SchedulerEvent::Cancelled:      return "cancelled";
        case SchedulerEvent::Fired:          return "fired";
        case SchedulerEvent::Completed:      return "completed";
        case SchedulerEvent::ArchiveCleared: return "archive-cleared";
    }
    return "unknown";
}

Timekeeper::Timekeeper(StateStore& jobs, StateStore& archive, const TaskRegistry& registry,
                       Worker& worker, std::chrono::milliseconds tick_interval)
    : jobs_(jobs),
      archive_(archive),
      registry_(registry),
      worker_(worker),
      tick_interval_(tick_interval) {
    std::lock_guard<std::mutex> lock(g_instances_mutex);
    instance_ = g_next_instance++;
    g_live_instances.insert(instance_);
}

Timekeeper::~Timekeeper() {
    stop();
    std::lock_guard<std::mutex> lock(g_instances_mutex);
    g_live_instances.erase(instance_);
}

// ── Loop ───────────────────────────────────────────────────

void Timekeeper::start() {
    if (running_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(loop_mutex_);
        stop_requested_ = false;
    }
    loop_ = std::thread([this]() { run_loop(); });
    log_info(fmt::format("Timekeeper started (tick {} ms)", tick_interval_.count()));
}

void Timekeeper::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(loop_mutex_);
            stop_requested_ = true;
        }
        loop_cv_.notify_all();
        if (loop_.joinable()) loop_.join();
        log_info("Timekeeper stopped");
    }
    worker_.wait_idle();
    try {
        flush_unarchived();
    } catch (const std::exception& e) {
        log_warn(fmt::format("Final archive retry failed: {}", e.what()));
    }
    size_t left = unarchived();
    if (left > 0) {
        log_error(fmt::format("{} job outcome(s) not archived; they stay running in {} "
                              "and will be recovered as interrupted",
                              left, jobs_.path().string()));
    }
}

void Timekeeper::run_loop() {
    std::unique_lock<std::mutex> lock(loop_mutex_);
    while (!stop_requested_) {
        lock.unlock();
        try {
            tick();
        } catch (const LockTimeout& e) {
            log_warn(fmt::format("Tick skipped: {}", e.what()));
        } catch (const std::exception& e) {
            log_error(fmt::format("Tick failed: {}", e.what()));
        }
        lock.lock();
        loop_cv_.wait_for(lock, tick_interval_, [this]() { return stop_requested_; });
    }
}

size_t Timekeeper::tick(TimePoint now) {
    flush_unarchived();

    std::vector<Job> due;
    std::vector<Job> orphans;
    int pid = platform::current_pid();
    std::string claimed_at = now_iso();

    jobs_.update([&](Document& doc) {
        std::vector<std::string> unreadable;
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            Job job;
            if (!job_from_json(it.key(), it.value(), job)) {
                unreadable.push_back(it.key());
                continue;
            }
            bool orphaned = job.running && is_orphaned(job);
            if (job.running && !orphaned) continue;
            if (!orphaned && job.schedule_time > now) continue;

            // Take ownership of the entry; it stays until archived
            job.running = true;
            job.owner_pid = pid;
            job.owner_instance = instance_;
            job.claimed_at = claimed_at;
            it.value() = job_to_json(job);
            (orphaned ? orphans : due).push_back(std::move(job));
        }
        for (const auto& key : unreadable) {
            log_warn(fmt::format("Dropping unreadable job entry {}", key));
            doc.erase(key);
        }
    });

    for (const auto& job : orphans) {
        recover(job);
    }

    std::sort(due.begin(), due.end(), fires_before);
    for (auto& job : due) {
        std::string id = job.job_id;
        log_info(fmt::format("Firing {} (scheduled {})", id, to_iso_ms(job.schedule_time)));
        notify(SchedulerEvent::Fired, id);
        worker_.submit(std::move(job), [this](const Job& j, const Result<std::string>& r) {
            archive_result(j, r);
        });
    }
    return due.size();
}

bool Timekeeper::is_orphaned(const Job& job) const {
    if (job.owner_pid != platform::current_pid()) {
        return !platform::process_alive(job.owner_pid);
    }
    std::lock_guard<std::mutex> lock(g_instances_mutex);
    return g_live_instances.count(job.owner_instance) == 0;
}

void Timekeeper::recover(const Job& job) {
    ArchiveEntry entry;
    entry.job_id = job.job_id;
    entry.task = job.task;
    entry.schedule_time = to_iso_ms(job.schedule_time);
    entry.completion_time = to_iso_ms(Clock::now());
    entry.status = "failed";
    entry.result = fmt::format("Interrupted: claimed at {} by process {} and never archived",
                               job.claimed_at.empty() ? "unknown time" : job.claimed_at,
                               job.owner_pid);
    entry.kwargs = job.kwargs;
    log_warn(fmt::format("Recovering orphaned job {}", job.job_id));

    if (commit(entry)) {
        notify(SchedulerEvent::Completed, job.job_id);
    }
}

void Timekeeper::archive_result(const Job& job, const Result<std::string>& result) {
    ArchiveEntry entry;
    entry.job_id = job.job_id;
    entry.task = job.task;
    entry.schedule_time = to_iso_ms(job.schedule_time);
    entry.completion_time = to_iso_ms(Clock::now());
    entry.status = result.is_ok() ? "completed" : "failed";
    entry.result = result.is_ok() ? result.value : result.error;
    entry.kwargs = job.kwargs;

    if (commit(entry)) {
        notify(SchedulerEvent::Completed, job.job_id);
    }
}

// Archive first, then drop the running entry, so a failure in between
// leaves the job in both files rather than in neither. An outcome already in
// the archive is kept as is.
bool Timekeeper::commit(const ArchiveEntry& entry) {
    try {
        bool kept = false;
        archive_.update([&](Document& doc) {
            kept = doc.contains(entry.job_id);
            if (!kept) doc[entry.job_id] = archive_to_json(entry);
        });
        jobs_.update([&](Document& doc) { doc.erase(entry.job_id); });
        append_job_log(entry.job_id, kept ? "Archive entry already present"
                                          : fmt::format("Archived as {}", entry.status));
        return true;
    } catch (const std::exception& e) {
        log_warn(fmt::format("Could not archive {} yet: {}", entry.job_id, e.what()));
    }
    std::lock_guard<std::mutex> lock(unarchived_mutex_);
    auto same = [&](const ArchiveEntry& e) { return e.job_id == entry.job_id; };
    if (std::none_of(unarchived_.begin(), unarchived_.end(), same)) {
        unarchived_.push_back(entry);
    }
    return false;
}

void Timekeeper::flush_unarchived() {
    std::vector<ArchiveEntry> retry;
    {
        std::lock_guard<std::mutex> lock(unarchived_mutex_);
        retry.swap(unarchived_);
    }
    for (const auto& entry : retry) {
        if (commit(entry)) {
            log_info(fmt::format("Archived {} on retry", entry.job_id));
            notify(SchedulerEvent::Completed, entry.job_id);
        }
    }
}

size_t Timekeeper::unarchived() const {
    std::lock_guard<std::mutex> lock(unarchived_mutex_);
    return unarchived_.size();
}

// ── Jobs ───────────────────────────────────────────────────

Result<std::string> Timekeeper::add_job(const std::string& task, TimePoint schedule_time,
                                        const nlohmann::json& kwargs) {
    const TaskSpec* spec = registry_.find(task);
    if (!spec) {
        log_error(fmt::format("add_job rejected unknown task '{}'", task));
        return Result<std::string>::Err(fmt::format("Unknown task: {}", task));
    }

    Job job;
    job.job_id = generate_job_id(spec->name);
    job.task = spec->name;
    job.schedule_time = schedule_time;
    job.kwargs = kwargs.is_object() ? kwargs : nlohmann::json::object();
    job.submit_time = now_iso();

    jobs_.update([&](Document& doc) {
        uint64_t next = 0;
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            auto seq = it.value().find("seq");
            if (seq != it.value().end() && seq->is_number_unsigned()) {
                next = std::max(next, seq->get<uint64_t>() + 1);
            }
        }
        job.seq = next;
        while (doc.find(job.job_id) != doc.end()) {
            job.job_id = generate_job_id(spec->name);
        }
        doc[job.job_id] = job_to_json(job);
    });

    log_info(fmt::format("Scheduled {} at {}", job.job_id, to_iso_ms(schedule_time)));
    append_job_log(job.job_id, fmt::format("Scheduled {} for {} {}", job.task,
                                           to_iso_ms(schedule_time), job.kwargs.dump()));
    notify(SchedulerEvent::Added, job.job_id);
    loop_cv_.notify_all();
    return Result<std::string>::Ok(job.job_id);
}

bool Timekeeper::cancel_job(const std::string& job_id) {
    bool removed = false;
    bool running = false;
    jobs_.update([&](Document& doc) {
        auto it = doc.find(job_id);
        if (it == doc.end()) return;
        Job job;
        if (job_from_json(job_id, *it, job) && job.running) {
            running = true;
            return;
        }
        doc.erase(it);
        removed = true;
    });
    if (!removed) {
        log_warn(fmt::format("cancel_job: {} is {}", job_id,
                             running ? "already dispatching" : "not pending"));
        return false;
    }
    log_info(fmt::format("Cancelled {}", job_id));
    append_job_log(job_id, "Cancelled");
    notify(SchedulerEvent::Cancelled, job_id);
    return true;
}

static std::map<std::string, Job> jobs_in_state(const Document& doc, bool running) {
    std::map<std::string, Job> out;
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        Job job;
        if (job_from_json(it.key(), it.value(), job) && job.running == running) {
            out.emplace(it.key(), std::move(job));
        }
    }
    return out;
}

std::map<std::string, Job> Timekeeper::get_jobs() {
    return jobs_in_state(jobs_.read(), false);
}

std::map<std::string, Job> Timekeeper::in_flight_jobs() {
    return jobs_in_state(jobs_.read(), true);
}

std::map<std::string, ArchiveEntry> Timekeeper::archived_jobs() {
    std::map<std::string, ArchiveEntry> out;
    Document doc = archive_.read();
    for (auto it = doc.begin(); it != doc.end(); ++it) {
        out.emplace(it.key(), archive_from_json(it.key(), it.value()));
    }
    return out;
}

std::optional<ArchiveEntry> Timekeeper::archive_entry(const std::string& job_id) {
    Document doc = archive_.read();
    auto it = doc.find(job_id);
    if (it == doc.end()) return std::nullopt;
    return archive_from_json(job_id, *it);
}

void Timekeeper::clear_archive() {
    archive_.clear();
    log_info("Archive cleared");
    notify(SchedulerEvent::ArchiveCleared, "");
}

// ── Observer ───────────────────────────────────────────────

void Timekeeper::set_callback(Callback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback_ = std::move(cb);
}

void Timekeeper::notify(SchedulerEvent event, const std::string& job_id) {
    Callback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = callback_;
    }
    if (!cb) return;
    try {
        cb(event, job_id);
    } catch (const std::exception& e) {
        log_error(fmt::format("Scheduler callback threw on {} {}: {}",
                              scheduler_event_name(event), job_id, e.what()));
    }
}
