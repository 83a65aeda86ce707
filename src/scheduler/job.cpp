#include "job.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <mutex>
#include <random>

nlohmann::json job_to_json(const Job& job) {
    nlohmann::json j = {
        {"task", job.task},
        {"schedule_time", to_iso_ms(job.schedule_time)},
        {"kwargs", job.kwargs},
        {"seq", job.seq},
        {"submit_time", job.submit_time},
        {"state", job.running ? "running" : "pending"},
    };
    if (job.running) {
        j["owner_pid"] = job.owner_pid;
        j["owner"] = job.owner_instance;
        j["claimed_at"] = job.claimed_at;
    }
    return j;
}

bool job_from_json(const std::string& job_id, const nlohmann::json& j, Job& out) {
    if (!j.is_object()) return false;
    auto task = j.find("task");
    auto when = j.find("schedule_time");
    if (task == j.end() || !task->is_string() || when == j.end() || !when->is_string()) {
        return false;
    }

    Job job;
    job.job_id = job_id;
    job.task = task->get<std::string>();
    if (!parse_iso_ms(when->get<std::string>(), job.schedule_time)) {
        return false;
    }
    auto kwargs = j.find("kwargs");
    if (kwargs != j.end() && kwargs->is_object()) job.kwargs = *kwargs;
    auto seq = j.find("seq");
    if (seq != j.end() && seq->is_number_unsigned()) job.seq = seq->get<uint64_t>();
    auto submitted = j.find("submit_time");
    if (submitted != j.end() && submitted->is_string()) job.submit_time = submitted->get<std::string>();

    auto state = j.find("state");
    job.running = state != j.end() && state->is_string() && *state == "running";
    if (job.running) {
        auto pid = j.find("owner_pid");
        if (pid != j.end() && pid->is_number_integer()) job.owner_pid = pid->get<int>();
        auto owner = j.find("owner");
        if (owner != j.end() && owner->is_number_unsigned()) job.owner_instance = owner->get<uint64_t>();
        auto claimed = j.find("claimed_at");
        if (claimed != j.end() && claimed->is_string()) job.claimed_at = claimed->get<std::string>();
    }

    out = std::move(job);
    return true;
}

nlohmann::json archive_to_json(const ArchiveEntry& entry) {
    return {
        {"task", entry.task},
        {"schedule_time", entry.schedule_time},
        {"completion_time", entry.completion_time},
        {"status", entry.status},
        {"result", entry.result},
        {"kwargs", entry.kwargs},
    };
}

ArchiveEntry archive_from_json(const std::string& job_id, const nlohmann::json& j) {
    ArchiveEntry e;
    e.job_id = job_id;
    if (!j.is_object()) return e;
    e.task = j.value("task", "");
    e.schedule_time = j.value("schedule_time", "");
    e.completion_time = j.value("completion_time", "");
    e.status = j.value("status", "");
    e.result = j.value("result", "");
    auto kwargs = j.find("kwargs");
    if (kwargs != j.end() && kwargs->is_object()) e.kwargs = *kwargs;
    return e;
}

bool fires_before(const Job& a, const Job& b) {
    if (a.schedule_time != b.schedule_time) return a.schedule_time < b.schedule_time;
    return a.seq < b.seq;
}

std::string generate_job_id(const std::string& task) {
    static std::mt19937 rng{std::random_device{}()};
    static std::mutex rng_mutex;

    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    auto time = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&time, &tm_buf);

    unsigned suffix;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        suffix = rng() & 0xffff;
    }

    return fmt::format("{:04d}-{:02d}-{:02d}T{:02d}-{:02d}-{:02d}-{:03d}__{}__{:04x}",
                       tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), task, suffix);
}

std::string task_from_job_id(const std::string& job_id) {
    auto first = job_id.find("__");
    if (first == std::string::npos) return job_id;
    auto rest = job_id.substr(first + 2);
    auto last = rest.rfind("__");
    return last == std::string::npos ? rest : rest.substr(0, last);
}
