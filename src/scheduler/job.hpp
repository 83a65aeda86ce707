#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <core/utils.hpp>

// One pending invocation of a registered task.
struct Job {
    std::string job_id;        // YYYY-MM-DDTHH-MM-SS-mmm__<TASK>__<hex>
    std::string task;          // canonical task name
    TimePoint schedule_time;
    nlohmann::json kwargs = nlohmann::json::object();
    uint64_t seq = 0;          // insertion order, breaks schedule_time ties
    std::string submit_time;   // ISO timestamp

    // Set once a scheduler has claimed the job for dispatch. The entry stays
    // in the jobs file until its outcome is archived.
    bool running = false;
    int owner_pid = 0;
    uint64_t owner_instance = 0;
    std::string claimed_at;
};

// Outcome record of a job that ran.
struct ArchiveEntry {
    std::string job_id;
    std::string task;
    std::string schedule_time;
    std::string completion_time;
    std::string status;        // "completed" or "failed"
    std::string result;        // what was done, or the failure message
    nlohmann::json kwargs = nlohmann::json::object();

    bool failed() const { return status == "failed"; }
};

// Persisted forms. The jobs file maps job_id -> {task, schedule_time,
// kwargs, seq, submit_time, state}, plus the owner fields while "running";
// the archive maps job_id -> entry fields.
nlohmann::json job_to_json(const Job& job);
bool job_from_json(const std::string& job_id, const nlohmann::json& j, Job& out);

nlohmann::json archive_to_json(const ArchiveEntry& entry);
ArchiveEntry archive_from_json(const std::string& job_id, const nlohmann::json& j);

// Strict weak order by (schedule_time, seq).
bool fires_before(const Job& a, const Job& b);

std::string generate_job_id(const std::string& task);

// "DG4202_TOGGLE" out of "2026-02-15T14-44-10-637__DG4202_TOGGLE__3f2a".
std::string task_from_job_id(const std::string& job_id);
