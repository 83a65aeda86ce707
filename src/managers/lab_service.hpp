#pragma once

#include <string>
#include <vector>
#include <memory>
#include <chrono>
#include <core/config.hpp>
#include <devices/resource_manager.hpp>
#include <tasks/task_registry.hpp>
#include <tasks/task_validator.hpp>
#include <tasks/experiment.hpp>
#include <scheduler/worker.hpp>
#include <scheduler/timekeeper.hpp>
#include "state_store.hpp"
#include "dg4202_manager.hpp"
#include "edux1002a_manager.hpp"

// Pure data struct for UI consumption.
struct DeviceSummary {
    std::string name;         // identification string
    std::string state;        // "MOCK_ALIVE", "HARDWARE_ABSENT", ...
    bool alive = false;
    bool simulated = false;
    std::string resource;     // empty when absent
    std::string uptime;       // "H:MM:SS" or "N/A"
};

struct ExperimentRun {
    ExperimentReport report;
    std::vector<std::string> job_ids;   // scheduled steps, in order
    std::string error;                  // first scheduling failure
};

// Application context: owns the configuration, the state/job/archive
// stores, the instrument managers, the task registry, the dispatcher and
// the scheduler. Constructed once at startup and handed to any frontend.
class LabService {
public:
    // `resources` overrides the SCPI resource manager (tests pass a fake).
    explicit LabService(Config config, std::unique_ptr<ResourceManager> resources = nullptr);
    ~LabService();

    LabService(const LabService&) = delete;
    LabService& operator=(const LabService&) = delete;

    // Start and stop the scheduler loop.
    void start();
    void shutdown();

    // ── Devices ───────────────────────────────────────────────

    Dg4202Manager& dg4202() { return *dg4202_; }
    Edux1002aManager& edux1002a() { return *edux1002a_; }

    // Case-insensitive lookup by identification string. nullptr if unknown.
    DeviceManager* device(const std::string& name);
    std::vector<DeviceManager*> devices();

    // Refreshes every device (get_device) and summarizes it.
    std::vector<DeviceSummary> list_devices();

    // ── Tasks and jobs ────────────────────────────────────────

    const TaskRegistry& registry() const { return registry_; }

    ValidationReport validate(const std::string& task, const nlohmann::json& kwargs) const;

    // Validate the arguments, then add the job. Throws LockTimeout.
    Result<std::string> schedule(const std::string& task, TimePoint when,
                                 const nlohmann::json& kwargs);

    // Validate every step; when all pass, schedule them in order and stop
    // at the first failure.
    ExperimentRun run_experiment(const Experiment& experiment, TimePoint now = Clock::now());
    ExperimentRun run_experiment_file(const fs::path& path);

    Timekeeper& timekeeper() { return *timekeeper_; }
    Worker& worker() { return *worker_; }

    // ── State ─────────────────────────────────────────────────

    const Config& config() const { return config_; }
    StateStore& state_store() { return *state_; }
    StateStore& job_store() { return *jobs_; }
    StateStore& archive_store() { return *archive_; }

    // Time since construction, "H:MM:SS".
    std::string uptime() const;

private:
    Config config_;
    std::chrono::steady_clock::time_point started_;
    std::unique_ptr<StateStore> state_;
    std::unique_ptr<StateStore> jobs_;
    std::unique_ptr<StateStore> archive_;
    std::unique_ptr<ResourceManager> resources_;
    std::unique_ptr<Dg4202Manager> dg4202_;
    std::unique_ptr<Edux1002aManager> edux1002a_;
    TaskRegistry registry_;
    std::unique_ptr<Worker> worker_;
    std::unique_ptr<Timekeeper> timekeeper_;
};
