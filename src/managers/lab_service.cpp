#include "lab_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>

LabService::LabService(Config config, std::unique_ptr<ResourceManager> resources)
    : config_(std::move(config)),
      started_(std::chrono::steady_clock::now()),
      resources_(std::move(resources)) {
    const LabConfig& lab = config_.lab();
    set_log_dir(lab.logs_dir);

    auto lock_timeout = std::chrono::seconds(lab.lock_timeout);
    fs::path data = lab.data_dir;
    state_ = std::make_unique<StateStore>(data / STATE_FILE, lock_timeout);
    jobs_ = std::make_unique<StateStore>(data / JOBS_FILE, lock_timeout);
    archive_ = std::make_unique<StateStore>(data / ARCHIVE_FILE, lock_timeout);

    if (!resources_) {
        resources_ = std::make_unique<ScpiResourceManager>(lab.instruments);
    }
    dg4202_ = std::make_unique<Dg4202Manager>(*state_, *resources_, lab.hardware_mock);
    edux1002a_ = std::make_unique<Edux1002aManager>(
        *state_, *resources_, lab.hardware_mock,
        static_cast<size_t>(lab.oscilloscope_buffer_size));

    registry_ = build_default_registry();
    worker_ = std::make_unique<Worker>(registry_, Instruments{*dg4202_, *edux1002a_});
    timekeeper_ = std::make_unique<Timekeeper>(
        *jobs_, *archive_, registry_, *worker_,
        std::chrono::milliseconds(lab.tick_interval_ms));

    log_info(fmt::format("mrilabs {} context ready (data={}, mock={})", MRILABS_VERSION,
                         lab.data_dir, lab.hardware_mock ? "yes" : "no"));
}

LabService::~LabService() {
    shutdown();
}

void LabService::start() {
    timekeeper_->start();
}

void LabService::shutdown() {
    if (timekeeper_) timekeeper_->stop();
}

// ── Devices ────────────────────────────────────────────────

DeviceManager* LabService::device(const std::string& name) {
    std::string upper = to_upper(name);
    for (auto* d : devices()) {
        if (to_upper(d->idn()) == upper) return d;
    }
    return nullptr;
}

std::vector<DeviceManager*> LabService::devices() {
    return {dg4202_.get(), edux1002a_.get()};
}

std::vector<DeviceSummary> LabService::list_devices() {
    std::vector<DeviceSummary> out;
    for (auto* d : devices()) {
        auto handle = d->get_device();
        DeviceSummary s;
        s.name = d->idn();
        s.state = device_state_name(d->state());
        s.alive = handle != nullptr;
        s.simulated = d->hardware_mock();
        s.resource = handle ? handle->resource() : "";
        s.uptime = d->uptime();
        out.push_back(std::move(s));
    }
    return out;
}

// ── Tasks and jobs ─────────────────────────────────────────

ValidationReport LabService::validate(const std::string& task, const nlohmann::json& kwargs) const {
    return validate_task(registry_, task, kwargs);
}

Result<std::string> LabService::schedule(const std::string& task, TimePoint when,
                                         const nlohmann::json& kwargs) {
    const TaskSpec* spec = registry_.find(task);
    if (!spec) {
        return Result<std::string>::Err(fmt::format("Unknown task: {}", task));
    }
    ValidationReport report = validate_params(*spec, kwargs);
    if (!report.ok) {
        return Result<std::string>::Err(report.summary());
    }
    return timekeeper_->add_job(spec->name, when, kwargs);
}

ExperimentRun LabService::run_experiment(const Experiment& experiment, TimePoint now) {
    ExperimentRun run;
    run.report = validate_experiment(registry_, experiment);
    if (!run.report.ok) {
        run.error = "Experiment has invalid steps; nothing scheduled";
        return run;
    }

    auto times = calculate_schedule_times(experiment, now);
    for (size_t i = 0; i < experiment.steps.size(); ++i) {
        const auto& step = experiment.steps[i];
        auto r = timekeeper_->add_job(step.task, times[i], step.parameters);
        if (r.is_err()) {
            run.error = fmt::format("Step {}: {}", i + 1, r.error);
            log_error(fmt::format("Experiment '{}' stopped: {}", experiment.name, run.error));
            break;
        }
        run.job_ids.push_back(r.value);
    }
    log_info(fmt::format("Experiment '{}': {} of {} steps scheduled", experiment.name,
                         run.job_ids.size(), experiment.steps.size()));
    return run;
}

ExperimentRun LabService::run_experiment_file(const fs::path& path) {
    auto loaded = load_experiment(path);
    if (loaded.is_err()) {
        ExperimentRun run;
        run.report.ok = false;
        run.report.level = ErrorLevel::InvalidYaml;
        run.report.error = loaded.error;
        run.error = loaded.error;
        return run;
    }
    return run_experiment(loaded.value);
}

std::string LabService::uptime() const {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - started_).count();
    return format_elapsed(secs);
}
