#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <core/utils.hpp>
#include "task_registry.hpp"
#include "task_validator.hpp"

namespace fs = std::filesystem;

// Severity of an experiment check, lowest first.
enum class ErrorLevel { Info, BadConfig, InvalidYaml };

// "INFO", "BAD_CONFIG", "INVALID_YAML"
const char* error_level_name(ErrorLevel level);

struct ExperimentStep {
    std::string task;
    std::string description;
    double wait = 0.0;               // seconds after the previous step ("delay"/"wait")
    std::optional<double> at_time;   // seconds after submission, wins over wait
    Kwargs parameters = Kwargs::object();
};

struct Experiment {
    std::string name = "Unnamed Experiment";
    std::vector<ExperimentStep> steps;
};

// Parse `{experiment: {name, steps: [...]}}`. Errors describe structural
// problems (not a mapping, missing task, non-numeric timing).
Result<Experiment> parse_experiment(const std::string& yaml_text);
Result<Experiment> load_experiment(const fs::path& path);

struct StepResult {
    std::string label;     // "Step N: TASK"
    bool ok = false;
    std::string message;
    ErrorLevel level = ErrorLevel::Info;
};

struct ExperimentReport {
    bool ok = false;
    ErrorLevel level = ErrorLevel::Info;   // highest level among the steps
    std::vector<StepResult> steps;
    std::string error;                     // set for InvalidYaml
};

ExperimentReport validate_experiment(const TaskRegistry& registry, const Experiment& experiment);

// Load and validate; an unreadable or malformed file is InvalidYaml.
ExperimentReport check_experiment_file(const TaskRegistry& registry, const fs::path& path);

// Fire time of every step: at_time counts from `now`, otherwise the wait
// counts from the previous step's fire time (the first from `now`).
std::vector<TimePoint> calculate_schedule_times(const Experiment& experiment, TimePoint now);

// "Experiment: <name>" followed by one "  Step N: TASK - description" line per step.
std::string experiment_summary(const Experiment& experiment);
