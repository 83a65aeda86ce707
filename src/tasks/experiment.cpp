#include "experiment.hpp"
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>

const char* error_level_name(ErrorLevel level) {
    switch (level) {
        case ErrorLevel::Info:        return "INFO";
        case ErrorLevel::BadConfig:   return "BAD_CONFIG";
        case ErrorLevel::InvalidYaml: return "INVALID_YAML";
    }
    return "INFO";
}

// ── YAML → JSON ────────────────────────────────────────────

static bool parse_integer(const std::string& s, long long& out) {
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

static bool parse_real(const std::string& s, double& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) return false;
    out = v;
    return true;
}

// Plain scalars become null, bool, int or float where they read as such;
// quoted scalars always stay strings.
static nlohmann::json scalar_to_json(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return nullptr;
    }
    std::string upper = to_upper(text);
    if (upper == "TRUE" || upper == "YES" || upper == "ON") return true;
    if (upper == "FALSE" || upper == "NO" || upper == "OFF") return false;

    long long i = 0;
    if (parse_integer(text, i)) return i;
    double d = 0.0;
    if (parse_real(text, d)) return d;
    return text;
}

static nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) arr.push_back(yaml_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                if (!kv.first.IsScalar()) {
                    throw std::invalid_argument(fmt::format(
                        "mapping key at line {} is not a scalar", kv.first.Mark().line + 1));
                }
                obj[kv.first.Scalar()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

static bool read_seconds(const YAML::Node& node, double& out) {
    nlohmann::json v = yaml_to_json(node);
    if (!v.is_number()) return false;
    out = v.get<double>();
    return true;
}

// ── Parsing ────────────────────────────────────────────────

Result<Experiment> parse_experiment(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        return Result<Experiment>::Err(std::string("YAML parse error: ") + e.what());
    }

    int index = 0;
    try {
        if (!root.IsMap() || !root["experiment"] || !root["experiment"].IsMap()) {
            return Result<Experiment>::Err("Missing 'experiment' mapping");
        }
        YAML::Node exp_node = root["experiment"];

        Experiment exp;
        if (exp_node["name"] && exp_node["name"].IsScalar()) {
            exp.name = exp_node["name"].Scalar();
        }

        YAML::Node steps = exp_node["steps"];
        if (!steps || steps.IsNull()) {
            return Result<Experiment>::Ok(exp);
        }
        if (!steps.IsSequence()) {
            return Result<Experiment>::Err("'steps' must be a list");
        }

        for (const auto& step_node : steps) {
            ++index;
            if (!step_node.IsMap()) {
                return Result<Experiment>::Err(fmt::format("Step {} is not a mapping", index));
            }
            if (!step_node["task"] || !step_node["task"].IsScalar()) {
                return Result<Experiment>::Err(fmt::format("Step {} has no task", index));
            }

            ExperimentStep step;
            step.task = step_node["task"].Scalar();
            trim(step.task);
            if (step_node["description"] && step_node["description"].IsScalar()) {
                step.description = step_node["description"].Scalar();
            }

            for (const char* key : {"delay", "wait"}) {
                if (step_node[key] && !read_seconds(step_node[key], step.wait)) {
                    return Result<Experiment>::Err(
                        fmt::format("Step {}: '{}' must be a number of seconds", index, key));
                }
            }
            if (step_node["at_time"]) {
                double at = 0.0;
                if (!read_seconds(step_node["at_time"], at)) {
                    return Result<Experiment>::Err(
                        fmt::format("Step {}: 'at_time' must be a number of seconds", index));
                }
                step.at_time = at;
            }

            if (step_node["parameters"] && !step_node["parameters"].IsNull()) {
                if (!step_node["parameters"].IsMap()) {
                    return Result<Experiment>::Err(
                        fmt::format("Step {}: 'parameters' must be a mapping", index));
                }
                step.parameters = yaml_to_json(step_node["parameters"]);
            }

            exp.steps.push_back(std::move(step));
        }
        return Result<Experiment>::Ok(exp);
    } catch (const std::invalid_argument& e) {
        return Result<Experiment>::Err(fmt::format("Step {}: {}", index, e.what()));
    } catch (const YAML::Exception& e) {
        return Result<Experiment>::Err(std::string("YAML structure error: ") + e.what());
    }
}

Result<Experiment> load_experiment(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Experiment>::Err("Cannot open " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse_experiment(buf.str());
}

// ── Validation ─────────────────────────────────────────────

ExperimentReport validate_experiment(const TaskRegistry& registry, const Experiment& experiment) {
    ExperimentReport report;
    report.ok = true;

    int index = 0;
    for (const auto& step : experiment.steps) {
        ++index;
        StepResult result;
        result.label = fmt::format("Step {}: {}", index, to_upper(step.task));

        const TaskSpec* spec = registry.find(step.task);
        if (!spec) {
            result.ok = false;
            result.message = "Task function not found.";
            result.level = ErrorLevel::BadConfig;
        } else {
            ValidationReport vr = validate_params(*spec, step.parameters);
            result.ok = vr.ok;
            if (!vr.ok || !vr.warnings.empty()) result.message = vr.summary();
            result.level = vr.ok ? ErrorLevel::Info : ErrorLevel::BadConfig;
        }

        if (!result.ok) report.ok = false;
        if (result.level > report.level) report.level = result.level;
        report.steps.push_back(std::move(result));
    }
    return report;
}

ExperimentReport check_experiment_file(const TaskRegistry& registry, const fs::path& path) {
    auto loaded = load_experiment(path);
    if (loaded.is_err()) {
        ExperimentReport report;
        report.ok = false;
        report.level = ErrorLevel::InvalidYaml;
        report.error = loaded.error;
        return report;
    }
    return validate_experiment(registry, loaded.value);
}

// ── Scheduling ─────────────────────────────────────────────

static Clock::duration seconds_to_duration(double secs) {
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(secs));
}

std::vector<TimePoint> calculate_schedule_times(const Experiment& experiment, TimePoint now) {
    std::vector<TimePoint> times;
    TimePoint last = now;
    for (const auto& step : experiment.steps) {
        TimePoint t = step.at_time ? now + seconds_to_duration(*step.at_time)
                                   : last + seconds_to_duration(step.wait);
        times.push_back(t);
        last = t;
    }
    return times;
}

std::string experiment_summary(const Experiment& experiment) {
    std::string out = fmt::format("Experiment: {}\n\nSteps Summary:", experiment.name);
    int index = 0;
    for (const auto& step : experiment.steps) {
        ++index;
        out += fmt::format("\n  Step {}: {} - {}", index, step.task,
                           step.description.empty() ? "No description" : step.description);
    }
    return out;
}
