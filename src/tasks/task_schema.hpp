#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <nlohmann/json.hpp>
#include "task_command.hpp"

// Keyword arguments of one task invocation (a JSON object).
using Kwargs = nlohmann::json;

enum class ParamType { Int, Float, Bool, String, List, Map };

// "int", "float", "bool", "str", "list", "dict"
const char* param_type_name(ParamType type);

// Inclusive numeric bounds and/or an allowed-value list.
struct ParamConstraint {
    std::optional<double> min;
    std::optional<double> max;
    std::vector<nlohmann::json> choices;

    bool empty() const { return !min && !max && choices.empty(); }
};

struct ParamSpec {
    std::string name;
    ParamType type = ParamType::String;
    bool has_default = false;
    nlohmann::json default_value;
    ParamConstraint constraint;
};

// One registered task: identity, owning device, declared parameters, and
// the binder turning validated arguments into a TaskCommand.
struct TaskSpec {
    std::string name;         // canonical, e.g. "DG4202_TOGGLE"
    std::string display;      // e.g. "Toggle Output"
    std::string device;       // identification string of the target device
    std::string description;
    std::vector<ParamSpec> params;
    std::function<TaskCommand(const Kwargs&)> bind;

    const ParamSpec* param(const std::string& param_name) const;
};

// ── Builders ───────────────────────────────────────────────

ParamSpec required_param(std::string name, ParamType type, ParamConstraint constraint = {});
ParamSpec optional_param(std::string name, ParamType type, nlohmann::json default_value,
                         ParamConstraint constraint = {});

ParamConstraint range(std::optional<double> min, std::optional<double> max = std::nullopt);
ParamConstraint one_of(std::vector<nlohmann::json> choices);
