#pragma once

#include <string>
#include <vector>
#include "task_registry.hpp"

// Outcome of checking one set of arguments against a task's parameters.
// Errors block execution; warnings (a default will be used) do not.
struct ValidationReport {
    bool ok = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    // "Validation issues: <errors and warnings joined by "; ">"
    std::string summary() const;
};

// Type rule for one argument value:
//   null fits every type; bool needs a real boolean; float also takes
//   integers; str takes anything; list and dict are checked by container
//   kind only; int needs an integer.
bool is_type_compatible(ParamType expected, const nlohmann::json& value);

// Python-style type name of a JSON value ("int", "float", "str", ...).
std::string json_type_name(const nlohmann::json& value);

// Missing, extra, mistyped and out-of-range parameters.
ValidationReport validate_params(const TaskSpec& spec, const Kwargs& kwargs);

// Resolves `task_name` first; an unknown task is a single error.
ValidationReport validate_task(const TaskRegistry& registry, const std::string& task_name,
                               const Kwargs& kwargs);

// `kwargs` with defaults filled in for missing or null optional parameters.
Kwargs apply_defaults(const TaskSpec& spec, const Kwargs& kwargs);
