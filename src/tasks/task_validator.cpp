#include "task_validator.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::string ValidationReport::summary() const {
    std::string out = "Validation issues: ";
    bool first = true;
    for (const auto* list : {&errors, &warnings}) {
        for (const auto& msg : *list) {
            if (!first) out += "; ";
            out += msg;
            first = false;
        }
    }
    return out;
}

bool is_type_compatible(ParamType expected, const nlohmann::json& value) {
    if (value.is_null()) return true;

    switch (expected) {
        case ParamType::Bool:   return value.is_boolean();
        case ParamType::Float:  return value.is_number();
        case ParamType::String: return true;
        case ParamType::Int:    return value.is_number_integer();
        case ParamType::List:   return value.is_array();
        case ParamType::Map:    return value.is_object();
    }
    return false;
}

std::string json_type_name(const nlohmann::json& value) {
    if (value.is_null()) return "NoneType";
    if (value.is_boolean()) return "bool";
    if (value.is_number_integer()) return "int";
    if (value.is_number_float()) return "float";
    if (value.is_string()) return "str";
    if (value.is_array()) return "list";
    if (value.is_object()) return "dict";
    return "object";
}

static bool choice_matches(const nlohmann::json& choice, const nlohmann::json& value) {
    if (choice.is_string() && value.is_string()) {
        return to_upper(choice.get<std::string>()) == to_upper(value.get<std::string>());
    }
    if (choice.is_number() && value.is_number()) {
        return choice.get<double>() == value.get<double>();
    }
    return choice == value;
}

static std::string format_choices(const std::vector<nlohmann::json>& choices) {
    std::string out;
    for (size_t i = 0; i < choices.size(); ++i) {
        if (i > 0) out += ", ";
        out += choices[i].is_string() ? choices[i].get<std::string>() : choices[i].dump();
    }
    return out;
}

// Empty when `value` satisfies the constraint.
static std::string check_constraint(const ParamSpec& p, const nlohmann::json& value) {
    const auto& c = p.constraint;
    if (c.empty() || value.is_null()) return "";

    if (!c.choices.empty()) {
        for (const auto& choice : c.choices) {
            if (choice_matches(choice, value)) return "";
        }
        return fmt::format("Invalid value: {} (got {}, expected one of {})",
                           p.name, value.is_string() ? value.get<std::string>() : value.dump(),
                           format_choices(c.choices));
    }

    if (!value.is_number()) return "";
    double v = value.get<double>();
    if ((c.min && v < *c.min) || (c.max && v > *c.max)) {
        std::string lo = c.min ? fmt::format("{}", *c.min) : "-inf";
        std::string hi = c.max ? fmt::format("{}", *c.max) : "inf";
        return fmt::format("Out of range: {} (got {}, expected {}..{})", p.name, value.dump(), lo, hi);
    }
    return "";
}

ValidationReport validate_params(const TaskSpec& spec, const Kwargs& kwargs) {
    ValidationReport report;
    const Kwargs args = kwargs.is_object() ? kwargs : Kwargs::object();

    for (const auto& p : spec.params) {
        auto it = args.find(p.name);
        if (it == args.end()) {
            if (p.has_default) {
                report.warnings.push_back(
                    fmt::format("Missing optional param: {}, using default value.", p.name));
            } else {
                report.errors.push_back(fmt::format("Missing required param: {}.", p.name));
            }
            continue;
        }

        if (!is_type_compatible(p.type, *it)) {
            report.errors.push_back(fmt::format("Type mismatch: {} (got {}, expected {})",
                                                p.name, json_type_name(*it),
                                                param_type_name(p.type)));
            continue;
        }

        std::string violation = check_constraint(p, *it);
        if (!violation.empty()) {
            report.errors.push_back(violation);
        }
    }

    for (auto it = args.begin(); it != args.end(); ++it) {
        if (!spec.param(it.key())) {
            report.errors.push_back(fmt::format("Extra param provided: {}.", it.key()));
        }
    }

    report.ok = report.errors.empty();
    return report;
}

ValidationReport validate_task(const TaskRegistry& registry, const std::string& task_name,
                               const Kwargs& kwargs) {
    const TaskSpec* spec = registry.find(task_name);
    if (!spec) {
        ValidationReport report;
        report.ok = false;
        report.errors.push_back(fmt::format("Unknown task: {}.", task_name));
        return report;
    }
    return validate_params(*spec, kwargs);
}

Kwargs apply_defaults(const TaskSpec& spec, const Kwargs& kwargs) {
    Kwargs out = kwargs.is_object() ? kwargs : Kwargs::object();
    for (const auto& p : spec.params) {
        if (!p.has_default) continue;
        auto it = out.find(p.name);
        if (it == out.end() || it->is_null()) {
            out[p.name] = p.default_value;
        }
    }
    return out;
}
