#include "task_schema.hpp"

const char* param_type_name(ParamType type) {
    switch (type) {
        case ParamType::Int:    return "int";
        case ParamType::Float:  return "float";
        case ParamType::Bool:   return "bool";
        case ParamType::String: return "str";
        case ParamType::List:   return "list";
        case ParamType::Map:    return "dict";
    }
    return "str";
}

const ParamSpec* TaskSpec::param(const std::string& param_name) const {
    for (const auto& p : params) {
        if (p.name == param_name) return &p;
    }
    return nullptr;
}

ParamSpec required_param(std::string name, ParamType type, ParamConstraint constraint) {
    ParamSpec p;
    p.name = std::move(name);
    p.type = type;
    p.constraint = std::move(constraint);
    return p;
}

ParamSpec optional_param(std::string name, ParamType type, nlohmann::json default_value,
                         ParamConstraint constraint) {
    ParamSpec p = required_param(std::move(name), type, std::move(constraint));
    p.has_default = true;
    p.default_value = std::move(default_value);
    return p;
}

ParamConstraint range(std::optional<double> min, std::optional<double> max) {
    ParamConstraint c;
    c.min = min;
    c.max = max;
    return c;
}

ParamConstraint one_of(std::vector<nlohmann::json> choices) {
    ParamConstraint c;
    c.choices = std::move(choices);
    return c;
}
