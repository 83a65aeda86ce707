#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static std::string describe_param(const ParamSpec& p) {
    std::string out = fmt::format("{}:{}", p.name, param_type_name(p.type));
    const auto& c = p.constraint;
    if (!c.choices.empty()) {
        std::string choices;
        for (size_t i = 0; i < c.choices.size(); ++i) {
            if (i > 0) choices += "|";
            choices += c.choices[i].is_string() ? c.choices[i].get<std::string>()
                                                : c.choices[i].dump();
        }
        out += "{" + choices + "}";
    } else if (c.min || c.max) {
        out += fmt::format("[{}..{}]", c.min ? fmt::format("{}", *c.min) : "",
                           c.max ? fmt::format("{}", *c.max) : "");
    }
    if (p.has_default) {
        out += "=" + p.default_value.dump();
    }
    return out;
}

static void do_tasks(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    const auto& reg = cli.service->registry();

    for (const auto& device : reg.devices()) {
        std::cout << theme::section(device);
        for (const auto* t : reg.by_device(device)) {
            std::cout << theme::color::BLUE << fmt::format("    {:<22}", t->name)
                      << theme::color::RESET << t->display << "\n";
            std::cout << theme::color::DIM << "      " << t->description
                      << theme::color::RESET << "\n";
            std::string params;
            for (const auto& p : t->params) {
                if (!params.empty()) params += "  ";
                params += describe_param(p);
            }
            std::cout << "      " << (params.empty() ? theme::dim("(no parameters)") : params)
                      << "\n";
        }
    }
    std::cout << "\n";
}

static void do_validate(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    auto words = split_args(arg, true);
    if (words.empty()) {
        std::cout << theme::fail("Usage: validate <task> [key=value ...]");
        return;
    }
    std::string task = words[0];
    words.erase(words.begin());

    auto kwargs = parse_kwargs(words);
    if (kwargs.is_err()) {
        std::cout << theme::fail(kwargs.error);
        return;
    }

    auto report = cli.service->validate(task, kwargs.value);
    if (report.ok) {
        const TaskSpec* spec = cli.service->registry().find(task);
        std::cout << theme::ok(fmt::format("{} arguments are valid", spec ? spec->name : task));
    }
    print_report(report);
}

void register_task_commands(BaseCLI& cli) {
    cli.add_command("tasks", do_tasks, "List tasks and their parameters by device");
    cli.add_command("validate", do_validate, "Check task arguments: validate <task> k=v ...");
}
