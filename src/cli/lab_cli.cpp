#include "lab_cli.hpp"
#include "commands/command_helpers.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <cstring>
#include <vector>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>
#include <tasks/experiment.hpp>
#include <tasks/task_registry.hpp>
#include <readline/readline.h>
#include <readline/history.h>

// ── SIGINT ───────────────────────────────────────────────────

static volatile std::sig_atomic_t g_interrupted = 0;

static void on_sigint(int) {
    g_interrupted = 1;
}

// Polled by readline while it waits for input.
static int interrupt_hook() {
    if (g_interrupted) {
        rl_done = 1;
    }
    return 0;
}

static void install_sigint_handler() {
    struct sigaction sa {};
    sa.sa_handler = on_sigint;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);

    rl_catch_signals = 0;
    rl_event_hook = interrupt_hook;
    rl_set_keyboard_input_timeout(100000);  // 100ms
}

// ── Completion ───────────────────────────────────────────────

static BaseCLI* g_completer = nullptr;
static std::vector<std::string> g_matches;

static char* match_generator(const char* text, int state) {
    static size_t index = 0;
    if (state == 0) index = 0;
    if (index < g_matches.size()) return strdup(g_matches[index++].c_str());
    return nullptr;
}

static char** complete_hook(const char* text, int start, int end) {
    rl_attempted_completion_over = 1;
    if (!g_completer) return nullptr;
    g_matches = g_completer->complete(std::string(rl_line_buffer, start), text);
    // "key=" completions continue with the value
    bool all_keys = !g_matches.empty();
    for (const auto& m : g_matches) {
        if (m.back() != '=') all_keys = false;
    }
    rl_completion_append_character = all_keys ? '\0' : ' ';
    return rl_completion_matches(text, match_generator);
}

// ── LabCLI ───────────────────────────────────────────────────

LabCLI::LabCLI() : BaseCLI() {
    register_all_commands();
}

void LabCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Stop the scheduler and exit");

    add_command("exit", [this](BaseCLI& cli, const std::string& arg) {
        quit_requested_ = true;
    }, "Stop the scheduler and exit");

    add_command("clear", [](BaseCLI& cli, const std::string& arg) {
        std::cout << "\033[2J\033[H" << std::flush;
    }, "Clear the screen");

    register_device_commands(*this);
    register_task_commands(*this);
    register_job_commands(*this);
}

void LabCLI::queue_event(const std::string& msg) {
    std::lock_guard<std::mutex> lock(events_mutex_);
    events_.push_back(msg);
}

void LabCLI::flush_events() {
    std::deque<std::string> pending;
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        pending.swap(events_);
    }
    for (const auto& msg : pending) {
        std::cout << theme::log(msg);
    }
}

void LabCLI::run_repl() {
    std::cout << theme::banner();

    if (!config_error.empty()) {
        std::cout << theme::warn("Config: " + config_error);
        std::cout << theme::step("Using built-in defaults.");
    }

    std::cout << theme::section("Starting");
    init_service();
    const LabConfig& lab = config.lab();
    std::cout << theme::kv("Data", lab.data_dir);
    std::cout << theme::kv("Logs", lab_log_path());
    std::cout << theme::kv("Mode", lab.hardware_mock ? theme::yellow("hardware mock") : "hardware");

    service->timekeeper().set_callback([this](SchedulerEvent event, const std::string& job_id) {
        switch (event) {
        case SchedulerEvent::Fired:
            queue_event("fired " + job_id);
            break;
        case SchedulerEvent::Completed: {
            auto entry = service->timekeeper().archive_entry(job_id);
            if (entry) {
                queue_event(fmt::format("{} {}: {}", entry->status, job_id, entry->result));
            } else {
                queue_event("completed " + job_id);
            }
            break;
        }
        default:
            break;
        }
    });
    service->start();

    std::cout << "\n";
    for (const auto& d : service->list_devices()) {
        if (d.alive) {
            std::cout << theme::ok(fmt::format("{} {}", d.name, theme::dim(d.resource)));
        } else {
            std::cout << theme::fail(fmt::format("{} not found", d.name));
        }
    }
    size_t pending = service->timekeeper().get_jobs().size();
    if (pending > 0) {
        std::cout << theme::info(fmt::format("{} pending job(s) restored", pending));
    }
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    install_sigint_handler();
    g_completer = this;
    rl_variable_bind("completion-ignore-case", "on");
    rl_attempted_completion_function = complete_hook;

    std::string line;
    while (!quit_requested_ && !g_interrupted) {
        flush_events();

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }
        line = raw;
        free(raw);

        if (g_interrupted) {
            std::cout << "\n";
            break;
        }

        trim(line);
        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        trim(args);

        execute_command(command, args);
    }

    rl_attempted_completion_function = nullptr;
    g_completer = nullptr;
    std::cout << theme::dim("    Stopping scheduler...") << "\n";
    service->timekeeper().set_callback(nullptr);
    clear_service();
    flush_events();
    log_info(g_interrupted ? "Shell interrupted" : "Shell closed");
}

int LabCLI::run_check(const std::string& path) {
    TaskRegistry registry = build_default_registry();

    auto loaded = load_experiment(path);
    if (loaded.is_err()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_level_name(ErrorLevel::InvalidYaml),
                                             loaded.error));
        return 1;
    }

    std::cout << theme::section("Check");
    std::istringstream summary(experiment_summary(loaded.value));
    for (std::string line; std::getline(summary, line);) {
        std::cout << theme::dim("    " + line) << "\n";
    }
    std::cout << "\n";

    ExperimentReport report = validate_experiment(registry, loaded.value);
    for (const auto& s : report.steps) {
        if (!s.ok) {
            std::cout << theme::fail(fmt::format("{}: {}", s.label, s.message));
        } else if (!s.message.empty()) {
            std::cout << theme::warn(fmt::format("{}: {}", s.label, s.message));
        } else {
            std::cout << theme::ok(s.label);
        }
    }

    std::cout << "\n";
    if (!report.ok) {
        std::cout << theme::fail(fmt::format("{}: experiment is not valid",
                                             error_level_name(report.level)));
        return 1;
    }
    std::cout << theme::ok(fmt::format("{}: {} step(s) valid", error_level_name(report.level),
                                       report.steps.size()));
    return 0;
}

void LabCLI::run_setup() {
    std::cout << theme::banner();
    std::cout << theme::section("Setup");

    bool existed = global_config_exists();
    auto result = create_default_global_config();
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return;
    }

    std::string path = get_global_config_path().string();
    if (existed) {
        std::cout << theme::info("Config already exists: " + path);
    } else {
        std::cout << theme::ok("Config written to " + path);
    }
    std::cout << theme::step("Add instrument addresses under 'instruments.tcpip'.");
    std::cout << theme::step("Run 'mrilabs run' (or 'mrilabs run --hardware-mock') to start.");
    std::cout << "\n";
}
