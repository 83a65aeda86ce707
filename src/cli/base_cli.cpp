#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <vector>
#include <fmt/format.h>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/file_lock.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load_global();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        config = Config::defaults();
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_service() {
    if (!service) {
        std::cout << theme::fail("Lab service is not running.");
        return false;
    }
    return true;
}

void BaseCLI::init_service() {
    service.reset();
    service = std::make_unique<LabService>(config);
}

void BaseCLI::clear_service() {
    if (service) {
        service->shutdown();
        service.reset();
    }
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const LockTimeout& e) {
        std::cout << theme::fail(std::string(e.what()));
        std::cout << theme::step("Another process holds the lock. Try again.");
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Devices", {"status", "devices", "kill", "revive"}},
        {"Tasks",   {"tasks", "validate"}},
        {"Jobs",    {"schedule", "jobs", "cancel", "archive", "clear-archive", "experiment"}},
        {"General", {"help", "clear", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<15}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::BROWN) + "mrilabs" + rl_esc(theme::color::RESET);
    if (config.lab().hardware_mock) {
        prompt += ":" + rl_esc(theme::color::YELLOW) + "mock" + rl_esc(theme::color::RESET);
    }
    return prompt + "> ";
}

// ── Completion ─────────────────────────────────────────────

std::vector<std::string> BaseCLI::complete(const std::string& before, const std::string& prefix) {
    std::vector<std::string> words;
    std::istringstream iss(before);
    for (std::string w; iss >> w;) words.push_back(w);

    std::vector<std::string> pool;
    if (words.empty()) {
        for (const auto& [name, entry] : commands_) pool.push_back(name);
    } else if (service) {
        const std::string& cmd = words[0];
        size_t arg = words.size() - 1;   // index of the argument being completed
        try {
            if ((cmd == "schedule" || cmd == "validate") && arg == 0) {
                for (const auto& t : service->registry().tasks()) pool.push_back(t.name);
            } else if (cmd == "validate" || (cmd == "schedule" && arg >= 2)) {
                const TaskSpec* spec = service->registry().find(words[1]);
                if (spec) {
                    for (const auto& p : spec->params) pool.push_back(p.name + "=");
                }
            } else if ((cmd == "kill" || cmd == "revive") && arg == 0) {
                for (auto* d : service->devices()) pool.push_back(d->idn());
            } else if (cmd == "cancel" && arg == 0) {
                for (const auto& [id, job] : service->timekeeper().get_jobs()) pool.push_back(id);
            } else if (cmd == "archive" && arg == 0) {
                for (const auto& [id, e] : service->timekeeper().archived_jobs()) pool.push_back(id);
            }
        } catch (const std::exception& e) {
            log_debug(std::string("Completion skipped: ") + e.what());
        }
    }

    std::vector<std::string> out;
    std::string upper = to_upper(prefix);
    for (const auto& c : pool) {
        if (to_upper(c).compare(0, upper.size(), upper) == 0) out.push_back(c);
    }
    return out;
}
