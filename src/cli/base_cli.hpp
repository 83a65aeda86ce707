#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <functional>
#include <core/config.hpp>
#include <managers/lab_service.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    bool require_service();

    // Build the LabService from `config` (replaces any existing one).
    void init_service();
    void clear_service();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Public state
    Config config;
    std::string config_error;             // set when the config file failed to load
    std::unique_ptr<LabService> service;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

    // Tab completion: candidates for `prefix`, given the line text before it.
    // Command names first, then task names, parameter names, devices or job
    // ids depending on the command.
    std::vector<std::string> complete(const std::string& before, const std::string& prefix);

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
