#pragma once

#include "../base_cli.hpp"
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include <core/utils.hpp>

// Shared helpers used by the command files (devices.cpp, tasks.cpp, jobs.cpp)

// Whitespace-separated words; double quotes group words. With keep_quotes
// the quote characters stay in the word.
std::vector<std::string> split_args(const std::string& args, bool keep_quotes = false);

// "true"/"on" -> true, "3" -> 3, "2.5" -> 2.5, "\"3\"" -> "3", else the text.
nlohmann::json parse_cli_value(const std::string& text);

// key=value words into a JSON object.
Result<nlohmann::json> parse_kwargs(const std::vector<std::string>& words);

// "+30" (seconds from now), "now", "HH:MM" / "HH:MM:SS" (next occurrence),
// or a local ISO timestamp.
std::optional<TimePoint> parse_when(const std::string& text, TimePoint now = Clock::now());

// Print every error and warning of a report.
void print_report(const ValidationReport& report);

// Forward declarations for command registration
void register_device_commands(BaseCLI& cli);
void register_task_commands(BaseCLI& cli);
void register_job_commands(BaseCLI& cli);
