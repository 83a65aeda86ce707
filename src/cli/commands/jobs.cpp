#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <vector>
#include <algorithm>
#include <fmt/format.h>
#include <core/log.hpp>
#include <core/time_utils.hpp>

// ── Helpers ──────────────────────────────────────────────────

static std::string short_kwargs(const nlohmann::json& kwargs) {
    if (!kwargs.is_object() || kwargs.empty()) return "-";
    std::string out;
    for (auto it = kwargs.begin(); it != kwargs.end(); ++it) {
        if (!out.empty()) out += " ";
        out += it.key() + "=" + (it->is_string() ? it->get<std::string>() : it->dump());
    }
    return out;
}

static std::string status_text(const ArchiveEntry& e) {
    return theme::badge(e.status, !e.failed(), 10);
}

// ── Commands ─────────────────────────────────────────────────

static void do_schedule(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    auto words = split_args(arg, true);
    if (words.size() < 2) {
        std::cout << theme::fail("Usage: schedule <task> <when> [key=value ...]");
        std::cout << theme::step("when: now, +SECONDS, HH:MM[:SS] or YYYY-MM-DDTHH:MM:SS");
        return;
    }

    auto when = parse_when(words[1]);
    if (!when) {
        std::cout << theme::fail("Cannot read time: " + words[1]);
        return;
    }

    std::vector<std::string> rest(words.begin() + 2, words.end());
    auto kwargs = parse_kwargs(rest);
    if (kwargs.is_err()) {
        std::cout << theme::fail(kwargs.error);
        return;
    }

    auto report = cli.service->validate(words[0], kwargs.value);
    if (!report.ok) {
        print_report(report);
        return;
    }

    auto result = cli.service->schedule(words[0], *when, kwargs.value);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    print_report(report);
    std::cout << theme::ok(fmt::format("Scheduled {} for {}", result.value, to_iso_ms(*when)));
}

static void do_jobs(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    auto jobs = cli.service->timekeeper().get_jobs();
    auto running = cli.service->timekeeper().in_flight_jobs();
    for (const auto& [id, job] : running) {
        std::cout << "    " << theme::yellow(id) << theme::dim("  running since " + job.claimed_at)
                  << "\n";
    }
    if (jobs.empty()) {
        std::cout << theme::dim("    No pending jobs.") << "\n";
        return;
    }

    std::vector<Job> ordered;
    for (const auto& [id, job] : jobs) ordered.push_back(job);
    std::sort(ordered.begin(), ordered.end(), fires_before);

    std::string now = to_iso_ms(Clock::now());
    std::cout << theme::section(fmt::format("Pending jobs ({})", ordered.size()));
    for (const auto& job : ordered) {
        std::string when = to_iso_ms(job.schedule_time);
        std::string eta = job.schedule_time > Clock::now() ? "in " + format_duration(now, when)
                                                           : "due";
        std::cout << "    " << theme::blue(job.job_id) << "\n";
        std::cout << theme::color::DIM
                  << fmt::format("      {:<8}{:<10}{:<22}", format_timestamp(when), eta, job.task)
                  << theme::color::RESET << short_kwargs(job.kwargs) << "\n";
    }
    std::cout << "\n";
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    if (arg.empty()) {
        std::cout << theme::fail("Usage: cancel <job-id>");
        return;
    }
    if (cli.service->timekeeper().cancel_job(arg)) {
        std::cout << theme::ok("Cancelled " + arg);
    } else {
        std::cout << theme::fail("No pending job " + arg);
        if (cli.service->timekeeper().in_flight_jobs().count(arg)) {
            std::cout << theme::step("It is already dispatching and cannot be stopped.");
        } else if (cli.service->timekeeper().archive_entry(arg)) {
            std::cout << theme::step("It already ran; see 'archive " + arg + "'.");
        }
    }
}

static void do_archive(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto& tk = cli.service->timekeeper();

    if (!arg.empty()) {
        auto entry = tk.archive_entry(arg);
        if (!entry) {
            std::cout << theme::fail("Not in archive: " + arg);
            return;
        }
        std::cout << theme::section(entry->job_id);
        std::cout << theme::kv("Task", entry->task);
        std::cout << theme::kv("Scheduled", entry->schedule_time);
        std::cout << theme::kv("Completed", entry->completion_time);
        std::cout << theme::kv("Delay", format_duration(entry->schedule_time, entry->completion_time));
        std::cout << theme::kv("Status", status_text(*entry));
        std::cout << theme::kv("Result", entry->result);
        std::cout << theme::kv("Arguments", short_kwargs(entry->kwargs));
        std::cout << theme::kv("Log", job_log_path(entry->job_id));
        std::cout << "\n";
        return;
    }

    auto entries = tk.archived_jobs();
    if (entries.empty()) {
        std::cout << theme::dim("    Archive is empty.") << "\n";
        return;
    }

    std::vector<ArchiveEntry> ordered;
    for (const auto& [id, e] : entries) ordered.push_back(e);
    std::sort(ordered.begin(), ordered.end(), [](const ArchiveEntry& a, const ArchiveEntry& b) {
        return a.completion_time < b.completion_time;
    });

    std::cout << theme::section(fmt::format("Archive ({})", ordered.size()));
    for (const auto& e : ordered) {
        std::cout << "    " << status_text(e) << e.job_id << "\n";
        std::cout << theme::color::DIM << "              " << e.result
                  << theme::color::RESET << "\n";
    }
    std::cout << "\n";
}

static void do_clear_archive(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    cli.service->timekeeper().clear_archive();
    std::cout << theme::ok("Archive cleared");
}

static void do_experiment(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    if (arg.empty()) {
        std::cout << theme::fail("Usage: experiment <file.yaml>");
        return;
    }

    auto run = cli.service->run_experiment_file(arg);
    for (const auto& s : run.report.steps) {
        if (s.ok) {
            std::cout << theme::ok(s.label);
        } else {
            std::cout << theme::fail(fmt::format("{}: {}", s.label, s.message));
        }
    }
    if (!run.report.ok) {
        std::cout << theme::fail(fmt::format("{}: {}", error_level_name(run.report.level),
                                             run.report.error.empty() ? "experiment not scheduled"
                                                                      : run.report.error));
        return;
    }
    if (!run.error.empty()) {
        std::cout << theme::fail(run.error);
    }
    for (const auto& id : run.job_ids) {
        std::cout << theme::step(id);
    }
    std::cout << theme::ok(fmt::format("{} step(s) scheduled", run.job_ids.size()));
}

void register_job_commands(BaseCLI& cli) {
    cli.add_command("schedule", do_schedule, "Schedule a task: schedule <task> <when> k=v ...");
    cli.add_command("jobs", do_jobs, "List pending jobs in firing order");
    cli.add_command("cancel", do_cancel, "Cancel a pending job");
    cli.add_command("archive", do_archive, "Show completed jobs, or one job's outcome");
    cli.add_command("clear-archive", do_clear_archive, "Delete all archived outcomes");
    cli.add_command("experiment", do_experiment, "Validate and schedule an experiment file");
}
