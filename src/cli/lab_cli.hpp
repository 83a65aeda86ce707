#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <atomic>

class LabCLI : public BaseCLI {
public:
    LabCLI();

    // Interactive shell. Returns when the user quits, at EOF or on SIGINT.
    void run_repl();

    // Validate an experiment file without touching any instrument.
    // 0 when every step is valid, 1 otherwise.
    int run_check(const std::string& path);

    // Write ~/.mrilabs/config.yaml with the defaults.
    void run_setup();

private:
    void register_all_commands();

    // Scheduler notifications are queued from worker threads and printed
    // before the next prompt.
    void queue_event(const std::string& msg);
    void flush_events();

    std::deque<std::string> events_;
    std::mutex events_mutex_;
    std::atomic<bool> quit_requested_{false};
};
