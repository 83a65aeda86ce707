#include "command_helpers.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>

static void do_status(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto& svc = *cli.service;
    const LabConfig& lab = svc.config().lab();

    std::cout << theme::section("Status");
    if (global_config_exists()) {
        std::cout << theme::kv("Config", get_global_config_path().string());
    } else {
        std::cout << theme::kv("Config", "built-in defaults");
    }
    std::cout << theme::kv("Data", lab.data_dir);
    std::cout << theme::kv("Logs", lab.logs_dir);
    std::cout << theme::kv("Mode", lab.hardware_mock ? theme::yellow("hardware mock") : "hardware");
    std::cout << theme::kv("Uptime", svc.uptime());
    std::cout << theme::kv("Scheduler", svc.timekeeper().running() ? "running" : "stopped");
    std::cout << theme::kv("Pending", std::to_string(svc.timekeeper().get_jobs().size()));
    std::cout << theme::kv("In flight", std::to_string(svc.worker().active()));

    std::cout << "\n";
    for (auto* d : svc.devices()) {
        bool alive = d->get_device() != nullptr;
        std::string state = theme::badge(alive ? "alive" : "absent", alive);
        std::cout << theme::kv(d->idn(), fmt::format("{}  {}", state, theme::dim("up " + d->uptime())));
    }
    std::cout << "\n";
}

static void do_devices(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;

    std::cout << theme::section("Devices");
    std::cout << theme::color::DIM
              << fmt::format("    {:<12}{:<18}{:<12}{}", "DEVICE", "STATE", "UPTIME", "RESOURCE")
              << theme::color::RESET << "\n";
    for (const auto& d : cli.service->list_devices()) {
        std::cout << fmt::format("    {:<12}", d.name) << theme::badge(d.state, d.alive, 18)
                  << fmt::format("{:<12}{}", d.uptime, d.resource.empty() ? "-" : d.resource)
                  << "\n";
    }
    std::cout << "\n";
}

static DeviceManager* device_arg(BaseCLI& cli, const std::string& arg, const char* usage) {
    if (arg.empty()) {
        std::cout << theme::fail(std::string("Usage: ") + usage);
        return nullptr;
    }
    DeviceManager* d = cli.service->device(arg);
    if (!d) {
        std::cout << theme::fail("Unknown device: " + arg);
        std::cout << theme::step("Devices: DG4202, EDUX1002A");
        return nullptr;
    }
    if (!d->hardware_mock()) {
        std::cout << theme::fail(d->idn() + " is real hardware; only simulated devices can be killed or revived.");
        std::cout << theme::step("Restart with --hardware-mock to use simulators.");
        return nullptr;
    }
    return d;
}

static void do_kill(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto* d = device_arg(cli, arg, "kill <device>");
    if (!d) return;
    d->set_mock_state(true);
    d->get_device();
    std::cout << theme::ok(d->idn() + " simulator killed");
}

static void do_revive(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_service()) return;
    auto* d = device_arg(cli, arg, "revive <device>");
    if (!d) return;
    d->set_mock_state(false);
    d->get_device();
    std::cout << theme::ok(d->idn() + " simulator revived");
}

void register_device_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show configuration, scheduler and device status");
    cli.add_command("devices", do_devices, "Probe instruments and list their state");
    cli.add_command("kill", do_kill, "Disconnect a simulated device");
    cli.add_command("revive", do_revive, "Reconnect a simulated device");
}
