#include "device.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

std::string normalize_header(const std::string& header) {
    std::string h = header;
    trim(h);
    if (!h.empty() && h[0] == ':') h.erase(0, 1);
    return to_upper(h);
}

// ── HardwareDevice ─────────────────────────────────────────

HardwareDevice::HardwareDevice(std::unique_ptr<Transport> transport, std::string idn)
    : DeviceHandle(std::move(idn)), transport_(std::move(transport)) {}

std::string HardwareDevice::identify() {
    return query(IDN_QUERY);
}

bool HardwareDevice::is_alive() {
    try {
        return identify().find(idn_string()) != std::string::npos;
    } catch (const TransportError& e) {
        log_debug(fmt::format("{} not responding: {}", idn_string(), e.what()));
        return false;
    }
}

void HardwareDevice::write(const std::string& command) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    transport_->write(command);
}

std::string HardwareDevice::query(const std::string& command) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return transport_->query(command);
}

std::string HardwareDevice::resource() const {
    return transport_->resource();
}

// ── SimulatedDevice ────────────────────────────────────────

SimulatedDevice::SimulatedDevice(std::string idn, std::string identity, Model model)
    : DeviceHandle(std::move(idn)),
      identity_(std::move(identity)),
      model_(std::move(model)),
      settings_(model_.initial) {}

void SimulatedDevice::ensure_reachable() const {
    if (killed_.load()) {
        throw TransportError(fmt::format("{}: simulated device is offline", idn_string()));
    }
}

std::string SimulatedDevice::identify() {
    return query(IDN_QUERY);
}

bool SimulatedDevice::is_alive() {
    return !killed_.load();
}

void SimulatedDevice::write(const std::string& command) {
    ensure_reachable();
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(command);

    auto space = command.find(' ');
    std::string header = normalize_header(command.substr(0, space));
    std::string value;
    if (space != std::string::npos) {
        value = command.substr(space + 1);
        trim(value);
    }
    if (model_.on_write && model_.on_write(header, value, settings_)) {
        return;
    }
    settings_[header] = value;
}

std::string SimulatedDevice::query(const std::string& command) {
    ensure_reachable();
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(command);

    std::string header = normalize_header(command);
    if (header == IDN_QUERY) {
        return identity_;
    }
    if (model_.on_query) {
        auto answer = model_.on_query(header, settings_);
        if (answer) return *answer;
    }
    if (!header.empty() && header.back() == '?') header.pop_back();
    auto it = settings_.find(header);
    return it != settings_.end() ? it->second : "0";
}

std::vector<std::string> SimulatedDevice::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

SimulatedDevice::Settings SimulatedDevice::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}
