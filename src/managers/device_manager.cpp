#include "device_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <devices/detector.hpp>
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

std::string device_state_name(DeviceState state) {
    switch (state) {
        case DeviceState::Uninitialized:  return "UNINITIALIZED";
        case DeviceState::MockAlive:      return "MOCK_ALIVE";
        case DeviceState::MockDead:       return "MOCK_DEAD";
        case DeviceState::HardwareAlive:  return "HARDWARE_ALIVE";
        case DeviceState::HardwareAbsent: return "HARDWARE_ABSENT";
    }
    return "UNKNOWN";
}

static bool is_alive_state(DeviceState s) {
    return s == DeviceState::MockAlive || s == DeviceState::HardwareAlive;
}

DeviceManager::DeviceManager(std::string idn, StateStore& state, ResourceManager& rm,
                             bool hardware_mock, std::shared_ptr<SimulatedDevice> simulator)
    : idn_(std::move(idn)),
      state_(state),
      rm_(rm),
      hardware_mock_(hardware_mock),
      simulator_(std::move(simulator)) {}

std::shared_ptr<DeviceHandle> DeviceManager::get_device() {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolve_locked();
}

std::shared_ptr<DeviceHandle> DeviceManager::resolve_locked() {
    DeviceState previous = state_value_;
    std::shared_ptr<DeviceHandle> device;

    if (hardware_mock_) {
        if (!simulator_->killed()) {
            device = simulator_;
            state_value_ = DeviceState::MockAlive;
        } else {
            state_value_ = DeviceState::MockDead;
        }
    } else {
        if (device_ && !device_->simulated() && device_->is_alive()) {
            device = device_;
        } else {
            DeviceDetector detector(rm_, idn_);
            device = detector.detect_device();
        }
        state_value_ = device ? DeviceState::HardwareAlive : DeviceState::HardwareAbsent;
    }

    if (device != device_) {
        device_ = device;
        on_device_changed();
    }
    if (previous != state_value_) {
        log_info(fmt::format("{}: {} -> {}", idn_, device_state_name(previous),
                             device_state_name(state_value_)));
    }

    bool alive = is_alive_state(state_value_);
    auto stored = state_.get_device_last_alive(idn_);
    if (alive) {
        // Keep the first-seen time while the device stays up
        if (!is_alive_state(previous) || !stored) {
            state_.set_device_last_alive(idn_, now_epoch());
        }
    } else if (stored || previous == DeviceState::Uninitialized || is_alive_state(previous)) {
        state_.set_device_last_alive(idn_, std::nullopt);
    }
    return device_;
}

bool DeviceManager::is_alive() {
    std::shared_ptr<DeviceHandle> device;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        device = device_;
    }
    if (hardware_mock_) {
        return !simulator_->killed();
    }
    return device && device->is_alive();
}

std::string DeviceManager::uptime() {
    auto last_alive = state_.get_device_last_alive(idn_);
    if (!last_alive) return NOT_AVAILABLE;
    auto secs = static_cast<long long>(std::floor(now_epoch() - *last_alive));
    return format_elapsed(secs);
}

void DeviceManager::set_mock_state(bool killed) {
    simulator_->set_killed(killed);
    log_info(fmt::format("{}: simulator {}", idn_, killed ? "killed" : "revived"));
}

bool DeviceManager::mock_killed() const {
    return simulator_->killed();
}

DeviceState DeviceManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_value_;
}

std::string DeviceManager::resource() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return device_ ? device_->resource() : "";
}

bool DeviceManager::invoke(const std::string& operation,
                           const std::function<void(std::shared_ptr<DeviceHandle>)>& op) {
    auto device = get_device();
    if (!device) {
        log_error(fmt::format("No device instance available for {} ({})", idn_, operation));
        return false;
    }
    try {
        op(device);
        return true;
    } catch (const TransportError& e) {
        log_error(fmt::format("{} failed on {}: {}", operation, idn_, e.what()));
    } catch (const std::invalid_argument& e) {
        log_error(fmt::format("{} rejected by {}: {}", operation, idn_, e.what()));
    }
    return false;
}
