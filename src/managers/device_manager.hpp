#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <functional>
#include <devices/device.hpp>
#include <devices/resource_manager.hpp>
#include "state_store.hpp"

enum class DeviceState {
    Uninitialized,
    MockAlive,
    MockDead,
    HardwareAlive,
    HardwareAbsent,
};

std::string device_state_name(DeviceState state);

// Owns the connection to one instrument class. In mock mode the handle is a
// simulator that can be killed and revived; otherwise every get_device()
// checks the current link and re-probes the resource manager when it is gone.
// The "<idn>_last_alive" key in the state store follows the result.
class DeviceManager {
public:
    virtual ~DeviceManager() = default;

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    // Current handle, or nullptr while the device is absent (or the
    // simulator is killed). Updates last_alive: set to now on the transition
    // into an alive state, null on absence. Throws LockTimeout.
    std::shared_ptr<DeviceHandle> get_device();

    // Direct liveness check of the current handle; never throws.
    bool is_alive();

    // Time since the stored last_alive, "N/A" when there is none.
    std::string uptime();

    // Administratively kill (true) or revive (false) the simulator.
    void set_mock_state(bool killed);
    bool mock_killed() const;

    DeviceState state() const;
    bool hardware_mock() const { return hardware_mock_; }
    const std::string& idn() const { return idn_; }

    // Resource string of the current handle, empty when absent.
    std::string resource() const;

protected:
    DeviceManager(std::string idn, StateStore& state, ResourceManager& rm,
                  bool hardware_mock, std::shared_ptr<SimulatedDevice> simulator);

    // Resolve the device and run `op` against it. Absence and device errors
    // are logged and reported as false.
    bool invoke(const std::string& operation,
                const std::function<void(std::shared_ptr<DeviceHandle>)>& op);

    // Called under the manager lock whenever get_device() switches handles.
    virtual void on_device_changed() {}

private:
    std::string idn_;
    StateStore& state_;
    ResourceManager& rm_;
    bool hardware_mock_;
    std::shared_ptr<SimulatedDevice> simulator_;

    mutable std::mutex mutex_;
    std::shared_ptr<DeviceHandle> device_;
    DeviceState state_value_ = DeviceState::Uninitialized;

    std::shared_ptr<DeviceHandle> resolve_locked();
    void record_liveness(bool alive);
};
