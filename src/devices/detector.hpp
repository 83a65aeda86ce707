#pragma once

#include <string>
#include <memory>
#include "device.hpp"
#include "resource_manager.hpp"

// Finds the first connected instrument whose identity response contains
// the device class identification string.
class DeviceDetector {
public:
    DeviceDetector(ResourceManager& rm, std::string idn_string);

    // Probes every TCPIP and USB resource in enumeration order.
    // Returns nullptr when nothing matches; probe failures are logged, not thrown.
    std::unique_ptr<DeviceHandle> detect_device();

private:
    ResourceManager& rm_;
    std::string idn_string_;
};
