#pragma once

#include <string>
#include <vector>
#include <memory>
#include "device.hpp"

// Keysight EDUX1002A two-channel oscilloscope.
class Edux1002a {
public:
    static constexpr int kChannels = 2;

    explicit Edux1002a(std::shared_ptr<DeviceHandle> handle);

    // Front-panel "Auto Scale". Throws TransportError.
    void autoscale();

    // Current trace of one channel in volts. Throws TransportError, or
    // std::invalid_argument for a bad channel.
    std::vector<double> read_waveform(int channel);

    DeviceHandle& handle() { return *handle_; }

    // In-process EDUX1002A producing a sine trace per channel.
    static std::shared_ptr<SimulatedDevice> make_simulator();

private:
    std::shared_ptr<DeviceHandle> handle_;
};

// Parses a ":WAVeform:DATA?" ASCII response: an optional IEEE 488.2 block
// header ("#800001234") followed by comma-separated values.
std::vector<double> parse_waveform_data(const std::string& response);
