#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "device.hpp"

// Rigol DG4202 two-channel function/arbitrary waveform generator.

struct WaveformParams {
    int channel = 1;
    std::string waveform_type = "SIN";  // one of dg4202_waveforms()
    double amplitude = 1.0;             // Vpp
    double frequency = 1000.0;          // Hz
    double offset = 0.0;                // V
};

struct SweepParams {
    double fstart = 0.0;       // Hz
    double fstop = 0.0;        // Hz
    double time = 1.0;         // s
    double rtime = 0.0;        // return time, ms
    double htime_start = 0.0;  // start hold, ms
    double htime_stop = 0.0;   // stop hold, ms
};

struct GeneratorChannelStatus {
    bool output_on = false;
    std::string waveform;
    double frequency = 0.0;
    double amplitude = 0.0;
    double offset = 0.0;
};

// Waveform names accepted by set_waveform, in display order.
const std::vector<std::string>& dg4202_waveforms();

// SCPI mnemonic for a waveform name (case-insensitive), e.g. "SQUARE" -> "SQU".
std::optional<std::string> dg4202_waveform_mnemonic(const std::string& name);

class Dg4202 {
public:
    static constexpr int kChannels = 2;

    explicit Dg4202(std::shared_ptr<DeviceHandle> handle);

    // All operations throw TransportError on I/O failure and
    // std::invalid_argument on a bad channel or waveform name.
    void output_on_off(int channel, bool status);
    void set_waveform(const WaveformParams& params);
    void set_sweep_parameters(int channel, const SweepParams& params);
    GeneratorChannelStatus channel_status(int channel);

    DeviceHandle& handle() { return *handle_; }

    // In-process DG4202 that remembers output state and the applied waveform.
    static std::shared_ptr<SimulatedDevice> make_simulator();

private:
    std::shared_ptr<DeviceHandle> handle_;
};
