#pragma once

#include <optional>
#include <devices/dg4202.hpp>
#include "device_manager.hpp"

// Signal generator capability set. Each call returns false (and logs) when
// the generator is absent or rejects the command.
class Dg4202Manager : public DeviceManager {
public:
    Dg4202Manager(StateStore& state, ResourceManager& rm, bool hardware_mock);

    bool output_on_off(int channel, bool status);
    bool set_waveform(const WaveformParams& params);
    bool set_sweep(int channel, const SweepParams& params);

    // nullopt when the generator is absent or does not answer.
    std::optional<GeneratorChannelStatus> channel_status(int channel);
};
