#include "dg4202_manager.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

Dg4202Manager::Dg4202Manager(StateStore& state, ResourceManager& rm, bool hardware_mock)
    : DeviceManager(DG4202_IDN, state, rm, hardware_mock, Dg4202::make_simulator()) {}

bool Dg4202Manager::output_on_off(int channel, bool status) {
    return invoke(fmt::format("output_on_off({}, {})", channel, status ? "ON" : "OFF"),
                  [&](std::shared_ptr<DeviceHandle> device) {
                      Dg4202(std::move(device)).output_on_off(channel, status);
                  });
}

bool Dg4202Manager::set_waveform(const WaveformParams& params) {
    return invoke("set_waveform", [&](std::shared_ptr<DeviceHandle> device) {
        Dg4202(std::move(device)).set_waveform(params);
    });
}

bool Dg4202Manager::set_sweep(int channel, const SweepParams& params) {
    return invoke("set_sweep_parameters", [&](std::shared_ptr<DeviceHandle> device) {
        Dg4202(std::move(device)).set_sweep_parameters(channel, params);
    });
}

std::optional<GeneratorChannelStatus> Dg4202Manager::channel_status(int channel) {
    std::optional<GeneratorChannelStatus> status;
    invoke("channel_status", [&](std::shared_ptr<DeviceHandle> device) {
        status = Dg4202(std::move(device)).channel_status(channel);
    });
    return status;
}
