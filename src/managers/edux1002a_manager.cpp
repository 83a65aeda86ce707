#include "edux1002a_manager.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

Edux1002aManager::Edux1002aManager(StateStore& state, ResourceManager& rm,
                                   bool hardware_mock, size_t buffer_size)
    : DeviceManager(EDUX1002A_IDN, state, rm, hardware_mock, Edux1002a::make_simulator()),
      buffer_(buffer_size) {}

bool Edux1002aManager::autoscale() {
    return invoke("autoscale", [](std::shared_ptr<DeviceHandle> device) {
        Edux1002a(std::move(device)).autoscale();
    });
}

bool Edux1002aManager::update_buffer(int channel) {
    return invoke(fmt::format("update_buffer({})", channel),
                  [&](std::shared_ptr<DeviceHandle> device) {
                      buffer_.append(channel, Edux1002a(std::move(device)).read_waveform(channel));
                  });
}

std::optional<std::vector<double>> Edux1002aManager::get_data(int channel) {
    if (resource().empty()) return std::nullopt;
    return buffer_.data(channel);
}
