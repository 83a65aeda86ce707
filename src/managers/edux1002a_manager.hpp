#pragma once

#include <vector>
#include <optional>
#include <devices/edux1002a.hpp>
#include <devices/waveform_buffer.hpp>
#include "device_manager.hpp"

// Oscilloscope capability set plus the per-channel sample buffers. The
// buffers are emptied whenever the underlying device handle changes.
class Edux1002aManager : public DeviceManager {
public:
    Edux1002aManager(StateStore& state, ResourceManager& rm, bool hardware_mock,
                     size_t buffer_size);

    bool autoscale();

    // Read one trace from `channel` into its buffer.
    bool update_buffer(int channel);

    // Buffered samples, nullopt while no device is attached.
    std::optional<std::vector<double>> get_data(int channel);

    size_t buffer_size() const { return buffer_.capacity(); }

protected:
    void on_device_changed() override { buffer_.clear(); }

private:
    WaveformBuffer buffer_;
};
