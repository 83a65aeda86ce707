#pragma once

#include <string>
#include <variant>
#include <core/types.hpp>
#include <devices/dg4202.hpp>

class Dg4202Manager;
class Edux1002aManager;

// ── Instrument operations a task can request ─────────────────

struct ToggleOutput {
    int channel = 1;
    bool status = false;
};

struct ApplyWaveform {
    WaveformParams waveform;
    bool send_on = false;     // switch the channel output on afterwards
};

struct ApplySweep {
    int channel = 1;
    SweepParams sweep;
    bool send_on = false;
};

struct Autoscale {};

using TaskCommand = std::variant<ToggleOutput, ApplyWaveform, ApplySweep, Autoscale>;

// Device managers a command may be routed to.
struct Instruments {
    Dg4202Manager& dg4202;
    Edux1002aManager& edux1002a;
};

// Run `command` on the matching device manager. Fails when the device is
// absent or refuses the operation.
Result<void> execute(const TaskCommand& command, Instruments& instruments);

// Short human-readable form, e.g. "toggle CH1 ON".
std::string describe(const TaskCommand& command);
