#include "task_command.hpp"
#include <core/constants.hpp>
#include <managers/dg4202_manager.hpp>
#include <managers/edux1002a_manager.hpp>
#include <fmt/format.h>

namespace {

Result<void> outcome(bool ok, const char* device, const std::string& what) {
    if (ok) return Result<void>::Ok();
    return Result<void>::Err(fmt::format("{} on {} failed (device absent or command rejected)",
                                         what, device));
}

struct Executor {
    Instruments& inst;

    Result<void> operator()(const ToggleOutput& cmd) const {
        return outcome(inst.dg4202.output_on_off(cmd.channel, cmd.status),
                       DG4202_IDN, describe(cmd));
    }

    Result<void> operator()(const ApplyWaveform& cmd) const {
        if (!inst.dg4202.set_waveform(cmd.waveform)) {
            return outcome(false, DG4202_IDN, describe(cmd));
        }
        if (cmd.send_on) {
            return outcome(inst.dg4202.output_on_off(cmd.waveform.channel, true),
                           DG4202_IDN, describe(ToggleOutput{cmd.waveform.channel, true}));
        }
        return Result<void>::Ok();
    }

    Result<void> operator()(const ApplySweep& cmd) const {
        if (!inst.dg4202.set_sweep(cmd.channel, cmd.sweep)) {
            return outcome(false, DG4202_IDN, describe(cmd));
        }
        if (cmd.send_on) {
            return outcome(inst.dg4202.output_on_off(cmd.channel, true),
                           DG4202_IDN, describe(ToggleOutput{cmd.channel, true}));
        }
        return Result<void>::Ok();
    }

    Result<void> operator()(const Autoscale& cmd) const {
        return outcome(inst.edux1002a.autoscale(), EDUX1002A_IDN, describe(cmd));
    }
};

struct Describer {
    std::string operator()(const ToggleOutput& c) const {
        return fmt::format("toggle CH{} {}", c.channel, c.status ? "ON" : "OFF");
    }
    std::string operator()(const ApplyWaveform& c) const {
        return fmt::format("waveform CH{} {} {} Hz {} Vpp offset {} V{}", c.waveform.channel,
                           c.waveform.waveform_type, c.waveform.frequency,
                           c.waveform.amplitude, c.waveform.offset, c.send_on ? " +ON" : "");
    }
    std::string operator()(const ApplySweep& c) const {
        return fmt::format("sweep CH{} {}-{} Hz over {} s{}", c.channel, c.sweep.fstart,
                           c.sweep.fstop, c.sweep.time, c.send_on ? " +ON" : "");
    }
    std::string operator()(const Autoscale&) const {
        return "autoscale";
    }
};

} // namespace

Result<void> execute(const TaskCommand& command, Instruments& instruments) {
    return std::visit(Executor{instruments}, command);
}

std::string describe(const TaskCommand& command) {
    return std::visit(Describer{}, command);
}
