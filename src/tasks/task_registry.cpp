#include "task_registry.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <devices/dg4202.hpp>
#include <algorithm>

void TaskRegistry::add(TaskSpec spec) {
    for (auto& t : tasks_) {
        if (t.name == spec.name) {
            t = std::move(spec);
            return;
        }
    }
    tasks_.push_back(std::move(spec));
}

const TaskSpec* TaskRegistry::find(const std::string& name) const {
    for (const auto& t : tasks_) {
        if (t.name == name) return &t;
    }

    std::string upper = to_upper(name);
    trim(upper);
    for (const auto& t : tasks_) {
        if (to_upper(t.name) == upper || to_upper(t.display) == upper) return &t;
    }
    return nullptr;
}

std::vector<const TaskSpec*> TaskRegistry::by_device(const std::string& device) const {
    std::vector<const TaskSpec*> out;
    for (const auto& t : tasks_) {
        if (t.device == device) out.push_back(&t);
    }
    return out;
}

std::vector<std::string> TaskRegistry::devices() const {
    std::vector<std::string> out;
    for (const auto& t : tasks_) {
        if (std::find(out.begin(), out.end(), t.device) == out.end()) {
            out.push_back(t.device);
        }
    }
    return out;
}

// ── Built-in tasks ─────────────────────────────────────────

static ParamConstraint channel_choices() {
    return one_of({1, 2});
}

static ParamConstraint waveform_choices() {
    std::vector<nlohmann::json> names;
    for (const auto& w : dg4202_waveforms()) names.emplace_back(w);
    return one_of(std::move(names));
}

TaskRegistry build_default_registry() {
    TaskRegistry reg;

    TaskSpec toggle;
    toggle.name = "DG4202_TOGGLE";
    toggle.display = "Toggle Output";
    toggle.device = DG4202_IDN;
    toggle.description = "Switch a signal generator channel output on or off";
    toggle.params = {
        required_param("channel", ParamType::Int, channel_choices()),
        required_param("status", ParamType::Bool),
    };
    toggle.bind = [](const Kwargs& kw) -> TaskCommand {
        return ToggleOutput{kw.at("channel").get<int>(), kw.at("status").get<bool>()};
    };
    reg.add(std::move(toggle));

    TaskSpec waveform;
    waveform.name = "DG4202_SET_WAVEFORM";
    waveform.display = "Set Waveform Parameters";
    waveform.device = DG4202_IDN;
    waveform.description = "Apply a waveform to a signal generator channel";
    waveform.params = {
        required_param("channel", ParamType::Int, channel_choices()),
        required_param("send_on", ParamType::Bool),
        required_param("waveform_type", ParamType::String, waveform_choices()),
        required_param("amplitude", ParamType::Float),
        required_param("frequency", ParamType::Float, range(0.0)),
        required_param("offset", ParamType::Float, range(0.0, 5.0)),
    };
    waveform.bind = [](const Kwargs& kw) -> TaskCommand {
        ApplyWaveform cmd;
        cmd.waveform.channel = kw.at("channel").get<int>();
        cmd.waveform.waveform_type = kw.at("waveform_type").get<std::string>();
        cmd.waveform.amplitude = kw.at("amplitude").get<double>();
        cmd.waveform.frequency = kw.at("frequency").get<double>();
        cmd.waveform.offset = kw.at("offset").get<double>();
        cmd.send_on = kw.at("send_on").get<bool>();
        return cmd;
    };
    reg.add(std::move(waveform));

    TaskSpec sweep;
    sweep.name = "DG4202_SET_SWEEP";
    sweep.display = "Set Sweep Parameters";
    sweep.device = DG4202_IDN;
    sweep.description = "Configure and enable a frequency sweep";
    sweep.params = {
        required_param("channel", ParamType::Int, channel_choices()),
        required_param("send_on", ParamType::Bool),
        required_param("fstart", ParamType::Float, range(0.0)),
        required_param("fstop", ParamType::Float, range(0.0)),
        required_param("time", ParamType::Float, range(0.0)),
        optional_param("rtime", ParamType::Float, 0.0, range(0.0)),
        optional_param("htime_start", ParamType::Float, 0.0, range(0.0)),
        optional_param("htime_stop", ParamType::Float, 0.0, range(0.0)),
    };
    sweep.bind = [](const Kwargs& kw) -> TaskCommand {
        ApplySweep cmd;
        cmd.channel = kw.at("channel").get<int>();
        cmd.send_on = kw.at("send_on").get<bool>();
        cmd.sweep.fstart = kw.at("fstart").get<double>();
        cmd.sweep.fstop = kw.at("fstop").get<double>();
        cmd.sweep.time = kw.at("time").get<double>();
        cmd.sweep.rtime = kw.at("rtime").get<double>();
        cmd.sweep.htime_start = kw.at("htime_start").get<double>();
        cmd.sweep.htime_stop = kw.at("htime_stop").get<double>();
        return cmd;
    };
    reg.add(std::move(sweep));

    TaskSpec autoscale;
    autoscale.name = "EDUX1002A_AUTO";
    autoscale.display = "Press Auto";
    autoscale.device = EDUX1002A_IDN;
    autoscale.description = "Press the oscilloscope Auto Scale key";
    autoscale.bind = [](const Kwargs&) -> TaskCommand { return Autoscale{}; };
    reg.add(std::move(autoscale));

    return reg;
}
