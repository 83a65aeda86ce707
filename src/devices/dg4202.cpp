#include "dg4202.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <stdexcept>
#include <sstream>

namespace {

struct WaveformName {
    const char* name;
    const char* mnemonic;
};

const WaveformName kWaveforms[] = {
    {"SIN", "SIN"},
    {"SQUARE", "SQU"},
    {"RAMP", "RAMP"},
    {"PULSE", "PULS"},
    {"NOISE", "NOIS"},
    {"USER", "USER"},
    {"HARMONIC", "HARM"},
    {"CUSTOM", "CUST"},
    {"DC", "DC"},
};

void check_channel(int channel) {
    if (channel < 1 || channel > Dg4202::kChannels) {
        throw std::invalid_argument(fmt::format("DG4202 has no channel {}", channel));
    }
}

double parse_double(const std::string& s) {
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        return 0.0;
    }
}

} // namespace

const std::vector<std::string>& dg4202_waveforms() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> v;
        for (const auto& w : kWaveforms) v.emplace_back(w.name);
        return v;
    }();
    return names;
}

std::optional<std::string> dg4202_waveform_mnemonic(const std::string& name) {
    std::string upper = to_upper(name);
    for (const auto& w : kWaveforms) {
        if (upper == w.name || upper == w.mnemonic) return std::string(w.mnemonic);
    }
    return std::nullopt;
}

Dg4202::Dg4202(std::shared_ptr<DeviceHandle> handle) : handle_(std::move(handle)) {}

void Dg4202::output_on_off(int channel, bool status) {
    check_channel(channel);
    handle_->write(fmt::format(":OUTPut{}:STATe {}", channel, status ? "ON" : "OFF"));
}

void Dg4202::set_waveform(const WaveformParams& params) {
    check_channel(params.channel);
    auto mnemonic = dg4202_waveform_mnemonic(params.waveform_type);
    if (!mnemonic) {
        throw std::invalid_argument("Unknown waveform type: " + params.waveform_type);
    }
    handle_->write(fmt::format(":SOURce{}:APPLy:{} {},{},{}", params.channel, *mnemonic,
                               params.frequency, params.amplitude, params.offset));
}

void Dg4202::set_sweep_parameters(int channel, const SweepParams& params) {
    check_channel(channel);
    const std::pair<const char*, double> settings[] = {
        {"FREQuency:STARt", params.fstart},
        {"FREQuency:STOP", params.fstop},
        {"SWEep:TIME", params.time},
        {"SWEep:RTIMe", params.rtime},
        {"SWEep:HTIMe:STARt", params.htime_start},
        {"SWEep:HTIMe:STOP", params.htime_stop},
    };
    handle_->write(fmt::format(":SOURce{}:SWEep:STATe ON", channel));
    for (const auto& [header, value] : settings) {
        handle_->write(fmt::format(":SOURce{}:{} {}", channel, header, value));
    }
}

GeneratorChannelStatus Dg4202::channel_status(int channel) {
    check_channel(channel);
    GeneratorChannelStatus st;

    std::string out = handle_->query(fmt::format(":OUTPut{}:STATe?", channel));
    trim(out);
    st.output_on = (to_upper(out) == "ON" || out == "1");

    // "SIN,1000.000000,5.000000,0.000000,0.000000" (quotes optional)
    std::string apply = handle_->query(fmt::format(":SOURce{}:APPLy?", channel));
    apply.erase(std::remove(apply.begin(), apply.end(), '"'), apply.end());
    std::vector<std::string> fields;
    std::stringstream ss(apply);
    std::string field;
    while (std::getline(ss, field, ',')) {
        trim(field);
        fields.push_back(field);
    }
    if (!fields.empty()) st.waveform = fields[0];
    if (fields.size() > 1) st.frequency = parse_double(fields[1]);
    if (fields.size() > 2) st.amplitude = parse_double(fields[2]);
    if (fields.size() > 3) st.offset = parse_double(fields[3]);
    return st;
}

std::shared_ptr<SimulatedDevice> Dg4202::make_simulator() {
    SimulatedDevice::Model model;
    for (int ch = 1; ch <= kChannels; ++ch) {
        model.initial[fmt::format("OUTPUT{}:STATE", ch)] = "OFF";
        model.initial[fmt::format("SOURCE{}:APPLY", ch)] = "SIN,1000,5,0,0";
    }
    // ":SOURce1:APPLy:SQU 1000,2,0" is remembered as SOURCE1:APPLY = "SQU,1000,2,0,0"
    model.on_write = [](const std::string& header, const std::string& value,
                        SimulatedDevice::Settings& settings) {
        auto pos = header.find(":APPLY:");
        if (pos == std::string::npos) return false;
        std::string shape = header.substr(pos + 7);
        settings[header.substr(0, pos + 6)] = shape + "," + value + ",0";
        return true;
    };
    return std::make_shared<SimulatedDevice>(
        DG4202_IDN, "Rigol Technologies,DG4202,DG4E000000001,00.01.14 (simulated)",
        std::move(model));
}
