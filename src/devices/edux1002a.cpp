#include "edux1002a.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <cctype>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace {
constexpr double kTwoPi = 6.283185307179586;
}

Edux1002a::Edux1002a(std::shared_ptr<DeviceHandle> handle) : handle_(std::move(handle)) {}

void Edux1002a::autoscale() {
    handle_->write(":AUToscale");
}

std::vector<double> Edux1002a::read_waveform(int channel) {
    if (channel < 1 || channel > kChannels) {
        throw std::invalid_argument(fmt::format("EDUX1002A has no channel {}", channel));
    }
    handle_->write(fmt::format(":WAVeform:SOURce CHANnel{}", channel));
    handle_->write(":WAVeform:FORMat ASCii");
    return parse_waveform_data(handle_->query(":WAVeform:DATA?"));
}

std::vector<double> parse_waveform_data(const std::string& response) {
    size_t start = 0;
    if (!response.empty() && response[0] == '#' && response.size() > 1 &&
        std::isdigit(static_cast<unsigned char>(response[1]))) {
        start = 2 + static_cast<size_t>(response[1] - '0');
    }

    std::vector<double> values;
    if (start >= response.size()) return values;

    std::stringstream ss(response.substr(start));
    std::string field;
    while (std::getline(ss, field, ',')) {
        trim(field);
        if (field.empty()) continue;
        try {
            values.push_back(std::stod(field));
        } catch (const std::exception&) {
            // Skip malformed samples rather than dropping the trace
        }
    }
    return values;
}

std::shared_ptr<SimulatedDevice> Edux1002a::make_simulator() {
    SimulatedDevice::Model model;
    model.initial["WAVEFORM:SOURCE"] = "CHANNEL1";
    model.initial["WAVEFORM:FORMAT"] = "ASCII";
    model.on_query = [](const std::string& query,
                        const SimulatedDevice::Settings& settings) -> std::optional<std::string> {
        if (query != "WAVEFORM:DATA?") return std::nullopt;

        auto it = settings.find("WAVEFORM:SOURCE");
        int channel = (it != settings.end() && to_upper(it->second) == "CHANNEL2") ? 2 : 1;
        double amplitude = channel == 1 ? 1.0 : 0.5;

        std::string body;
        for (int i = 0; i < MOCK_SCOPE_SAMPLES; ++i) {
            double phase = kTwoPi * i / MOCK_SCOPE_SAMPLES;
            if (i > 0) body += ',';
            body += fmt::format("{:.6f}", amplitude * std::sin(phase));
        }
        return fmt::format("#8{:08d}{}", body.size(), body);
    };
    return std::make_shared<SimulatedDevice>(
        EDUX1002A_IDN, "KEYSIGHT TECHNOLOGIES,EDUX1002A,CN00000001,02.12 (simulated)",
        std::move(model));
}
