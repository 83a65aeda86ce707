#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    const char* override_dir = std::getenv("MRILABS_HOME");
    if (override_dir && *override_dir) {
        return fs::path(override_dir);
    }
    return platform::home_dir() / ".mrilabs";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# mrilabs configuration

# Use simulated instruments instead of probing hardware
hardware_mock: false

# Empty means <config dir>/data and <config dir>/logs
data_dir: ""
logs_dir: ""

# Seconds to wait for a state file lock
lock_timeout: 10

# Scheduler evaluation interval
tick_interval_ms: 500

# Samples kept per oscilloscope channel
oscilloscope_buffer_size: 512

instruments:
  tcpip: []        # "host" or "host:port" (raw SCPI socket, default port 5025)
  usbtmc: true     # scan /dev/usbtmc*
  timeout_ms: 2000
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    out.close();
    if (!out) {
        return Result<void>::Err("Failed to write config file at " + config_path.string());
    }
    return Result<void>::Ok();
}

static InstrumentsConfig parse_instruments_config(const YAML::Node& node) {
    InstrumentsConfig inst;
    if (!node || !node.IsMap()) return inst;

    if (node["tcpip"]) {
        if (node["tcpip"].IsSequence()) {
            inst.tcpip = node["tcpip"].as<std::vector<std::string>>(std::vector<std::string>());
        } else if (node["tcpip"].IsScalar()) {
            inst.tcpip.push_back(node["tcpip"].as<std::string>());
        }
    }
    inst.usbtmc = node["usbtmc"].as<bool>(true);
    inst.timeout_ms = node["timeout_ms"].as<int>(SCPI_TIMEOUT_MS);
    return inst;
}

Config Config::defaults(const fs::path& home) {
    fs::path root = home.empty() ? get_global_config_dir() : home;
    Config config;
    config.lab_.data_dir = (root / "data").string();
    config.lab_.logs_dir = (root / "logs").string();
    return config;
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        Config config = defaults(path.parent_path());
        LabConfig& lab = config.lab_;

        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config at " + path.string() + " is not a mapping");
        }

        lab.hardware_mock = root["hardware_mock"].as<bool>(false);

        std::string data_dir = root["data_dir"].as<std::string>("");
        if (!data_dir.empty()) lab.data_dir = data_dir;
        std::string logs_dir = root["logs_dir"].as<std::string>("");
        if (!logs_dir.empty()) lab.logs_dir = logs_dir;

        lab.lock_timeout = root["lock_timeout"].as<int>(LOCK_TIMEOUT_SECS);
        lab.tick_interval_ms = root["tick_interval_ms"].as<int>(TICK_INTERVAL_MS);
        lab.oscilloscope_buffer_size = root["oscilloscope_buffer_size"].as<int>(OSCILLOSCOPE_BUFFER_SIZE);
        lab.instruments = parse_instruments_config(root["instruments"]);

        if (lab.lock_timeout <= 0) {
            return Result<Config>::Err("lock_timeout must be positive");
        }
        if (lab.tick_interval_ms <= 0) {
            return Result<Config>::Err("tick_interval_ms must be positive");
        }
        if (lab.oscilloscope_buffer_size <= 0) {
            return Result<Config>::Err("oscilloscope_buffer_size must be positive");
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_global() {
    if (!global_config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load_file(get_global_config_path());
}
