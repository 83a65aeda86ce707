#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.mrilabs/config.yaml. A missing file yields the defaults.
    static Result<Config> load_global();

    // Load a specific config file (must exist).
    static Result<Config> load_file(const fs::path& path);

    // Built-in defaults rooted at `home` (data and logs under it).
    static Config defaults(const fs::path& home = fs::path());

    const LabConfig& lab() const { return lab_; }
    LabConfig& lab() { return lab_; }

    fs::path data_dir() const { return lab_.data_dir; }
    fs::path logs_dir() const { return lab_.logs_dir; }

    // Command-line --hardware-mock wins over the file.
    void set_hardware_mock(bool mock) { lab_.hardware_mock = mock; }

public:
    Config() = default;

private:
    LabConfig lab_;
};

bool global_config_exists();

// $MRILABS_HOME, else ~/.mrilabs
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Write the default config.yaml unless one already exists.
Result<void> create_default_global_config();
