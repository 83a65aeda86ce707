#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <cstdint>
#include <core/constants.hpp>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct InstrumentsConfig {
    std::vector<std::string> tcpip;   // "host" or "host:port"
    bool usbtmc = true;               // scan /dev/usbtmc*
    int timeout_ms = SCPI_TIMEOUT_MS; // per-command I/O timeout
};

struct LabConfig {
    bool hardware_mock = false;
    std::string data_dir;             // state.json, jobs.json, archive.json
    std::string logs_dir;             // mrilabs.log, jobs/<id>.log
    int lock_timeout = LOCK_TIMEOUT_SECS;   // seconds
    int tick_interval_ms = TICK_INTERVAL_MS;
    int oscilloscope_buffer_size = OSCILLOSCOPE_BUFFER_SIZE;
    InstrumentsConfig instruments;
};

