#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include <functional>
#include <optional>
#include "transport.hpp"

// One instrument connection, real or simulated. Instrument drivers
// (Dg4202, Edux1002a) speak SCPI through this interface and never know
// which implementation sits underneath.
class DeviceHandle {
public:
    virtual ~DeviceHandle() = default;

    // Response to the identity query. Throws TransportError.
    virtual std::string identify() = 0;

    // True while the instrument answers with its identification string.
    // Never throws.
    virtual bool is_alive() = 0;

    // Throws TransportError.
    virtual void write(const std::string& command) = 0;
    virtual std::string query(const std::string& command) = 0;

    virtual bool simulated() const = 0;
    virtual std::string resource() const = 0;

    // Substring expected in identify() for this device class.
    const std::string& idn_string() const { return idn_; }

protected:
    explicit DeviceHandle(std::string idn) : idn_(std::move(idn)) {}

private:
    std::string idn_;
};

// Instrument reached over a Transport. Commands are serialized per handle.
class HardwareDevice : public DeviceHandle {
public:
    HardwareDevice(std::unique_ptr<Transport> transport, std::string idn);

    std::string identify() override;
    bool is_alive() override;
    void write(const std::string& command) override;
    std::string query(const std::string& command) override;
    bool simulated() const override { return false; }
    std::string resource() const override;

private:
    std::unique_ptr<Transport> transport_;
    std::mutex io_mutex_;
};

// In-process stand-in. Set commands ("HEADER value") are remembered per
// header; queries ("HEADER?") are answered by the device-specific responder
// first, then from the remembered settings. A killed simulator refuses all
// I/O as if the cable had been pulled.
class SimulatedDevice : public DeviceHandle {
public:
    using Settings = std::map<std::string, std::string>;

    // Device-specific behaviour. Headers passed to the hooks are normalized.
    struct Model {
        Settings initial;
        // Called for every set command; return true when it stored the value itself.
        std::function<bool(const std::string& header, const std::string& value,
                           Settings& settings)> on_write;
        // Return nullopt to fall through to the settings table.
        std::function<std::optional<std::string>(const std::string& query,
                                                 const Settings& settings)> on_query;
    };

    SimulatedDevice(std::string idn, std::string identity, Model model = Model{});

    std::string identify() override;
    bool is_alive() override;
    void write(const std::string& command) override;
    std::string query(const std::string& command) override;
    bool simulated() const override { return true; }
    std::string resource() const override { return "SIM::" + idn_string(); }

    void set_killed(bool killed) { killed_.store(killed); }
    bool killed() const { return killed_.load(); }

    // Every command and query received, oldest first.
    std::vector<std::string> history() const;
    Settings settings() const;

private:
    std::string identity_;
    Model model_;
    std::atomic<bool> killed_{false};
    mutable std::mutex mutex_;
    Settings settings_;
    std::vector<std::string> history_;

    void ensure_reachable() const;
};

// Upper-cased SCPI header with the optional leading ':' removed, so that
// ":OUTPut1:STATe" and "OUTPUT1:STATE" address the same setting.
std::string normalize_header(const std::string& header);
