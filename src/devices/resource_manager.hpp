#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/types.hpp>
#include "transport.hpp"

// Parsed VISA-style resource string.
//   TCPIP0::<host>::<port>::SOCKET
//   USB0::<device path>::INSTR
struct ResourceAddress {
    enum class Kind { Tcpip, Usb, Unknown };
    Kind kind = Kind::Unknown;
    std::string host;       // Tcpip
    int port = 0;           // Tcpip
    std::string device;     // Usb
};

ResourceAddress parse_resource(const std::string& resource);
std::string tcpip_resource(const std::string& host, int port);
std::string usb_resource(const std::string& device_path);

// Enumerates and opens instrument links.
class ResourceManager {
public:
    virtual ~ResourceManager() = default;

    virtual std::vector<std::string> list_resources() = 0;

    // Throws TransportError when the resource cannot be opened.
    virtual std::unique_ptr<Transport> open_resource(const std::string& resource) = 0;
};

// Real links: configured TCP hosts plus any /dev/usbtmc* nodes.
class ScpiResourceManager : public ResourceManager {
public:
    explicit ScpiResourceManager(const InstrumentsConfig& config);

    std::vector<std::string> list_resources() override;
    std::unique_ptr<Transport> open_resource(const std::string& resource) override;

private:
    InstrumentsConfig config_;
};
