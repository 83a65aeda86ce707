#include "resource_manager.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

static std::vector<std::string> split_fields(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    for (;;) {
        auto pos = s.find("::", start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 2;
    }
}

ResourceAddress parse_resource(const std::string& resource) {
    ResourceAddress addr;
    auto fields = split_fields(resource);
    if (fields.empty()) return addr;

    std::string head = to_upper(fields[0]);
    if (head.rfind("TCPIP", 0) == 0 && fields.size() >= 2) {
        addr.kind = ResourceAddress::Kind::Tcpip;
        addr.host = fields[1];
        addr.port = SCPI_RAW_PORT;
        if (fields.size() >= 4 && to_upper(fields[3]) == "SOCKET") {
            addr.port = safe_stoi(fields[2], SCPI_RAW_PORT);
        }
    } else if (head.rfind("USB", 0) == 0 && fields.size() >= 2) {
        addr.kind = ResourceAddress::Kind::Usb;
        addr.device = fields[1];
    }
    return addr;
}

std::string tcpip_resource(const std::string& host, int port) {
    return fmt::format("TCPIP0::{}::{}::SOCKET", host, port);
}

std::string usb_resource(const std::string& device_path) {
    return fmt::format("USB0::{}::INSTR", device_path);
}

ScpiResourceManager::ScpiResourceManager(const InstrumentsConfig& config)
    : config_(config) {}

std::vector<std::string> ScpiResourceManager::list_resources() {
    std::vector<std::string> resources;

    for (const auto& entry : config_.tcpip) {
        std::string host = entry;
        int port = SCPI_RAW_PORT;
        auto colon = entry.rfind(':');
        if (colon != std::string::npos) {
            host = entry.substr(0, colon);
            port = safe_stoi(entry.substr(colon + 1), SCPI_RAW_PORT);
        }
        if (!host.empty()) {
            resources.push_back(tcpip_resource(host, port));
        }
    }

    if (config_.usbtmc) {
        for (const auto& dev : platform::list_prefixed("/dev", "usbtmc")) {
            resources.push_back(usb_resource(dev.string()));
        }
    }

    return resources;
}

std::unique_ptr<Transport> ScpiResourceManager::open_resource(const std::string& resource) {
    auto addr = parse_resource(resource);
    switch (addr.kind) {
        case ResourceAddress::Kind::Tcpip:
            return std::make_unique<TcpTransport>(resource, addr.host, addr.port,
                                                  SCPI_CONNECT_TIMEOUT_MS, config_.timeout_ms);
        case ResourceAddress::Kind::Usb:
            return std::make_unique<UsbtmcTransport>(resource, addr.device, config_.timeout_ms);
        case ResourceAddress::Kind::Unknown:
            break;
    }
    throw TransportError("Unsupported resource: " + resource);
}
