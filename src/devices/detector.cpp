#include "detector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

DeviceDetector::DeviceDetector(ResourceManager& rm, std::string idn_string)
    : rm_(rm), idn_string_(std::move(idn_string)) {}

std::unique_ptr<DeviceHandle> DeviceDetector::detect_device() {
    std::vector<std::string> resources;
    try {
        resources = rm_.list_resources();
    } catch (const std::exception& e) {
        log_error(fmt::format("Resource enumeration failed: {}", e.what()));
        return nullptr;
    }

    for (const auto& resource : resources) {
        auto kind = parse_resource(resource).kind;
        if (kind == ResourceAddress::Kind::Unknown) continue;

        try {
            auto transport = rm_.open_resource(resource);
            std::string idn = transport->query(IDN_QUERY);
            if (idn.find(idn_string_) != std::string::npos) {
                log_info(fmt::format("Found {} at {}", idn_string_, resource));
                return std::make_unique<HardwareDevice>(std::move(transport), idn_string_);
            }
        } catch (const TransportError& e) {
            log_debug(fmt::format("Probe of {} for {} failed: {}", resource, idn_string_, e.what()));
        }
    }
    return nullptr;
}
