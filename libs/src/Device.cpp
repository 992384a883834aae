#include "lanscan/common/Device.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace lanscan::common {

namespace {

using json = nlohmann::json;

constexpr std::array<std::pair<DeviceType, std::string_view>, 5> kDeviceTypeNames{{
    {DeviceType::Bluesound, "Bluesound"},
    {DeviceType::Volumio, "Volumio"},
    {DeviceType::SpotifyConnect, "SpotifyConnect"},
    {DeviceType::QobuzConnect, "QobuzConnect"},
    {DeviceType::Generic, "Generic"},
}};

}  // namespace

std::string_view toString(DeviceType type) {
    for (const auto& [value, name] : kDeviceTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "Generic";
}

void Device::addOrUpdateService(const std::string& serviceType,
                                std::uint16_t port,
                                DeviceType deviceType,
                                std::uint64_t elapsedMs) {
    auto it = std::find_if(services.begin(), services.end(), [&](const DiscoveredService& service) {
        return service.serviceType == serviceType;
    });
    if (it != services.end()) {
        it->port = port;
        it->deviceType = deviceType;
        it->lastSeenMs = elapsedMs;
        return;
    }
    services.push_back(DiscoveredService{serviceType, port, deviceType, elapsedMs});
}

const DiscoveredService* Device::findService(std::string_view serviceType) const {
    for (const auto& service : services) {
        if (service.serviceType == serviceType) {
            return &service;
        }
    }
    return nullptr;
}

void to_json(json& j, DeviceType type) {
    j = std::string(toString(type));
}

void to_json(json& j, const DiscoveredService& service) {
    j = json{
        {"serviceType", service.serviceType},
        {"port", service.port},
        {"deviceType", service.deviceType},
        {"lastSeenMs", service.lastSeenMs},
    };
}

void to_json(json& j, const Device& device) {
    j = json{
        {"name", device.name},
        {"ip", device.ip},
        {"discoveryTimeMs", device.discoveryTimeMs},
        {"services", device.services},
    };
}

}  // namespace lanscan::common
