#pragma once

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lanscan::common {

enum class DeviceType {
    Bluesound,
    Volumio,
    SpotifyConnect,
    QobuzConnect,
    Generic,
};

std::string_view toString(DeviceType type);

struct DiscoveredService {
    std::string serviceType;
    std::uint16_t port{0};
    DeviceType deviceType{DeviceType::Generic};
    std::uint64_t lastSeenMs{0};

    bool operator==(const DiscoveredService& other) const {
        return serviceType == other.serviceType && port == other.port &&
               deviceType == other.deviceType && lastSeenMs == other.lastSeenMs;
    }
};

// A host on the LAN, keyed by its IPv4 address. One entry per service type seen on it.
struct Device {
    std::string name;
    std::string ip;
    std::uint64_t discoveryTimeMs{0};
    std::vector<DiscoveredService> services;

    void addOrUpdateService(const std::string& serviceType,
                            std::uint16_t port,
                            DeviceType deviceType,
                            std::uint64_t elapsedMs);

    const DiscoveredService* findService(std::string_view serviceType) const;
};

void to_json(nlohmann::json& j, DeviceType type);
void to_json(nlohmann::json& j, const DiscoveredService& service);
void to_json(nlohmann::json& j, const Device& device);

}  // namespace lanscan::common
