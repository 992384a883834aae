#include "lanscan/common/DeviceRegistry.h"

#include <algorithm>

namespace lanscan::common {

Device DeviceRegistry::merge(const std::string& ip,
                             const std::string& name,
                             const std::string& serviceType,
                             std::uint16_t port,
                             DeviceType deviceType,
                             std::uint64_t elapsedMs) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = devicesByIp_.try_emplace(ip);
    Device& device = it->second;
    if (inserted) {
        device.ip = ip;
        device.discoveryTimeMs = elapsedMs;
    } else {
        device.discoveryTimeMs = std::min(device.discoveryTimeMs, elapsedMs);
    }
    device.name = name;
    device.addOrUpdateService(serviceType, port, deviceType, elapsedMs);
    return device;
}

std::optional<Device> DeviceRegistry::find(const std::string& ip) const {
    std::lock_guard lock(mutex_);
    auto it = devicesByIp_.find(ip);
    if (it == devicesByIp_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Device> DeviceRegistry::snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<Device> result;
    result.reserve(devicesByIp_.size());
    for (const auto& entry : devicesByIp_) {
        result.push_back(entry.second);
    }
    return result;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard lock(mutex_);
    return devicesByIp_.size();
}

void DeviceRegistry::clear() {
    std::lock_guard lock(mutex_);
    devicesByIp_.clear();
}

}  // namespace lanscan::common
