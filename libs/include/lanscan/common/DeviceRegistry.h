#pragma once

#include "lanscan/common/Device.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanscan::common {

// Address-keyed store of devices seen during a scan. All operations take the registry
// mutex for their own duration only and hand out copies.
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Creates or updates the device at `ip`. The name is always replaced by the latest
    // value; discoveryTimeMs keeps the smallest elapsed time merged so far.
    Device merge(const std::string& ip,
                 const std::string& name,
                 const std::string& serviceType,
                 std::uint16_t port,
                 DeviceType deviceType,
                 std::uint64_t elapsedMs);

    std::optional<Device> find(const std::string& ip) const;
    std::vector<Device> snapshot() const;
    std::size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Device> devicesByIp_;
};

}  // namespace lanscan::common
