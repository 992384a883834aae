#pragma once

#include "lanscan/common/Device.h"

#include <cstdint>
#include <string_view>

namespace lanscan::scanner {

inline constexpr std::string_view kNewDeviceEvent = "new-device";
inline constexpr std::string_view kScanTickEvent = "scan-tick";
inline constexpr std::string_view kScanStoppedEvent = "scan-stopped";

// Outbound notifications towards the host. Called from consumer and countdown threads;
// implementations may throw NotificationDeliveryError, which the scanner logs and drops.
class ScanEventSink {
public:
    virtual ~ScanEventSink() = default;

    virtual void onNewDevice(const common::Device& device) = 0;
    virtual void onScanTick(std::uint64_t secondsLeft) = 0;
    virtual void onScanStopped() = 0;
};

}  // namespace lanscan::scanner
