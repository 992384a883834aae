#pragma once

#include <stdexcept>
#include <string>

namespace lanscan::scanner {

class ScanError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The discovery daemon could not be created; the scan did not start.
class DaemonInitError : public ScanError {
public:
    explicit DaemonInitError(const std::string& detail)
        : ScanError("Failed to create mDNS daemon: " + detail) {}
};

// The daemon failed to shut down. The scan is already marked as stopped.
class DaemonShutdownError : public ScanError {
public:
    explicit DaemonShutdownError(const std::string& detail)
        : ScanError("Failed to shutdown mDNS daemon: " + detail) {}
};

class BrowseError : public ScanError {
public:
    BrowseError(const std::string& serviceType, const std::string& detail)
        : ScanError("Failed to browse for service '" + serviceType + "': " + detail) {}
};

// Raised by event sinks when a notification cannot reach the host.
class NotificationDeliveryError : public ScanError {
public:
    NotificationDeliveryError(const std::string& event, const std::string& detail)
        : ScanError("Failed to emit " + event + " event: " + detail) {}
};

}  // namespace lanscan::scanner
