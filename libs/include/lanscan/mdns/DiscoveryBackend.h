#pragma once

#include "lanscan/mdns/ServiceEventStream.h"

#include <memory>
#include <string>

namespace lanscan::mdns {

// Service discovery daemon as seen by the scanner. Implementations report failures by
// throwing std::runtime_error (or a subclass) with a human readable message.
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    virtual void initialize() = 0;

    // Stops the daemon. Every stream handed out by browse() is closed afterwards.
    virtual void shutdown() = 0;

    // Starts browsing `serviceType` (e.g. "_http._tcp.local.") and returns the stream the
    // daemon publishes its events on.
    virtual std::shared_ptr<ServiceEventStream> browse(const std::string& serviceType) = 0;
};

}  // namespace lanscan::mdns
