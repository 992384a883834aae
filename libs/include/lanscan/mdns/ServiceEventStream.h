#pragma once

#include <boost/asio/ip/address.hpp>

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanscan::mdns {

struct ResolvedService {
    std::string fullname;
    std::string hostname;
    std::uint16_t port{0};
    std::vector<boost::asio::ip::address> addresses;
    std::vector<std::string> txt;
};

enum class ServiceEventKind {
    SearchStarted,
    ServiceFound,
    ServiceResolved,
    ServiceRemoved,
    SearchStopped,
};

struct ServiceEvent {
    ServiceEventKind kind{ServiceEventKind::SearchStarted};
    std::string serviceType;
    // Instance full name for Found/Removed, empty for search events.
    std::string fullname;
    // Populated for ServiceResolved only.
    ResolvedService resolved;

    static ServiceEvent searchStarted(std::string serviceType);
    static ServiceEvent searchStopped(std::string serviceType);
    static ServiceEvent found(std::string serviceType, std::string fullname);
    static ServiceEvent removed(std::string serviceType, std::string fullname);
    static ServiceEvent resolvedEvent(std::string serviceType, ResolvedService info);
};

// Unbounded multi-producer queue of browse events. `next()` blocks until an event is
// available or the stream is closed and drained.
class ServiceEventStream {
public:
    explicit ServiceEventStream(std::string serviceType);

    ServiceEventStream(const ServiceEventStream&) = delete;
    ServiceEventStream& operator=(const ServiceEventStream&) = delete;

    const std::string& serviceType() const noexcept { return serviceType_; }

    // Returns false once the stream is closed.
    bool push(ServiceEvent event);
    std::optional<ServiceEvent> next();
    void close();
    bool closed() const;

private:
    const std::string serviceType_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ServiceEvent> queue_;
    bool closed_{false};
};

}  // namespace lanscan::mdns
