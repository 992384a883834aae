#include "lanscan/mdns/ServiceEventStream.h"

#include <utility>

namespace lanscan::mdns {

ServiceEvent ServiceEvent::searchStarted(std::string serviceType) {
    ServiceEvent event;
    event.kind = ServiceEventKind::SearchStarted;
    event.serviceType = std::move(serviceType);
    return event;
}

ServiceEvent ServiceEvent::searchStopped(std::string serviceType) {
    ServiceEvent event;
    event.kind = ServiceEventKind::SearchStopped;
    event.serviceType = std::move(serviceType);
    return event;
}

ServiceEvent ServiceEvent::found(std::string serviceType, std::string fullname) {
    ServiceEvent event;
    event.kind = ServiceEventKind::ServiceFound;
    event.serviceType = std::move(serviceType);
    event.fullname = std::move(fullname);
    return event;
}

ServiceEvent ServiceEvent::removed(std::string serviceType, std::string fullname) {
    ServiceEvent event;
    event.kind = ServiceEventKind::ServiceRemoved;
    event.serviceType = std::move(serviceType);
    event.fullname = std::move(fullname);
    return event;
}

ServiceEvent ServiceEvent::resolvedEvent(std::string serviceType, ResolvedService info) {
    ServiceEvent event;
    event.kind = ServiceEventKind::ServiceResolved;
    event.serviceType = std::move(serviceType);
    event.fullname = info.fullname;
    event.resolved = std::move(info);
    return event;
}

ServiceEventStream::ServiceEventStream(std::string serviceType)
    : serviceType_(std::move(serviceType)) {}

bool ServiceEventStream::push(ServiceEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
    return true;
}

std::optional<ServiceEvent> ServiceEventStream::next() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    ServiceEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void ServiceEventStream::close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ServiceEventStream::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

}  // namespace lanscan::mdns
