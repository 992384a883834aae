#pragma once

#include "lanscan/common/Device.h"
#include "lanscan/mdns/ServiceEventStream.h"
#include "lanscan/scanner/ScanEventSink.h"
#include "lanscan/scanner/ScanSession.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace lanscan::scanner {

// Drains the event stream of one browsed service type on its own thread and feeds
// admitted resolutions into the registry of the session it was started for.
class CategoryConsumer {
public:
    CategoryConsumer(std::shared_ptr<mdns::ServiceEventStream> stream,
                     std::shared_ptr<ScanSession> session,
                     std::shared_ptr<ScanEventSink> sink);
    ~CategoryConsumer();

    CategoryConsumer(const CategoryConsumer&) = delete;
    CategoryConsumer& operator=(const CategoryConsumer&) = delete;

    const std::string& serviceType() const noexcept { return serviceType_; }

    void start();
    void join();
    bool finished() const noexcept { return finished_.load(); }

    // Closes the stream from our side, for teardown when the daemon could not do it.
    void closeStream();

    void handleEvent(const mdns::ServiceEvent& event);

    // Filters, deduplicates and merges one resolution. Returns the merged device when the
    // resolution was admitted. Nothing is admitted once the session is retired.
    std::optional<common::Device> admit(const mdns::ResolvedService& info, std::uint64_t elapsedMs);

private:
    void run();

    const std::string serviceType_;
    std::shared_ptr<mdns::ServiceEventStream> stream_;
    std::shared_ptr<ScanSession> session_;
    std::shared_ptr<ScanEventSink> sink_;
    std::thread worker_;
    std::atomic_bool finished_{false};
};

}  // namespace lanscan::scanner
