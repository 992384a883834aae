#pragma once

#include "lanscan/common/Device.h"
#include "lanscan/mdns/DiscoveryBackend.h"
#include "lanscan/mdns/ServiceEventStream.h"
#include "lanscan/scanner/ScanErrors.h"
#include "lanscan/scanner/ScanEventSink.h"

#include <boost/asio/ip/address.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace lanscan::test {

inline mdns::ResolvedService makeResolved(const std::string& fullname,
                                          std::uint16_t port,
                                          const std::vector<std::string>& addresses) {
    mdns::ResolvedService info;
    info.fullname = fullname;
    info.hostname = fullname.substr(0, fullname.find('.')) + ".local.";
    info.port = port;
    for (const auto& address : addresses) {
        info.addresses.push_back(boost::asio::ip::make_address(address));
    }
    return info;
}

class FakeDiscoveryBackend : public mdns::DiscoveryBackend {
public:
    void initialize() override {
        std::unique_lock lock(mutex_);
        ++initializeCalls_;
        initializeEntered_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return !holdInitialize_; });
        if (failInitialize_) {
            throw std::runtime_error("address already in use");
        }
        streams_.clear();
    }

    void shutdown() override {
        std::map<std::string, std::shared_ptr<mdns::ServiceEventStream>> streams;
        {
            std::lock_guard lock(mutex_);
            ++shutdownCalls_;
            if (failShutdown_) {
                throw std::runtime_error("daemon unresponsive");
            }
            streams = streams_;
        }
        for (auto& [type, stream] : streams) {
            stream->push(mdns::ServiceEvent::searchStopped(type));
            stream->close();
        }
    }

    std::shared_ptr<mdns::ServiceEventStream> browse(const std::string& serviceType) override {
        std::lock_guard lock(mutex_);
        if (refusedTypes_.count(serviceType) > 0) {
            throw std::runtime_error("browse refused");
        }
        auto stream = std::make_shared<mdns::ServiceEventStream>(serviceType);
        stream->push(mdns::ServiceEvent::searchStarted(serviceType));
        streams_[serviceType] = stream;
        return stream;
    }

    void failInitialize(bool fail) {
        std::lock_guard lock(mutex_);
        failInitialize_ = fail;
    }

    void failShutdown(bool fail) {
        std::lock_guard lock(mutex_);
        failShutdown_ = fail;
    }

    void refuse(const std::string& serviceType) {
        std::lock_guard lock(mutex_);
        refusedTypes_.insert(serviceType);
    }

    // initialize() blocks until releaseInitialize().
    void holdInitialize() {
        std::lock_guard lock(mutex_);
        holdInitialize_ = true;
        initializeEntered_ = false;
    }

    void releaseInitialize() {
        {
            std::lock_guard lock(mutex_);
            holdInitialize_ = false;
        }
        cv_.notify_all();
    }

    bool waitForInitialize(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return initializeEntered_; });
    }

    std::shared_ptr<mdns::ServiceEventStream> stream(const std::string& serviceType) const {
        std::lock_guard lock(mutex_);
        auto it = streams_.find(serviceType);
        return it == streams_.end() ? nullptr : it->second;
    }

    std::size_t streamCount() const {
        std::lock_guard lock(mutex_);
        return streams_.size();
    }

    int initializeCalls() const {
        std::lock_guard lock(mutex_);
        return initializeCalls_;
    }

    int shutdownCalls() const {
        std::lock_guard lock(mutex_);
        return shutdownCalls_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::shared_ptr<mdns::ServiceEventStream>> streams_;
    std::set<std::string> refusedTypes_;
    bool failInitialize_{false};
    bool failShutdown_{false};
    bool holdInitialize_{false};
    bool initializeEntered_{false};
    int initializeCalls_{0};
    int shutdownCalls_{0};
};

class RecordingEventSink : public scanner::ScanEventSink {
public:
    void onNewDevice(const common::Device& device) override {
        {
            std::unique_lock lock(mutex_);
            ++pendingDevices_;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !holdDevices_; });
            --pendingDevices_;
            if (failNewDevice_) {
                throw scanner::NotificationDeliveryError("new-device", "host window closed");
            }
            devices_.push_back(device);
        }
        cv_.notify_all();
    }

    void onScanTick(std::uint64_t secondsLeft) override {
        {
            std::lock_guard lock(mutex_);
            ticks_.push_back(secondsLeft);
        }
        cv_.notify_all();
    }

    void onScanStopped() override {
        {
            std::lock_guard lock(mutex_);
            ++stopped_;
        }
        cv_.notify_all();
    }

    void failNewDevice(bool fail) {
        std::lock_guard lock(mutex_);
        failNewDevice_ = fail;
    }

    // New-device deliveries block inside the sink until releaseDevices().
    void holdDevices() {
        std::lock_guard lock(mutex_);
        holdDevices_ = true;
    }

    void releaseDevices() {
        {
            std::lock_guard lock(mutex_);
            holdDevices_ = false;
        }
        cv_.notify_all();
    }

    bool waitForPendingDevices(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return pendingDevices_ >= count; });
    }

    bool waitForTick(std::uint64_t secondsLeft, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] {
            for (auto tick : ticks_) {
                if (tick == secondsLeft) {
                    return true;
                }
            }
            return false;
        });
    }

    bool waitForDevices(std::size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return devices_.size() >= count; });
    }

    bool waitForStopped(int count = 1, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return stopped_ >= count; });
    }

    std::vector<common::Device> devices() const {
        std::lock_guard lock(mutex_);
        return devices_;
    }

    std::vector<std::uint64_t> ticks() const {
        std::lock_guard lock(mutex_);
        return ticks_;
    }

    int stoppedCount() const {
        std::lock_guard lock(mutex_);
        return stopped_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<common::Device> devices_;
    std::vector<std::uint64_t> ticks_;
    int stopped_{0};
    int pendingDevices_{0};
    bool failNewDevice_{false};
    bool holdDevices_{false};
};

}  // namespace lanscan::test
