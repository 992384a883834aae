#include "lanscan/scanner/ScanController.h"

#include "lanscan/scanner/ScanErrors.h"
#include "lanscan/scanner/ServiceCategory.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <utility>

namespace lanscan::scanner {

ScanController::ScanController(std::shared_ptr<mdns::DiscoveryBackend> backend,
                               std::shared_ptr<ScanEventSink> sink,
                               ScanTiming timing)
    : backend_(std::move(backend)),
      sink_(std::move(sink)),
      timing_(timing),
      session_(std::make_shared<ScanSession>()) {
    timerRunner_.start();
}

ScanController::~ScanController() {
    if (isScanning()) {
        try {
            stop();
        } catch (const std::exception& ex) {
            spdlog::error("Failed to stop scan on shutdown: {}", ex.what());
        }
    }
    if (auto countdown = takeCountdown()) {
        countdown->cancel();
    }
    timerRunner_.stop();

    std::vector<std::unique_ptr<CategoryConsumer>> consumers;
    {
        std::lock_guard lock(consumersMutex_);
        consumers.swap(consumers_);
    }
    consumers.clear();
}

void ScanController::start() {
    spdlog::info("start_scan called");
    auto session = std::make_shared<ScanSession>();
    std::shared_ptr<ScanSession> previous;
    {
        std::lock_guard lock(stateMutex_);
        if (state_ != State::Idle) {
            spdlog::info("Scan is already in progress.");
            return;
        }
        state_ = State::Starting;
        stopRequested_ = false;
        previous = std::exchange(session_, session);
    }
    previous->retire();

    if (auto countdown = takeCountdown()) {
        countdown->cancel();
    }

    spdlog::info("Starting LAN scan");
    reapConsumers();

    try {
        backend_->initialize();
    } catch (const std::exception& ex) {
        spdlog::error("Failed to create mDNS daemon: {}", ex.what());
        {
            std::lock_guard lock(stateMutex_);
            state_ = State::Idle;
        }
        throw DaemonInitError(ex.what());
    }

    session->markStarted();
    std::vector<std::unique_ptr<CategoryConsumer>> started;
    for (const auto serviceType : kBrowsedServiceTypes) {
        const std::string type(serviceType);
        spdlog::debug("Browsing for service type: {}", type);

        std::shared_ptr<mdns::ServiceEventStream> stream;
        try {
            stream = backend_->browse(type);
        } catch (const std::exception& ex) {
            spdlog::error("{}", BrowseError(type, ex.what()).what());
            continue;
        }

        auto consumer = std::make_unique<CategoryConsumer>(std::move(stream), session, sink_);
        consumer->start();
        started.push_back(std::move(consumer));
    }

    {
        std::lock_guard lock(consumersMutex_);
        for (auto& consumer : started) {
            consumers_.push_back(std::move(consumer));
        }
    }

    startCountdown(session);

    bool stopNow = false;
    {
        std::lock_guard lock(stateMutex_);
        state_ = State::Scanning;
        stopNow = stopRequested_;
    }
    if (stopNow) {
        spdlog::info("Stop requested during setup");
        try {
            stopSession(session.get());
        } catch (const std::exception& ex) {
            spdlog::error("Failed to stop scan after setup: {}", ex.what());
        }
    }
}

void ScanController::stop() {
    stopSession(nullptr);
}

void ScanController::stopSession(const ScanSession* expected) {
    spdlog::info("Stopping LAN scan");
    {
        std::lock_guard lock(stateMutex_);
        if (expected != nullptr && session_.get() != expected) {
            spdlog::debug("Ignoring stop for a replaced session");
            return;
        }
        switch (state_) {
        case State::Idle:
            spdlog::info("Scan is not running.");
            return;
        case State::Starting:
            spdlog::info("Scan is still starting; stopping once setup completes.");
            stopRequested_ = true;
            return;
        case State::Scanning:
            state_ = State::Idle;
            break;
        }
    }

    if (auto countdown = takeCountdown()) {
        countdown->cancel();
    }

    try {
        backend_->shutdown();
    } catch (const std::exception& ex) {
        spdlog::error("Failed to shutdown mDNS daemon: {}", ex.what());
        throw DaemonShutdownError(ex.what());
    }
    spdlog::info("mDNS daemon shut down.");

    if (sink_) {
        try {
            sink_->onScanStopped();
        } catch (const std::exception& ex) {
            spdlog::error("Failed to emit {} event: {}", kScanStoppedEvent, ex.what());
        }
    }
}

bool ScanController::isScanning() const {
    std::lock_guard lock(stateMutex_);
    return state_ != State::Idle;
}

std::vector<common::Device> ScanController::discoveredDevices() const {
    std::shared_ptr<ScanSession> session;
    {
        std::lock_guard lock(stateMutex_);
        session = session_;
    }
    return session->registry().snapshot();
}

std::shared_ptr<ScanCountdown> ScanController::takeCountdown() {
    std::lock_guard lock(countdownMutex_);
    return std::exchange(countdown_, nullptr);
}

void ScanController::startCountdown(const std::shared_ptr<ScanSession>& session) {
    std::weak_ptr<ScanSession> owner = session;
    auto countdown = ScanCountdown::start(
        timerRunner_.context(),
        timing_.durationTicks,
        timing_.tickInterval,
        [this](std::uint64_t secondsLeft) {
            if (sink_) {
                sink_->onScanTick(secondsLeft);
            }
        },
        [this, owner] {
            if (auto expired = owner.lock()) {
                stopFromCountdown(expired.get());
            }
        });

    std::lock_guard lock(countdownMutex_);
    countdown_ = std::move(countdown);
}

void ScanController::stopFromCountdown(const ScanSession* session) {
    try {
        stopSession(session);
    } catch (const std::exception& ex) {
        spdlog::error("Failed to stop scan automatically: {}", ex.what());
    }
}

void ScanController::reapConsumers() {
    std::lock_guard lock(consumersMutex_);
    consumers_.erase(std::remove_if(consumers_.begin(), consumers_.end(),
                                    [](const std::unique_ptr<CategoryConsumer>& consumer) {
                                        if (!consumer->finished()) {
                                            return false;
                                        }
                                        consumer->join();
                                        return true;
                                    }),
                     consumers_.end());
}

}  // namespace lanscan::scanner
