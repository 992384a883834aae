#pragma once

#include "lanscan/common/Device.h"
#include "lanscan/common/IoContextRunner.h"
#include "lanscan/mdns/DiscoveryBackend.h"
#include "lanscan/scanner/CategoryConsumer.h"
#include "lanscan/scanner/ScanCountdown.h"
#include "lanscan/scanner/ScanEventSink.h"
#include "lanscan/scanner/ScanSession.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace lanscan::scanner {

struct ScanTiming {
    std::uint64_t durationTicks{30};
    std::chrono::milliseconds tickInterval{1000};
};

// Idle/Starting/Scanning state machine around one discovery backend. start() and stop()
// only perform setup and teardown; discovery itself runs on consumer threads and the
// countdown stops the scan once the time budget is used up. Every start() opens a fresh
// ScanSession and retires the previous one.
class ScanController {
public:
    ScanController(std::shared_ptr<mdns::DiscoveryBackend> backend,
                   std::shared_ptr<ScanEventSink> sink,
                   ScanTiming timing = {});
    ~ScanController();

    ScanController(const ScanController&) = delete;
    ScanController& operator=(const ScanController&) = delete;

    // Throws DaemonInitError when the backend cannot be initialized. No-op unless idle.
    void start();

    // Throws DaemonShutdownError when the backend fails to shut down; the controller is
    // idle afterwards either way. No-op while idle. While start() is still setting up, the
    // stop is recorded and carried out by start() once setup completes.
    void stop();

    bool isScanning() const;
    std::vector<common::Device> discoveredDevices() const;

private:
    enum class State {
        Idle,
        Starting,
        Scanning,
    };

    std::shared_ptr<ScanCountdown> takeCountdown();
    void startCountdown(const std::shared_ptr<ScanSession>& session);
    void reapConsumers();
    // `expected` limits the stop to that session; null stops whatever is running.
    void stopSession(const ScanSession* expected);
    void stopFromCountdown(const ScanSession* session);

    std::shared_ptr<mdns::DiscoveryBackend> backend_;
    std::shared_ptr<ScanEventSink> sink_;
    const ScanTiming timing_;

    common::IoContextRunner timerRunner_;

    mutable std::mutex stateMutex_;
    State state_{State::Idle};
    bool stopRequested_{false};
    std::shared_ptr<ScanSession> session_;

    std::mutex countdownMutex_;
    std::shared_ptr<ScanCountdown> countdown_;

    std::mutex consumersMutex_;
    std::vector<std::unique_ptr<CategoryConsumer>> consumers_;
};

}  // namespace lanscan::scanner
