#pragma once

#include "lanscan/common/DeviceRegistry.h"
#include "lanscan/scanner/SeenServiceSet.h"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace lanscan::scanner {

// State owned by one discovery session. Consumers keep their session alive, so a consumer
// still draining a stopped session writes into that session only.
class ScanSession {
public:
    ScanSession() : startedAt_(std::chrono::steady_clock::now()) {}

    ScanSession(const ScanSession&) = delete;
    ScanSession& operator=(const ScanSession&) = delete;

    common::DeviceRegistry& registry() noexcept { return registry_; }
    const common::DeviceRegistry& registry() const noexcept { return registry_; }
    SeenServiceSet& seen() noexcept { return seen_; }

    // Restarts the elapsed-time clock. Must be called before any consumer runs.
    void markStarted() { startedAt_ = std::chrono::steady_clock::now(); }

    std::uint64_t elapsedMs() const {
        const auto elapsed = std::chrono::steady_clock::now() - startedAt_;
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    }

    // A retired session has been replaced by a newer one; its late events are dropped.
    void retire() noexcept { retired_.store(true); }
    bool retired() const noexcept { return retired_.load(); }

private:
    common::DeviceRegistry registry_;
    SeenServiceSet seen_;
    std::chrono::steady_clock::time_point startedAt_;
    std::atomic_bool retired_{false};
};

}  // namespace lanscan::scanner
