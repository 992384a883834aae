#include "lanscan/scanner/ScanCountdown.h"

#include "lanscan/scanner/ScanEventSink.h"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <utility>

namespace lanscan::scanner {

std::shared_ptr<ScanCountdown> ScanCountdown::start(boost::asio::io_context& ioContext,
                                                    std::uint64_t ticks,
                                                    std::chrono::milliseconds interval,
                                                    TickHandler onTick,
                                                    ExpiredHandler onExpired) {
    auto countdown = std::make_shared<ScanCountdown>(
        PrivateTag{}, ioContext, ticks, interval, std::move(onTick), std::move(onExpired));
    boost::asio::post(ioContext, [countdown] { countdown->tick(); });
    return countdown;
}

ScanCountdown::ScanCountdown(PrivateTag,
                             boost::asio::io_context& ioContext,
                             std::uint64_t ticks,
                             std::chrono::milliseconds interval,
                             TickHandler onTick,
                             ExpiredHandler onExpired)
    : timer_(ioContext),
      interval_(interval),
      onTick_(std::move(onTick)),
      onExpired_(std::move(onExpired)),
      remaining_(ticks) {}

void ScanCountdown::cancel() {
    std::lock_guard lock(mutex_);
    if (cancelled_ || expired_) {
        return;
    }
    cancelled_ = true;
    timer_.cancel();
}

bool ScanCountdown::cancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

bool ScanCountdown::expired() const {
    std::lock_guard lock(mutex_);
    return expired_;
}

std::uint64_t ScanCountdown::remaining() const {
    std::lock_guard lock(mutex_);
    return remaining_;
}

void ScanCountdown::tick() {
    std::uint64_t remaining = 0;
    {
        std::lock_guard lock(mutex_);
        if (cancelled_) {
            return;
        }
        remaining = remaining_;
        if (remaining == 0) {
            expired_ = true;
        }
    }

    if (remaining == 0) {
        spdlog::info("Scan timeout reached. Stopping scan automatically.");
        if (onExpired_) {
            onExpired_();
        }
        return;
    }

    spdlog::info("Scan stopping in {} seconds...", remaining);
    if (onTick_) {
        try {
            onTick_(remaining);
        } catch (const std::exception& ex) {
            spdlog::warn("Failed to emit {} event: {}", kScanTickEvent, ex.what());
        }
    }

    std::lock_guard lock(mutex_);
    if (cancelled_) {
        return;
    }
    remaining_ = remaining - 1;
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        self->tick();
    });
}

}  // namespace lanscan::scanner
