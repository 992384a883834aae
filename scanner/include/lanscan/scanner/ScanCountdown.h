#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace lanscan::scanner {

// Counts `ticks` down to zero on an io_context, reporting each remaining value before
// waiting one interval, then fires the expiry handler. Handlers run without the countdown
// lock held. cancel() is final: no tick starts and the expiry handler does not run after it
// returns; a tick handler already running when cancel() is called completes.
class ScanCountdown : public std::enable_shared_from_this<ScanCountdown> {
    struct PrivateTag {};

public:
    using TickHandler = std::function<void(std::uint64_t remaining)>;
    using ExpiredHandler = std::function<void()>;

    static std::shared_ptr<ScanCountdown> start(boost::asio::io_context& ioContext,
                                                std::uint64_t ticks,
                                                std::chrono::milliseconds interval,
                                                TickHandler onTick,
                                                ExpiredHandler onExpired);

    ScanCountdown(PrivateTag,
                  boost::asio::io_context& ioContext,
                  std::uint64_t ticks,
                  std::chrono::milliseconds interval,
                  TickHandler onTick,
                  ExpiredHandler onExpired);

    ScanCountdown(const ScanCountdown&) = delete;
    ScanCountdown& operator=(const ScanCountdown&) = delete;

    void cancel();
    bool cancelled() const;
    bool expired() const;
    std::uint64_t remaining() const;

private:
    void tick();

    boost::asio::steady_timer timer_;
    const std::chrono::milliseconds interval_;
    TickHandler onTick_;
    ExpiredHandler onExpired_;

    mutable std::mutex mutex_;
    std::uint64_t remaining_;
    bool cancelled_{false};
    bool expired_{false};
};

}  // namespace lanscan::scanner
