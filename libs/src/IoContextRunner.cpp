#include "lanscan/common/IoContextRunner.h"

#include <spdlog/spdlog.h>

namespace lanscan::common {

IoContextRunner::IoContextRunner() = default;

IoContextRunner::~IoContextRunner() {
    stop();
}

void IoContextRunner::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }

    ioContext_.restart();
    workGuard_.emplace(boost::asio::make_work_guard(ioContext_));
    worker_ = std::thread([this] {
        try {
            ioContext_.run();
        } catch (const std::exception& ex) {
            spdlog::error("IoContextRunner crashed: {}", ex.what());
        }
    });
}

void IoContextRunner::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false)) {
        return;
    }

    if (workGuard_) {
        workGuard_->reset();
        workGuard_.reset();
    }
    ioContext_.stop();
    if (worker_.joinable()) {
        if (worker_.get_id() == std::this_thread::get_id()) {
            // Stopped from one of our own handlers; the thread exits once run() returns.
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

}  // namespace lanscan::common
