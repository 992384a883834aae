#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include <atomic>
#include <optional>
#include <thread>

namespace lanscan::common {

// Runs an io_context on a dedicated worker thread between start() and stop().
class IoContextRunner {
public:
    IoContextRunner();
    ~IoContextRunner();

    IoContextRunner(const IoContextRunner&) = delete;
    IoContextRunner& operator=(const IoContextRunner&) = delete;

    boost::asio::io_context& context() noexcept { return ioContext_; }

    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

private:
    boost::asio::io_context ioContext_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard_;
    std::thread worker_;
    std::atomic_bool running_{false};
};

}  // namespace lanscan::common
