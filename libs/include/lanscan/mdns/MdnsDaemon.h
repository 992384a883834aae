#pragma once

#include "lanscan/common/IoContextRunner.h"
#include "lanscan/mdns/DiscoveryBackend.h"
#include "lanscan/mdns/ServiceResolver.h"

#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanscan::mdns {

struct MdnsDaemonOptions {
    // IPv4 address of the interface to browse on; all interfaces when empty.
    std::optional<std::string> interfaceAddress;
    std::chrono::milliseconds queryInterval{1000};
    std::chrono::milliseconds maxQueryInterval{20000};
};

// Multicast DNS-SD browser on 224.0.0.251:5353. Each initialize()/shutdown() pair is one
// daemon lifetime; browse() is only valid in between.
class MdnsDaemon : public DiscoveryBackend {
public:
    explicit MdnsDaemon(MdnsDaemonOptions options = {});
    ~MdnsDaemon() override;

    MdnsDaemon(const MdnsDaemon&) = delete;
    MdnsDaemon& operator=(const MdnsDaemon&) = delete;

    void initialize() override;
    void shutdown() override;
    std::shared_ptr<ServiceEventStream> browse(const std::string& serviceType) override;

    bool running() const;

private:
    struct BrowseQuery {
        std::string serviceType;
        boost::asio::steady_timer timer;
        std::chrono::milliseconds interval;
    };

    void startReceive();
    void handleReceive(const boost::system::error_code& ec, std::size_t bytesReceived);
    void dispatch(ServiceResolver::Outcome outcome);
    void scheduleQuery(BrowseQuery& query);
    void sendQuestions(const std::vector<Question>& questions);
    void closeStreams();

    const MdnsDaemonOptions options_;
    mutable std::mutex mutex_;
    bool running_{false};
    bool unicastFallback_{false};
    std::unique_ptr<common::IoContextRunner> runner_;
    std::unique_ptr<boost::asio::ip::udp::socket> socket_;
    boost::asio::ip::udp::endpoint groupEndpoint_;
    boost::asio::ip::udp::endpoint senderEndpoint_;
    std::array<std::uint8_t, 9000> buffer_{};

    // Touched on the io thread only.
    ServiceResolver resolver_;
    std::vector<std::unique_ptr<BrowseQuery>> queries_;

    std::mutex streamsMutex_;
    std::vector<std::shared_ptr<ServiceEventStream>> streams_;
};

}  // namespace lanscan::mdns
