#include "lanscan/mdns/MdnsDaemon.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/multicast.hpp>
#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lanscan::mdns {

namespace {

namespace asio = boost::asio;
using udp = asio::ip::udp;

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool validServiceType(const std::string& serviceType) {
    if (serviceType.empty() || serviceType.front() != '_') {
        return false;
    }
    const auto canonical = canonicalName(serviceType);
    return endsWith(canonical, "._tcp.local.") || endsWith(canonical, "._udp.local.");
}

}  // namespace

MdnsDaemon::MdnsDaemon(MdnsDaemonOptions options)
    : options_(std::move(options)) {}

MdnsDaemon::~MdnsDaemon() {
    if (!running()) {
        return;
    }
    try {
        shutdown();
    } catch (const std::exception& ex) {
        spdlog::error("Failed to shut down mDNS daemon: {}", ex.what());
    }
}

bool MdnsDaemon::running() const {
    std::lock_guard lock(mutex_);
    return running_;
}

void MdnsDaemon::initialize() {
    std::lock_guard lock(mutex_);
    if (running_) {
        throw std::runtime_error("mDNS daemon already running");
    }

    auto runner = std::make_unique<common::IoContextRunner>();
    auto socket = std::make_unique<udp::socket>(runner->context());
    boost::system::error_code ec;

    auto iface = asio::ip::address_v4::any();
    if (options_.interfaceAddress) {
        iface = asio::ip::make_address_v4(*options_.interfaceAddress, ec);
        if (ec) {
            throw std::runtime_error("Invalid interface address " + *options_.interfaceAddress + ": " + ec.message());
        }
    }

    socket->open(udp::v4(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open mDNS socket: " + ec.message());
    }
    socket->set_option(asio::socket_base::reuse_address(true), ec);
    if (ec) {
        spdlog::warn("Failed to enable address reuse on mDNS socket: {}", ec.message());
    }

    bool fallback = false;
    socket->bind(udp::endpoint(asio::ip::address_v4::any(), kMdnsPort), ec);
    if (ec) {
        spdlog::warn("UDP port {} unavailable ({}); asking for unicast responses instead", kMdnsPort, ec.message());
        socket->bind(udp::endpoint(asio::ip::address_v4::any(), 0), ec);
        if (ec) {
            throw std::runtime_error("Failed to bind mDNS socket: " + ec.message());
        }
        fallback = true;
    }

    const auto group = asio::ip::make_address_v4(kMdnsGroupV4);
    if (!fallback) {
        socket->set_option(asio::ip::multicast::join_group(group, iface), ec);
        if (ec) {
            throw std::runtime_error("Failed to join mDNS multicast group: " + ec.message());
        }
    }
    if (options_.interfaceAddress) {
        socket->set_option(asio::ip::multicast::outbound_interface(iface), ec);
        if (ec) {
            throw std::runtime_error("Failed to select mDNS interface " + *options_.interfaceAddress + ": " + ec.message());
        }
    }
    socket->set_option(asio::ip::multicast::hops(255), ec);
    if (ec) {
        spdlog::warn("Failed to set mDNS multicast hop limit: {}", ec.message());
    }
    socket->set_option(asio::ip::multicast::enable_loopback(true), ec);
    if (ec) {
        spdlog::warn("Failed to enable mDNS multicast loopback: {}", ec.message());
    }

    groupEndpoint_ = udp::endpoint(group, kMdnsPort);
    unicastFallback_ = fallback;
    resolver_.clear();
    queries_.clear();
    runner_ = std::move(runner);
    socket_ = std::move(socket);
    running_ = true;

    runner_->start();
    asio::post(runner_->context(), [this] { startReceive(); });
    spdlog::debug("mDNS daemon listening on {}", socket_->local_endpoint(ec).port());
}

void MdnsDaemon::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (!running_) {
            throw std::runtime_error("mDNS daemon is not running");
        }
        running_ = false;
        runner_->stop();

        boost::system::error_code ec;
        socket_->close(ec);
        queries_.clear();
        socket_.reset();
        runner_.reset();
        resolver_.clear();
        if (ec) {
            closeStreams();
            throw std::runtime_error("Failed to close mDNS socket: " + ec.message());
        }
    }
    closeStreams();
    spdlog::debug("mDNS daemon stopped");
}

std::shared_ptr<ServiceEventStream> MdnsDaemon::browse(const std::string& serviceType) {
    if (!validServiceType(serviceType)) {
        throw std::invalid_argument("Invalid service type: " + serviceType);
    }

    std::lock_guard lock(mutex_);
    if (!running_) {
        throw std::runtime_error("mDNS daemon is not running");
    }

    auto stream = std::make_shared<ServiceEventStream>(serviceType);
    stream->push(ServiceEvent::searchStarted(serviceType));
    {
        std::lock_guard streamsLock(streamsMutex_);
        streams_.push_back(stream);
    }

    asio::post(runner_->context(), [this, serviceType] {
        resolver_.addBrowse(serviceType);
        queries_.push_back(std::make_unique<BrowseQuery>(
            BrowseQuery{serviceType, asio::steady_timer(runner_->context()), options_.queryInterval}));
        scheduleQuery(*queries_.back());
    });
    return stream;
}

void MdnsDaemon::startReceive() {
    socket_->async_receive_from(
        asio::buffer(buffer_),
        senderEndpoint_,
        [this](const boost::system::error_code& ec, std::size_t bytesReceived) {
            handleReceive(ec, bytesReceived);
        });
}

void MdnsDaemon::handleReceive(const boost::system::error_code& ec, std::size_t bytesReceived) {
    if (ec) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        spdlog::warn("mDNS receive error: {}", ec.message());
        startReceive();
        return;
    }

    try {
        const auto message = parseMessage(buffer_.data(), bytesReceived);
        dispatch(resolver_.apply(message));
    } catch (const std::exception& ex) {
        spdlog::debug("Dropping mDNS packet from {}: {}", senderEndpoint_.address().to_string(), ex.what());
    }
    startReceive();
}

void MdnsDaemon::dispatch(ServiceResolver::Outcome outcome) {
    if (!outcome.events.empty()) {
        std::lock_guard lock(streamsMutex_);
        for (auto& event : outcome.events) {
            const auto typeKey = canonicalName(event.serviceType);
            for (const auto& stream : streams_) {
                if (canonicalName(stream->serviceType()) == typeKey) {
                    stream->push(event);
                }
            }
        }
    }

    if (!outcome.followUps.empty()) {
        for (auto& question : outcome.followUps) {
            question.unicastResponse = unicastFallback_;
        }
        sendQuestions(outcome.followUps);
    }
}

void MdnsDaemon::scheduleQuery(BrowseQuery& query) {
    sendQuestions({Question{query.serviceType, RecordType::Ptr, unicastFallback_}});
    query.timer.expires_after(query.interval);
    query.timer.async_wait([this, &query](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        query.interval = std::min(query.interval * 2, options_.maxQueryInterval);
        scheduleQuery(query);
    });
}

void MdnsDaemon::sendQuestions(const std::vector<Question>& questions) {
    std::vector<std::uint8_t> packet;
    try {
        packet = encodeQuery(questions);
    } catch (const std::exception& ex) {
        spdlog::warn("Failed to encode mDNS query: {}", ex.what());
        return;
    }

    boost::system::error_code ec;
    socket_->send_to(asio::buffer(packet), groupEndpoint_, 0, ec);
    if (ec) {
        spdlog::warn("mDNS query send failed: {}", ec.message());
    }
}

void MdnsDaemon::closeStreams() {
    std::vector<std::shared_ptr<ServiceEventStream>> streams;
    {
        std::lock_guard lock(streamsMutex_);
        streams.swap(streams_);
    }
    for (const auto& stream : streams) {
        stream->push(ServiceEvent::searchStopped(stream->serviceType()));
        stream->close();
    }
}

}  // namespace lanscan::mdns
