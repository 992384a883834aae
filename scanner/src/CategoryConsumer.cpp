#include "lanscan/scanner/CategoryConsumer.h"

#include "lanscan/scanner/ServiceCategory.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace lanscan::scanner {

namespace {

std::string joinAddresses(const std::vector<boost::asio::ip::address>& addresses) {
    std::string out;
    for (const auto& address : addresses) {
        if (!out.empty()) {
            out += ", ";
        }
        out += address.to_string();
    }
    return "[" + out + "]";
}

}  // namespace

CategoryConsumer::CategoryConsumer(std::shared_ptr<mdns::ServiceEventStream> stream,
                                   std::shared_ptr<ScanSession> session,
                                   std::shared_ptr<ScanEventSink> sink)
    : serviceType_(stream->serviceType()),
      stream_(std::move(stream)),
      session_(std::move(session)),
      sink_(std::move(sink)) {}

CategoryConsumer::~CategoryConsumer() {
    if (worker_.joinable()) {
        closeStream();
        worker_.join();
    }
}

void CategoryConsumer::start() {
    if (worker_.joinable()) {
        return;
    }
    worker_ = std::thread([this] { run(); });
}

void CategoryConsumer::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void CategoryConsumer::closeStream() {
    stream_->close();
}

void CategoryConsumer::run() {
    while (auto event = stream_->next()) {
        try {
            handleEvent(*event);
        } catch (const std::exception& ex) {
            spdlog::error("Failed to handle {} event: {}", serviceType_, ex.what());
        }
    }
    spdlog::info("Receiver for {} disconnected.", serviceType_);
    finished_.store(true);
}

void CategoryConsumer::handleEvent(const mdns::ServiceEvent& event) {
    switch (event.kind) {
    case mdns::ServiceEventKind::ServiceResolved:
        admit(event.resolved, session_->elapsedMs());
        break;
    case mdns::ServiceEventKind::SearchStarted:
        spdlog::debug("Search started for {}", serviceType_);
        break;
    case mdns::ServiceEventKind::ServiceFound:
        spdlog::debug("Found {} ({})", event.fullname, serviceType_);
        break;
    case mdns::ServiceEventKind::ServiceRemoved:
        spdlog::debug("Removed {} ({})", event.fullname, serviceType_);
        break;
    case mdns::ServiceEventKind::SearchStopped:
        spdlog::debug("Search stopped for {}", serviceType_);
        break;
    }
}

std::optional<common::Device> CategoryConsumer::admit(const mdns::ResolvedService& info,
                                                      std::uint64_t elapsedMs) {
    if (session_->retired()) {
        spdlog::debug("Dropping {} resolution of {} from a replaced session", serviceType_, info.fullname);
        return std::nullopt;
    }
    spdlog::debug("Addresses for {}: {}", info.fullname, joinAddresses(info.addresses));

    const auto address = selectDeviceAddress(info.addresses);
    if (!address) {
        return std::nullopt;
    }

    const auto ip = address->to_string();
    if (!session_->seen().insert(ip, serviceType_)) {
        return std::nullopt;
    }

    const auto deviceType = classifyService(serviceType_, info.fullname);
    const auto name = displayName(info.fullname);
    spdlog::info("{} ({}:{}) {} ({}ms)", name, ip, info.port, serviceType_, elapsedMs);

    auto device = session_->registry().merge(ip, name, serviceType_, info.port, deviceType, elapsedMs);

    if (sink_ && !session_->retired()) {
        try {
            sink_->onNewDevice(device);
        } catch (const std::exception& ex) {
            spdlog::error("Failed to emit {} event: {}", kNewDeviceEvent, ex.what());
        }
    }
    return device;
}

}  // namespace lanscan::scanner
