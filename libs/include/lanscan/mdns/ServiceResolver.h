#pragma once

#include "lanscan/mdns/DnsMessage.h"
#include "lanscan/mdns/ServiceEventStream.h"

#include <boost/asio/ip/address.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanscan::mdns {

// Record cache that joins PTR -> SRV -> A/AAAA across packets and turns the result into
// browse events for the service types registered with addBrowse(). Not thread safe; the
// daemon drives it from its io thread only.
class ServiceResolver {
public:
    struct Outcome {
        std::vector<ServiceEvent> events;
        // Questions worth asking to complete half-resolved instances.
        std::vector<Question> followUps;
    };

    void addBrowse(const std::string& serviceType);
    bool browsing(const std::string& serviceType) const;

    Outcome apply(const DnsMessage& message);
    void clear();

private:
    struct InstanceState {
        std::string displayName;
        std::string typeKey;
        bool announced{false};
        std::optional<std::uint16_t> resolvedPort;
        std::vector<boost::asio::ip::address> resolvedAddresses;
    };

    void evaluate(const std::string& instanceKey, Outcome& outcome);
    void forget(const std::string& instanceKey, Outcome& outcome);

    // canonical type -> type string as passed to addBrowse()
    std::unordered_map<std::string, std::string> browsed_;
    std::unordered_map<std::string, InstanceState> instances_;
    std::unordered_map<std::string, SrvData> srv_;
    std::unordered_map<std::string, std::vector<std::string>> txt_;
    std::unordered_map<std::string, std::vector<boost::asio::ip::address>> hostAddresses_;
};

}  // namespace lanscan::mdns
