#pragma once

#include <boost/asio/ip/address.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lanscan::mdns {

constexpr std::uint16_t kMdnsPort = 5353;
constexpr const char* kMdnsGroupV4 = "224.0.0.251";

enum class RecordType : std::uint16_t {
    A = 1,
    Ptr = 12,
    Txt = 16,
    Aaaa = 28,
    Srv = 33,
    Any = 255,
};

struct Question {
    std::string name;
    RecordType type{RecordType::Ptr};
    bool unicastResponse{false};
};

struct SrvData {
    std::uint16_t priority{0};
    std::uint16_t weight{0};
    std::uint16_t port{0};
    std::string target;
};

struct ResourceRecord {
    std::string name;
    std::uint16_t type{0};
    std::uint16_t rrClass{1};
    bool cacheFlush{false};
    std::uint32_t ttl{0};

    // Exactly one of these is meaningful, depending on `type`.
    std::string ptrTarget;
    SrvData srv;
    std::vector<std::string> txt;
    boost::asio::ip::address address;

    bool is(RecordType recordType) const noexcept {
        return type == static_cast<std::uint16_t>(recordType);
    }
};

struct DnsMessage {
    std::uint16_t id{0};
    std::uint16_t flags{0};
    std::vector<Question> questions;
    // Answer, authority and additional sections in wire order.
    std::vector<ResourceRecord> records;

    bool isResponse() const noexcept { return (flags & 0x8000U) != 0; }
};

std::vector<std::uint8_t> encodeQuery(const std::vector<Question>& questions);
std::vector<std::uint8_t> encodeQuery(const std::string& name,
                                      RecordType type,
                                      bool unicastResponse = false);

// Throws std::runtime_error on truncated or malformed input.
DnsMessage parseMessage(const std::uint8_t* data, std::size_t size);
DnsMessage parseMessage(const std::vector<std::uint8_t>& packet);

// Lower-cased name with exactly one trailing dot, used as cache key.
std::string canonicalName(std::string_view name);

}  // namespace lanscan::mdns
