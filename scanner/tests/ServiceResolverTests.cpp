#include <catch2/catch_test_macros.hpp>

#include "lanscan/mdns/ServiceResolver.h"

#include <boost/asio/ip/address.hpp>

#include <string>
#include <vector>

using namespace lanscan::mdns;

namespace {

const std::string kMusc = "_musc._tcp.local.";
const std::string kInstance = "Kitchen._musc._tcp.local.";

ResourceRecord ptrRecord(const std::string& name, const std::string& target, std::uint32_t ttl = 4500) {
    ResourceRecord record;
    record.name = name;
    record.type = static_cast<std::uint16_t>(RecordType::Ptr);
    record.ttl = ttl;
    record.ptrTarget = target;
    return record;
}

ResourceRecord srvRecord(const std::string& name, const std::string& target, std::uint16_t port) {
    ResourceRecord record;
    record.name = name;
    record.type = static_cast<std::uint16_t>(RecordType::Srv);
    record.ttl = 120;
    record.cacheFlush = true;
    record.srv.port = port;
    record.srv.target = target;
    return record;
}

ResourceRecord addressRecord(const std::string& name, const std::string& address, std::uint32_t ttl = 120) {
    ResourceRecord record;
    record.name = name;
    record.ttl = ttl;
    record.address = boost::asio::ip::make_address(address);
    record.type = static_cast<std::uint16_t>(record.address.is_v4() ? RecordType::A : RecordType::Aaaa);
    return record;
}

ResourceRecord txtRecord(const std::string& name, std::vector<std::string> entries) {
    ResourceRecord record;
    record.name = name;
    record.type = static_cast<std::uint16_t>(RecordType::Txt);
    record.ttl = 4500;
    record.txt = std::move(entries);
    return record;
}

DnsMessage response(std::vector<ResourceRecord> records) {
    DnsMessage message;
    message.flags = 0x8400;
    message.records = std::move(records);
    return message;
}

}  // namespace

TEST_CASE("ServiceResolver resolves a complete announcement", "[mdns]") {
    ServiceResolver resolver;
    resolver.addBrowse(kMusc);

    const auto outcome = resolver.apply(response({
        addressRecord("node.local.", "10.0.0.5"),
        txtRecord(kInstance, {"model=N130"}),
        srvRecord(kInstance, "node.local.", 11000),
        ptrRecord(kMusc, kInstance),
    }));

    REQUIRE(outcome.followUps.empty());
    REQUIRE(outcome.events.size() == 2);
    REQUIRE(outcome.events[0].kind == ServiceEventKind::ServiceFound);
    REQUIRE(outcome.events[0].fullname == kInstance);
    REQUIRE(outcome.events[0].serviceType == kMusc);

    const auto& resolved = outcome.events[1];
    REQUIRE(resolved.kind == ServiceEventKind::ServiceResolved);
    REQUIRE(resolved.serviceType == kMusc);
    REQUIRE(resolved.resolved.fullname == kInstance);
    REQUIRE(resolved.resolved.hostname == "node.local.");
    REQUIRE(resolved.resolved.port == 11000);
    REQUIRE(resolved.resolved.addresses.size() == 1);
    REQUIRE(resolved.resolved.addresses.front().to_string() == "10.0.0.5");
    REQUIRE(resolved.resolved.txt == std::vector<std::string>{"model=N130"});
}

TEST_CASE("ServiceResolver asks for what is missing across packets", "[mdns]") {
    ServiceResolver resolver;
    resolver.addBrowse(kMusc);

    auto outcome = resolver.apply(response({ptrRecord(kMusc, kInstance)}));
    REQUIRE(outcome.events.size() == 1);
    REQUIRE(outcome.events.front().kind == ServiceEventKind::ServiceFound);
    REQUIRE(outcome.followUps.size() == 1);
    REQUIRE(outcome.followUps.front().name == kInstance);
    REQUIRE(outcome.followUps.front().type == RecordType::Srv);

    outcome = resolver.apply(response({srvRecord(kInstance, "node.local.", 11000)}));
    REQUIRE(outcome.events.empty());
    REQUIRE(outcome.followUps.size() == 1);
    REQUIRE(outcome.followUps.front().name == "node.local.");
    REQUIRE(outcome.followUps.front().type == RecordType::A);

    outcome = resolver.apply(response({addressRecord("NODE.local", "192.168.1.20")}));
    REQUIRE(outcome.followUps.empty());
    REQUIRE(outcome.events.size() == 1);
    REQUIRE(outcome.events.front().kind == ServiceEventKind::ServiceResolved);
    REQUIRE(outcome.events.front().resolved.addresses.front().to_string() == "192.168.1.20");
}

TEST_CASE("ServiceResolver reports a resolution again only when it changes", "[mdns]") {
    ServiceResolver resolver;
    resolver.addBrowse(kMusc);

    const auto announcement = response({
        ptrRecord(kMusc, kInstance),
        srvRecord(kInstance, "node.local.", 11000),
        addressRecord("node.local.", "10.0.0.5"),
    });
    REQUIRE(resolver.apply(announcement).events.size() == 2);
    REQUIRE(resolver.apply(announcement).events.empty());

    const auto outcome = resolver.apply(response({addressRecord("node.local.", "fe80::1")}));
    REQUIRE(outcome.events.size() == 1);
    REQUIRE(outcome.events.front().kind == ServiceEventKind::ServiceResolved);
    REQUIRE(outcome.events.front().resolved.addresses.size() == 2);
}

TEST_CASE("ServiceResolver turns a goodbye into a removal", "[mdns]") {
    ServiceResolver resolver;
    resolver.addBrowse(kMusc);

    resolver.apply(response({ptrRecord(kMusc, kInstance)}));
    const auto outcome = resolver.apply(response({ptrRecord(kMusc, kInstance, 0)}));

    REQUIRE(outcome.events.size() == 1);
    REQUIRE(outcome.events.front().kind == ServiceEventKind::ServiceRemoved);
    REQUIRE(outcome.events.front().fullname == kInstance);

    REQUIRE(resolver.apply(response({ptrRecord(kMusc, kInstance, 0)})).events.empty());
}

TEST_CASE("ServiceResolver ignores what it does not browse", "[mdns]") {
    ServiceResolver resolver;
    resolver.addBrowse(kMusc);

    SECTION("other service types") {
        const auto outcome = resolver.apply(response({ptrRecord("_ipp._tcp.local.", "Printer._ipp._tcp.local.")}));
        REQUIRE(outcome.events.empty());
        REQUIRE(outcome.followUps.empty());
    }

    SECTION("queries") {
        auto query = response({ptrRecord(kMusc, kInstance)});
        query.flags = 0;
        REQUIRE(resolver.apply(query).events.empty());
    }

    SECTION("non-internet classes") {
        auto record = ptrRecord(kMusc, kInstance);
        record.rrClass = 3;
        REQUIRE(resolver.apply(response({record})).events.empty());
    }

    SECTION("after clear") {
        resolver.clear();
        REQUIRE_FALSE(resolver.browsing(kMusc));
        REQUIRE(resolver.apply(response({ptrRecord(kMusc, kInstance)})).events.empty());
    }
}

TEST_CASE("ServiceResolver matches browse types case-insensitively", "[mdns]") {
    ServiceResolver resolver;
    resolver.addBrowse(kMusc);
    REQUIRE(resolver.browsing("_MUSC._tcp.local"));

    const auto outcome = resolver.apply(response({ptrRecord("_Musc._TCP.local.", kInstance)}));
    REQUIRE(outcome.events.size() == 1);
    REQUIRE(outcome.events.front().serviceType == kMusc);
}
