#include <catch2/catch_test_macros.hpp>

#include "TestSupport.h"
#include "lanscan/scanner/CategoryConsumer.h"
#include "lanscan/scanner/ScanSession.h"

#include <memory>

using lanscan::common::DeviceType;
using lanscan::mdns::ServiceEvent;
using lanscan::mdns::ServiceEventStream;
using lanscan::scanner::CategoryConsumer;
using lanscan::scanner::ScanSession;
using lanscan::test::RecordingEventSink;
using lanscan::test::makeResolved;

namespace {

struct ConsumerFixture {
    std::shared_ptr<ScanSession> session = std::make_shared<ScanSession>();
    std::shared_ptr<RecordingEventSink> sink = std::make_shared<RecordingEventSink>();

    std::unique_ptr<CategoryConsumer> make(const std::string& serviceType) {
        return std::make_unique<CategoryConsumer>(std::make_shared<ServiceEventStream>(serviceType), session, sink);
    }
};

}  // namespace

TEST_CASE("CategoryConsumer admits a resolution and notifies the sink", "[consumer]") {
    ConsumerFixture fx;
    auto consumer = fx.make("_musc._tcp.local.");

    const auto device = consumer->admit(
        makeResolved("Kitchen._musc._tcp.local.", 11000, {"169.254.9.9", "10.0.0.5"}), 420);

    REQUIRE(device.has_value());
    REQUIRE(device->ip == "10.0.0.5");
    REQUIRE(device->name == "Kitchen");
    REQUIRE(device->discoveryTimeMs == 420);
    REQUIRE(device->services.size() == 1);
    REQUIRE(device->services.front().deviceType == DeviceType::Bluesound);
    REQUIRE(device->services.front().port == 11000);

    const auto notified = fx.sink->devices();
    REQUIRE(notified.size() == 1);
    REQUIRE(notified.front().ip == "10.0.0.5");
    REQUIRE(fx.session->registry().find("10.0.0.5").has_value());
}

TEST_CASE("CategoryConsumer drops duplicate resolutions of the same category", "[consumer]") {
    ConsumerFixture fx;
    auto consumer = fx.make("_musc._tcp.local.");

    REQUIRE(consumer->admit(makeResolved("Kitchen._musc._tcp.local.", 11000, {"10.0.0.5"}), 100).has_value());
    REQUIRE_FALSE(consumer->admit(makeResolved("Kitchen._musc._tcp.local.", 11001, {"10.0.0.5"}), 200).has_value());

    REQUIRE(fx.sink->devices().size() == 1);
    const auto device = fx.session->registry().find("10.0.0.5");
    REQUIRE(device->services.front().port == 11000);
}

TEST_CASE("CategoryConsumer ignores resolutions without a usable address", "[consumer]") {
    ConsumerFixture fx;
    auto consumer = fx.make("_spotify-connect._tcp.local.");

    REQUIRE_FALSE(consumer->admit(makeResolved("Den._spotify-connect._tcp.local.", 4070, {"169.254.1.2"}), 10)
                      .has_value());
    REQUIRE_FALSE(consumer->admit(makeResolved("Den._spotify-connect._tcp.local.", 4070, {"fe80::2"}), 20)
                      .has_value());

    REQUIRE(fx.session->seen().size() == 0);
    REQUIRE(fx.session->registry().size() == 0);
    REQUIRE(fx.sink->devices().empty());

    REQUIRE(consumer->admit(makeResolved("Den._spotify-connect._tcp.local.", 4070, {"192.168.1.20"}), 30)
                .has_value());
}

TEST_CASE("CategoryConsumers of different categories share one device", "[consumer]") {
    ConsumerFixture fx;
    auto bluesound = fx.make("_musc._tcp.local.");
    auto spotify = fx.make("_spotify-connect._tcp.local.");

    bluesound->admit(makeResolved("Kitchen._musc._tcp.local.", 11000, {"10.0.0.5"}), 420);
    const auto device = spotify->admit(makeResolved("Kitchen._spotify-connect._tcp.local.", 4070, {"10.0.0.5"}), 650);

    REQUIRE(device.has_value());
    REQUIRE(device->discoveryTimeMs == 420);
    REQUIRE(device->services.size() == 2);
    REQUIRE(fx.session->registry().size() == 1);

    const auto notified = fx.sink->devices();
    REQUIRE(notified.size() == 2);
    REQUIRE(notified.back().services.size() == 2);
}

TEST_CASE("CategoryConsumer classifies generic web servers", "[consumer]") {
    ConsumerFixture fx;
    auto consumer = fx.make("_http._tcp.local.");

    const auto volumio = consumer->admit(makeResolved("volumio._http._tcp.local.", 80, {"10.0.0.8"}), 5);
    const auto printer = consumer->admit(makeResolved("printer._http._tcp.local.", 80, {"10.0.0.9"}), 6);

    REQUIRE(volumio->services.front().deviceType == DeviceType::Volumio);
    REQUIRE(printer->services.front().deviceType == DeviceType::Generic);
}

TEST_CASE("CategoryConsumer keeps the device when notification fails", "[consumer]") {
    ConsumerFixture fx;
    fx.sink->failNewDevice(true);
    auto consumer = fx.make("_qobuz-connect._tcp.local.");

    const auto device = consumer->admit(makeResolved("Den._qobuz-connect._tcp.local.", 9000, {"10.0.0.3"}), 50);

    REQUIRE(device.has_value());
    REQUIRE(fx.session->registry().find("10.0.0.3").has_value());
    REQUIRE(fx.sink->devices().empty());
}

TEST_CASE("CategoryConsumer drains its stream on a worker thread", "[consumer]") {
    ConsumerFixture fx;
    auto stream = std::make_shared<ServiceEventStream>("_musc._tcp.local.");
    CategoryConsumer consumer(stream, fx.session, fx.sink);
    consumer.start();

    const std::string type = "_musc._tcp.local.";
    stream->push(ServiceEvent::searchStarted(type));
    stream->push(ServiceEvent::found(type, "Kitchen._musc._tcp.local."));
    stream->push(ServiceEvent::resolvedEvent(type, makeResolved("Kitchen._musc._tcp.local.", 11000, {"10.0.0.5"})));
    stream->push(ServiceEvent::resolvedEvent(type, makeResolved("Kitchen._musc._tcp.local.", 11000, {"10.0.0.5"})));
    stream->push(ServiceEvent::removed(type, "Kitchen._musc._tcp.local."));

    REQUIRE(fx.sink->waitForDevices(1));

    stream->push(ServiceEvent::searchStopped(type));
    stream->close();
    consumer.join();

    REQUIRE(consumer.finished());
    REQUIRE(fx.sink->devices().size() == 1);
    REQUIRE(fx.session->registry().size() == 1);
}

TEST_CASE("CategoryConsumer drops resolutions once its session is retired", "[consumer]") {
    ConsumerFixture fx;
    auto consumer = fx.make("_musc._tcp.local.");
    fx.session->retire();

    REQUIRE_FALSE(consumer->admit(makeResolved("Kitchen._musc._tcp.local.", 11000, {"10.0.0.5"}), 10).has_value());

    REQUIRE(fx.session->seen().size() == 0);
    REQUIRE(fx.session->registry().size() == 0);
    REQUIRE(fx.sink->devices().empty());
}
