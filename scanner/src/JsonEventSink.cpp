#include "lanscan/scanner/JsonEventSink.h"

#include "lanscan/scanner/ScanErrors.h"

#include <nlohmann/json.hpp>

#include <string>

namespace lanscan::scanner {

using json = nlohmann::json;

JsonEventSink::JsonEventSink(std::ostream& output, bool pretty, bool emitTicks)
    : output_(output), pretty_(pretty), emitTicks_(emitTicks) {}

void JsonEventSink::onNewDevice(const common::Device& device) {
    write(kNewDeviceEvent, device);
}

void JsonEventSink::onScanTick(std::uint64_t secondsLeft) {
    if (!emitTicks_) {
        return;
    }
    write(kScanTickEvent, json{{"secondsLeft", secondsLeft}});
}

void JsonEventSink::onScanStopped() {
    write(kScanStoppedEvent, nullptr);
}

void JsonEventSink::writeDevices(const std::vector<common::Device>& devices) {
    write("devices", devices);
}

void JsonEventSink::write(std::string_view event, const json& payload) {
    json line{{"event", std::string(event)}, {"payload", payload}};
    std::lock_guard lock(mutex_);
    output_ << line.dump(pretty_ ? 2 : -1) << '\n';
    output_.flush();
    if (!output_) {
        output_.clear();
        throw NotificationDeliveryError(std::string(event), "output stream is not writable");
    }
}

}  // namespace lanscan::scanner
