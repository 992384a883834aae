#pragma once

#include "lanscan/scanner/ScanEventSink.h"

#include <nlohmann/json_fwd.hpp>

#include <mutex>
#include <ostream>
#include <string_view>
#include <vector>

namespace lanscan::scanner {

// Writes every notification as one JSON document per line:
//   {"event":"new-device","payload":{...}}
class JsonEventSink : public ScanEventSink {
public:
    explicit JsonEventSink(std::ostream& output, bool pretty = false, bool emitTicks = true);

    void onNewDevice(const common::Device& device) override;
    void onScanTick(std::uint64_t secondsLeft) override;
    void onScanStopped() override;

    void writeDevices(const std::vector<common::Device>& devices);

private:
    void write(std::string_view event, const nlohmann::json& payload);

    std::ostream& output_;
    const bool pretty_;
    const bool emitTicks_;
    std::mutex mutex_;
};

}  // namespace lanscan::scanner
