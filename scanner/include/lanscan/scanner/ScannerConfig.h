#pragma once

#include "lanscan/mdns/MdnsDaemon.h"

#include <nlohmann/json_fwd.hpp>

#include <filesystem>
#include <string>

namespace lanscan::scanner {

struct ScannerConfig {
    std::string logLevel{"info"};
    mdns::MdnsDaemonOptions mdns;
    bool prettyOutput{false};
    bool emitTicks{true};
};

// Reads the optional JSON config. Unknown keys are ignored; keys of the wrong type throw
// std::runtime_error naming the offending field.
ScannerConfig parseScannerConfig(const nlohmann::json& root);
ScannerConfig loadScannerConfig(const std::filesystem::path& path);

}  // namespace lanscan::scanner
