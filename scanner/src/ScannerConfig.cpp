#include "lanscan/scanner/ScannerConfig.h"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace lanscan::scanner {

namespace {

using json = nlohmann::json;

const json* optionalField(const json& node, const char* key, const std::string& path) {
    if (!node.is_object()) {
        throw std::runtime_error("'" + path + "' must be an object");
    }
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::string stringField(const json& value, const std::string& path) {
    if (!value.is_string()) {
        throw std::runtime_error("'" + path + "' must be a string");
    }
    return value.get<std::string>();
}

bool boolField(const json& value, const std::string& path) {
    if (!value.is_boolean()) {
        throw std::runtime_error("'" + path + "' must be a boolean");
    }
    return value.get<bool>();
}

std::chrono::milliseconds millisecondsField(const json& value, const std::string& path) {
    if (!value.is_number_unsigned() || value.get<std::uint64_t>() == 0) {
        throw std::runtime_error("'" + path + "' must be a positive integer");
    }
    return std::chrono::milliseconds(value.get<std::uint64_t>());
}

}  // namespace

ScannerConfig parseScannerConfig(const json& root) {
    ScannerConfig config;

    if (const auto* level = optionalField(root, "log_level", "<root>")) {
        config.logLevel = stringField(*level, "log_level");
        if (spdlog::level::from_str(config.logLevel) == spdlog::level::off && config.logLevel != "off") {
            throw std::runtime_error("'log_level' has unknown value: " + config.logLevel);
        }
    }

    if (const auto* mdnsNode = optionalField(root, "mdns", "<root>")) {
        if (const auto* iface = optionalField(*mdnsNode, "interface", "mdns")) {
            config.mdns.interfaceAddress = stringField(*iface, "mdns.interface");
        }
        if (const auto* interval = optionalField(*mdnsNode, "query_interval_ms", "mdns")) {
            config.mdns.queryInterval = millisecondsField(*interval, "mdns.query_interval_ms");
        }
        if (const auto* maxInterval = optionalField(*mdnsNode, "max_query_interval_ms", "mdns")) {
            config.mdns.maxQueryInterval = millisecondsField(*maxInterval, "mdns.max_query_interval_ms");
        }
        if (config.mdns.maxQueryInterval < config.mdns.queryInterval) {
            throw std::runtime_error("'mdns.max_query_interval_ms' must not be below 'mdns.query_interval_ms'");
        }
    }

    if (const auto* output = optionalField(root, "output", "<root>")) {
        if (const auto* pretty = optionalField(*output, "pretty", "output")) {
            config.prettyOutput = boolField(*pretty, "output.pretty");
        }
        if (const auto* ticks = optionalField(*output, "ticks", "output")) {
            config.emitTicks = boolField(*ticks, "output.ticks");
        }
    }

    return config;
}

ScannerConfig loadScannerConfig(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Scanner config not found: " + path.string());
    }

    json root;
    try {
        input >> root;
    } catch (const std::exception& ex) {
        throw std::runtime_error("Failed to parse scanner config (" + path.string() + "): " + ex.what());
    }
    return parseScannerConfig(root);
}

}  // namespace lanscan::scanner
