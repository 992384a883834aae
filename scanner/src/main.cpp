#include "lanscan/mdns/MdnsDaemon.h"
#include "lanscan/scanner/JsonEventSink.h"
#include "lanscan/scanner/ScanController.h"
#include "lanscan/scanner/ScanErrors.h"
#include "lanscan/scanner/ScannerConfig.h"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic_bool g_shouldStop{false};

void handleSignal(int) {
    g_shouldStop.store(true);
}

struct CliOptions {
    std::filesystem::path configPath;
    std::string logLevel;
    std::string interfaceAddress;
    bool pretty{false};
    bool noTicks{false};
};

void configureLogging(const std::string& level) {
    auto logger = spdlog::stderr_color_mt("lanscan");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"LAN media device scanner (Bluesound, Volumio, Spotify Connect, Qobuz Connect)"};
    CliOptions opts;

    app.add_option("--config", opts.configPath, "Scanner config JSON file")
        ->check(CLI::ExistingFile);
    app.add_option("--log-level", opts.logLevel, "trace, debug, info, warn, error or off");
    app.add_option("--interface", opts.interfaceAddress, "IPv4 address of the interface to browse on");
    app.add_flag("--pretty", opts.pretty, "Pretty-print JSON events");
    app.add_flag("--no-ticks", opts.noTicks, "Do not print scan-tick events");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    lanscan::scanner::ScannerConfig config;
    try {
        if (!opts.configPath.empty()) {
            config = lanscan::scanner::loadScannerConfig(opts.configPath);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load scanner config: " << ex.what() << "\n";
        return 1;
    }
    if (!opts.logLevel.empty()) {
        config.logLevel = opts.logLevel;
    }
    if (!opts.interfaceAddress.empty()) {
        config.mdns.interfaceAddress = opts.interfaceAddress;
    }
    if (opts.pretty) {
        config.prettyOutput = true;
    }
    if (opts.noTicks) {
        config.emitTicks = false;
    }

    configureLogging(config.logLevel);
    spdlog::info("lan-scanner initialized");

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    auto sink = std::make_shared<lanscan::scanner::JsonEventSink>(std::cout, config.prettyOutput, config.emitTicks);
    auto backend = std::make_shared<lanscan::mdns::MdnsDaemon>(config.mdns);
    lanscan::scanner::ScanController controller(backend, sink);

    try {
        controller.start();
    } catch (const lanscan::scanner::ScanError& ex) {
        spdlog::error("{}", ex.what());
        return 1;
    }

    while (controller.isScanning() && !g_shouldStop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    int exitCode = 0;
    if (g_shouldStop.load()) {
        spdlog::info("Signal received, stopping scan");
        try {
            controller.stop();
        } catch (const lanscan::scanner::ScanError& ex) {
            spdlog::error("{}", ex.what());
            exitCode = 1;
        }
    }

    try {
        sink->writeDevices(controller.discoveredDevices());
    } catch (const lanscan::scanner::NotificationDeliveryError& ex) {
        spdlog::error("{}", ex.what());
        exitCode = 1;
    }
    return exitCode;
}
