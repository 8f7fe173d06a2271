/**
 * @file main.cpp
 * @brief lightscout entry point
 *
 * Thin executable around the discovery engine: parse options, run one
 * discovery, print the bulbs that answered.
 */

#include <lightscout/cli/config.hpp>
#include <lightscout/cli/output_formatter.hpp>
#include <lightscout/core/discovery_engine.hpp>
#include <lightscout/net/platform.hpp>
#include <lightscout/utils/logger.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>

using namespace lightscout;
using namespace lightscout::cli;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNoDevice = 2;

std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config = parseArgs(argc, argv);

    if (config.help) {
        printUsage(argv[0]);
        return config.error ? kExitError : kExitOk;
    }

    utils::Logger::instance().setLevel(utils::logLevelFromString(config.log_level));

    net::SocketInitializer sockets;
    if (!sockets.isInitialized()) {
        LOG_ERROR("Main", "Socket subsystem initialization failed");
        return kExitError;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    OutputFormatter output(config.json);
    core::DiscoveryEngine engine(toDiscoveryConfig(config));

    if (!config.json) {
        engine.onDeviceAdded([](const core::DeviceInfo& device) {
            LOG_INFO("Main", "Bulb {} ({}) answered from {}",
                     device.id, device.model, device.endpoint());
        });
    }

    LOG_INFO("Main", "Searching for bulbs via {}:{} (limit {}, timeout {}ms)",
             config.multicast_host, config.port, config.limit, config.timeout_ms);

    std::future<core::DiscoveryResult> pending = engine.startAsync();

    while (pending.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_shutdown.exchange(false)) {
            LOG_INFO("Main", "Interrupted, stopping discovery");
            engine.destroy();
        }
    }

    core::DiscoveryResult result = pending.get();
    engine.destroy();

    std::cout << output.format(result);

    if (result.ok()) {
        return kExitOk;
    }
    return result.status == core::DiscoveryStatus::NO_DEVICE_FOUND ? kExitNoDevice : kExitError;
}
