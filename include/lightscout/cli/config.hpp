/**
 * @file config.hpp
 * @brief lightscout command line configuration and parsing
 */

#pragma once

#include <lightscout/core/discovery_engine.hpp>
#include <lightscout/utils/string_utils.hpp>

#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>

namespace lightscout {
namespace cli {

/**
 * @brief Command line configuration
 */
struct Config {
    std::string bind_host;
    uint16_t port = 1982;
    std::string multicast_host = "239.255.255.250";
    size_t limit = 1;
    int64_t timeout_ms = 10000;         ///< 0 = wait until the limit is reached
    int poll_interval_ms = 200;
    bool debug = true;                  ///< Log raw replies
    std::string log_level = "INFO";
    bool json = false;
    bool help = false;
    bool error = false;                 ///< Parsing failed; help is also set
};

/**
 * @brief Print usage information
 * @param program_name Name of the executable
 */
inline void printUsage(const char* program_name) {
    std::cout << "lightscout - Smart bulb discovery over UDP\n\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --bind <host>             Local address to bind (default: any)\n"
              << "  --port <port>             Local and probe port (default: 1982)\n"
              << "  --multicast-host <addr>   Probe destination (default: 239.255.255.250)\n"
              << "  --limit <n>               Stop after n distinct bulbs (default: 1)\n"
              << "  --timeout <ms>            Give up after ms, 0 = never (default: 10000)\n"
              << "  --interval <ms>           Completion check interval (default: 200)\n"
              << "  --debug <on|off>          Log every received reply (default: on)\n"
              << "  --log-level <level>       TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF (default: INFO)\n"
              << "  --json                    Print the result as JSON\n"
              << "\n  --help                    Show this help message\n\n"
              << "Exit status: 0 bulbs found, 2 no bulb answered, 1 other errors\n\n"
              << "Example:\n"
              << "  " << program_name << " --limit 3 --timeout 5000\n"
              << "  " << program_name << " --bind 192.168.1.20 --json --debug off\n";
}

namespace detail {

inline bool parseNumber(const char* arg, const char* value,
                        long long min, long long max, long long& out) {
    if (!utils::parseInt(value, out) || out < min || out > max) {
        std::cerr << "Error: Invalid value for " << arg << ": '" << value << "'\n";
        return false;
    }
    return true;
}

}  // namespace detail

/**
 * @brief Parse command line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @return Parsed configuration; help and error are set on bad input
 */
inline Config parseArgs(int argc, char* argv[]) {
    Config config;

    auto reject = [&config]() {
        config.help = true;
        config.error = true;
        return config;
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            config.help = true;
            return config;
        }
        if (std::strcmp(arg, "--json") == 0) {
            config.json = true;
            continue;
        }

        // Options that require a value
        if (i + 1 >= argc) {
            std::cerr << "Error: Option " << arg << " requires a value\n";
            return reject();
        }

        const char* value = argv[++i];
        long long number = 0;

        if (std::strcmp(arg, "--bind") == 0) {
            config.bind_host = value;
        } else if (std::strcmp(arg, "--port") == 0) {
            if (!detail::parseNumber(arg, value, 0, 65535, number)) return reject();
            config.port = static_cast<uint16_t>(number);
        } else if (std::strcmp(arg, "--multicast-host") == 0) {
            config.multicast_host = value;
        } else if (std::strcmp(arg, "--limit") == 0) {
            if (!detail::parseNumber(arg, value, 1, 1000000, number)) return reject();
            config.limit = static_cast<size_t>(number);
        } else if (std::strcmp(arg, "--timeout") == 0) {
            if (!detail::parseNumber(arg, value, 0, 86400000, number)) return reject();
            config.timeout_ms = number;
        } else if (std::strcmp(arg, "--interval") == 0) {
            if (!detail::parseNumber(arg, value, 1, 60000, number)) return reject();
            config.poll_interval_ms = static_cast<int>(number);
        } else if (std::strcmp(arg, "--debug") == 0) {
            std::string flag = utils::toLower(value);
            if (flag == "on" || flag == "true" || flag == "1") {
                config.debug = true;
            } else if (flag == "off" || flag == "false" || flag == "0") {
                config.debug = false;
            } else {
                std::cerr << "Error: --debug expects on or off, got '" << value << "'\n";
                return reject();
            }
        } else if (std::strcmp(arg, "--log-level") == 0) {
            config.log_level = value;
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            return reject();
        }
    }

    return config;
}

/**
 * @brief Build the engine configuration from parsed options
 */
inline core::DiscoveryConfig toDiscoveryConfig(const Config& config) {
    core::DiscoveryConfig discovery;
    discovery.bind_host = config.bind_host;
    discovery.bind_port = config.port;
    discovery.multicast_host = config.multicast_host;
    discovery.reply_limit = config.limit;
    discovery.timeout_ms = config.timeout_ms;
    discovery.debug = config.debug;
    discovery.poll_interval_ms = config.poll_interval_ms;
    return discovery;
}

} // namespace cli
} // namespace lightscout
