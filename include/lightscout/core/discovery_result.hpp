/**
 * @file discovery_result.hpp
 * @brief Outcome of a discovery run.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include "lightscout/core/device_info.hpp"
#include "lightscout/core/export.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace lightscout {
namespace core {

/**
 * @enum DiscoveryStatus
 * @brief Terminal status of DiscoveryEngine::start().
 */
enum class DiscoveryStatus {
    OK,                 ///< Reply limit reached, or timeout with at least one device
    BIND_ERROR,         ///< Could not open or bind the endpoint
    SEND_ERROR,         ///< Probe could not be sent
    NO_DEVICE_FOUND,    ///< Timeout elapsed with zero devices
    ALREADY_STARTED,    ///< start() was already called on this engine
    ALREADY_DESTROYED,  ///< start() called after destroy()
    DESTROYED,          ///< destroy() cancelled a pending start()
    INVALID_CONFIG      ///< Configuration rejected before binding
};

inline const char* discoveryStatusToString(DiscoveryStatus status) {
    switch (status) {
        case DiscoveryStatus::OK: return "ok";
        case DiscoveryStatus::BIND_ERROR: return "bind-error";
        case DiscoveryStatus::SEND_ERROR: return "send-error";
        case DiscoveryStatus::NO_DEVICE_FOUND: return "no-device-found";
        case DiscoveryStatus::ALREADY_STARTED: return "already-started";
        case DiscoveryStatus::ALREADY_DESTROYED: return "already-destroyed";
        case DiscoveryStatus::DESTROYED: return "destroyed";
        case DiscoveryStatus::INVALID_CONFIG: return "invalid-config";
        default: return "unknown";
    }
}

/**
 * @struct DiscoveryResult
 * @brief Devices found on success, or the reason the run failed.
 */
struct LIGHTSCOUT_CORE_API DiscoveryResult {
    DiscoveryStatus status;
    std::vector<DeviceInfo> devices;    ///< Registry snapshot (OK only)
    std::chrono::milliseconds elapsed;  ///< Time since the probe was sent
    std::string message;                ///< Human readable detail for failures
    int errorCode;                      ///< Socket error for BIND_ERROR / SEND_ERROR

    DiscoveryResult()
        : status(DiscoveryStatus::OK)
        , elapsed(0)
        , errorCode(0)
    {}

    bool ok() const { return status == DiscoveryStatus::OK; }

    /**
     * @brief True for failures raised by the network layer.
     * NO_DEVICE_FOUND is a completed run with no replies, not a transport error.
     */
    bool isTransportError() const {
        return status == DiscoveryStatus::BIND_ERROR ||
               status == DiscoveryStatus::SEND_ERROR;
    }

    static DiscoveryResult success(std::vector<DeviceInfo> devices,
                                   std::chrono::milliseconds elapsed) {
        DiscoveryResult result;
        result.devices = std::move(devices);
        result.elapsed = elapsed;
        return result;
    }

    static DiscoveryResult failure(DiscoveryStatus status, std::string message,
                                   int errorCode = 0) {
        DiscoveryResult result;
        result.status = status;
        result.message = std::move(message);
        result.errorCode = errorCode;
        return result;
    }
};

}  // namespace core
}  // namespace lightscout
