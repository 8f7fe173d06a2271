/**
 * @file device_info.hpp
 * @brief Device record and the reply-message parser contract.
 *
 * A DeviceInfo is built from one search response (or advertisement)
 * sent by a bulb. Records are value types: a later reply for the same
 * bulb produces a new record which replaces the stored one.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include "lightscout/core/export.hpp"
#include "lightscout/net/udp_socket.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lightscout {
namespace core {

/**
 * @struct DeviceInfo
 * @brief Information about a discovered bulb.
 */
struct LIGHTSCOUT_CORE_API DeviceInfo {
    std::string id;                     ///< Stable device identifier ("0x000000000015243f")
    std::string location;               ///< Raw Location header ("yeelight://host:port")
    std::string host;                   ///< Control host from Location
    uint16_t port;                      ///< Control port from Location
    net::SocketAddress source;          ///< Sender of the datagram
    std::string model;                  ///< Product model ("color", "mono", ...)
    std::string fw_version;             ///< Firmware version
    std::vector<std::string> support;   ///< Supported control methods
    bool power;                         ///< Power state reported in the reply
    int bright;                         ///< Brightness percentage
    int color_mode;                     ///< 1 = rgb, 2 = color temperature, 3 = hsv
    int ct;                             ///< Color temperature (K)
    int rgb;                            ///< Packed 0xRRGGBB value
    int hue;
    int sat;
    std::string name;                   ///< User-assigned name, may be empty

    DeviceInfo()
        : port(0)
        , power(false)
        , bright(0)
        , color_mode(0)
        , ct(0)
        , rgb(0)
        , hue(0)
        , sat(0)
    {}

    std::string endpoint() const {
        return host + ":" + std::to_string(port);
    }

    bool supports(const std::string& method) const;
};

/**
 * @brief Build the search request broadcast to solicit bulb replies.
 *
 * The text is fixed by the vendor protocol: an M-SEARCH request line
 * followed by HOST, MAN and ST headers, CRLF terminated, no body.
 */
LIGHTSCOUT_CORE_API std::string buildProbeMessage();

/**
 * @brief Parse a reply datagram into a device record.
 *
 * Accepts "HTTP/1.1 200 OK" search responses and "NOTIFY * HTTP/1.1"
 * advertisements. Header names are case-insensitive. A record requires
 * a non-empty id and a "yeelight://host:port" Location.
 *
 * @param message Decoded datagram text.
 * @param sender Address the datagram came from.
 * @return The record, or std::nullopt if the text is not a bulb reply.
 */
LIGHTSCOUT_CORE_API std::optional<DeviceInfo> parseDeviceInfo(
    const std::string& message,
    const net::SocketAddress& sender = net::SocketAddress());

}  // namespace core
}  // namespace lightscout
