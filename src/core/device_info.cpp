/**
 * @file device_info.cpp
 * @brief Probe construction and reply parsing.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#include "lightscout/core/device_info.hpp"
#include "lightscout/utils/logger.hpp"
#include "lightscout/utils/string_utils.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace lightscout {
namespace core {

namespace {

constexpr const char* kLocationScheme = "yeelight://";

int toInt(const std::unordered_map<std::string, std::string>& headers,
          const char* key) {
    auto it = headers.find(key);
    long long value = 0;
    if (it == headers.end() || !utils::parseInt(it->second, value)) {
        return 0;
    }
    if (value > std::numeric_limits<int>::max() ||
        value < std::numeric_limits<int>::min()) {
        return 0;
    }
    return static_cast<int>(value);
}

std::string toString(const std::unordered_map<std::string, std::string>& headers,
                     const char* key) {
    auto it = headers.find(key);
    return it == headers.end() ? std::string() : it->second;
}

// "yeelight://192.168.1.239:55443" -> host, port
bool parseLocation(const std::string& location, std::string& host, uint16_t& port) {
    if (!utils::startsWith(utils::toLower(location), kLocationScheme)) {
        return false;
    }

    std::string rest = location.substr(std::char_traits<char>::length(kLocationScheme));
    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    size_t colon = rest.rfind(':');
    if (colon == std::string::npos || colon == 0) {
        return false;
    }

    long long value = 0;
    if (!utils::parseInt(rest.substr(colon + 1), value) || value <= 0 || value > 65535) {
        return false;
    }

    host = rest.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

}  // namespace

bool DeviceInfo::supports(const std::string& method) const {
    return std::find(support.begin(), support.end(), method) != support.end();
}

std::string buildProbeMessage() {
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: 239.255.255.250:1982\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "ST: wifi_bulb\r\n";
}

std::optional<DeviceInfo> parseDeviceInfo(const std::string& message,
                                          const net::SocketAddress& sender) {
    std::vector<std::string> lines = utils::split(message, '\n');
    if (lines.empty()) {
        return std::nullopt;
    }

    std::string startLine = utils::trim(lines.front());
    if (startLine != "HTTP/1.1 200 OK" && startLine != "NOTIFY * HTTP/1.1") {
        LOG_TRACE("Parser", "Ignoring datagram from {} ('{}')",
                  sender.toString(), startLine);
        return std::nullopt;
    }

    std::unordered_map<std::string, std::string> headers;
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) {
            continue;
        }
        std::string key = utils::toLower(utils::trim(lines[i].substr(0, colon)));
        if (!key.empty()) {
            headers[key] = utils::trim(lines[i].substr(colon + 1));
        }
    }

    DeviceInfo info;
    info.id = toString(headers, "id");
    info.location = toString(headers, "location");

    if (info.id.empty() || !parseLocation(info.location, info.host, info.port)) {
        LOG_TRACE("Parser", "Reply from {} has no usable id/Location", sender.toString());
        return std::nullopt;
    }

    info.source = sender;
    info.model = toString(headers, "model");
    info.fw_version = toString(headers, "fw_ver");
    info.support = utils::split(toString(headers, "support"), ' ');
    info.power = utils::toLower(toString(headers, "power")) == "on";
    info.bright = toInt(headers, "bright");
    info.color_mode = toInt(headers, "color_mode");
    info.ct = toInt(headers, "ct");
    info.rgb = toInt(headers, "rgb");
    info.hue = toInt(headers, "hue");
    info.sat = toInt(headers, "sat");
    info.name = toString(headers, "name");

    return info;
}

}  // namespace core
}  // namespace lightscout
