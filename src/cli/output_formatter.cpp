/**
 * @file output_formatter.cpp
 * @brief Output formatting implementation
 */

#include <lightscout/cli/output_formatter.hpp>

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace lightscout {
namespace cli {

OutputFormatter::OutputFormatter(bool json_mode)
    : json_mode_(json_mode) {}

std::string OutputFormatter::format(const core::DiscoveryResult& result) const {
    std::ostringstream out;

    if (json_mode_) {
        out << "{\"status\":\"" << core::discoveryStatusToString(result.status) << "\""
            << ",\"elapsed_ms\":" << result.elapsed.count();
        if (result.ok()) {
            out << ",\"devices\":" << formatDevices(result.devices);
        } else {
            out << ",\"error\":\"" << escapeJsonString(result.message) << "\"";
        }
        out << "}\n";
        return out.str();
    }

    if (result.ok()) {
        out << "Found " << result.devices.size() << " device(s) in "
            << result.elapsed.count() << "ms\n\n"
            << formatDevices(result.devices);
    } else if (result.status == core::DiscoveryStatus::NO_DEVICE_FOUND) {
        out << "No bulbs answered within " << result.elapsed.count() << "ms.\n"
            << "Make sure LAN control is enabled on the bulbs.\n";
    } else {
        out << "(error) " << result.message << "\n";
    }
    return out.str();
}

std::string OutputFormatter::formatDevices(const std::vector<core::DeviceInfo>& devices) const {
    if (!json_mode_) {
        return devicesToTable(devices);
    }

    std::string out = "[";
    for (size_t i = 0; i < devices.size(); ++i) {
        if (i > 0) out += ",";
        out += deviceToJson(devices[i]);
    }
    out += "]";
    return out;
}

std::string OutputFormatter::deviceToJson(const core::DeviceInfo& device) const {
    std::ostringstream out;
    out << "{"
        << "\"id\":\"" << escapeJsonString(device.id) << "\","
        << "\"host\":\"" << escapeJsonString(device.host) << "\","
        << "\"port\":" << device.port << ","
        << "\"model\":\"" << escapeJsonString(device.model) << "\","
        << "\"fw_ver\":\"" << escapeJsonString(device.fw_version) << "\","
        << "\"name\":\"" << escapeJsonString(device.name) << "\","
        << "\"power\":" << (device.power ? "true" : "false") << ","
        << "\"bright\":" << device.bright << ","
        << "\"color_mode\":" << device.color_mode << ","
        << "\"ct\":" << device.ct << ","
        << "\"rgb\":" << device.rgb << ","
        << "\"hue\":" << device.hue << ","
        << "\"sat\":" << device.sat << ","
        << "\"support\":[";
    for (size_t i = 0; i < device.support.size(); ++i) {
        if (i > 0) out << ",";
        out << "\"" << escapeJsonString(device.support[i]) << "\"";
    }
    out << "]}";
    return out.str();
}

std::string OutputFormatter::devicesToTable(const std::vector<core::DeviceInfo>& devices) const {
    std::ostringstream out;

    if (devices.empty()) {
        out << "(no devices)\n";
        return out.str();
    }

    out << std::left
        << std::setw(4) << "#"
        << std::setw(22) << "ID"
        << std::setw(22) << "ADDRESS"
        << std::setw(12) << "MODEL"
        << std::setw(6) << "FW"
        << std::setw(6) << "POWER"
        << "NAME"
        << "\n";

    out << std::string(78, '-') << "\n";

    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& device = devices[i];
        out << std::left
            << std::setw(4) << (i + 1)
            << std::setw(22) << device.id
            << std::setw(22) << device.endpoint()
            << std::setw(12) << device.model
            << std::setw(6) << device.fw_version
            << std::setw(6) << (device.power ? "on" : "off")
            << device.name
            << "\n";
    }

    return out.str();
}

std::string OutputFormatter::escapeJsonString(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

} // namespace cli
} // namespace lightscout
