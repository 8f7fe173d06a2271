/**
 * @file output_formatter.hpp
 * @brief Table and JSON rendering of discovery results for the CLI
 */

#pragma once

#include <lightscout/core/discovery_result.hpp>

#include <string>
#include <vector>

namespace lightscout {
namespace cli {

/**
 * @brief Renders a DiscoveryResult either as a table or as JSON
 */
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode = false);

    bool isJsonMode() const { return json_mode_; }

    /**
     * @brief Render the whole result, devices or failure reason
     */
    std::string format(const core::DiscoveryResult& result) const;

    std::string formatDevices(const std::vector<core::DeviceInfo>& devices) const;

    static std::string escapeJsonString(const std::string& s);

private:
    bool json_mode_;

    std::string deviceToJson(const core::DeviceInfo& device) const;
    std::string devicesToTable(const std::vector<core::DeviceInfo>& devices) const;
};

} // namespace cli
} // namespace lightscout
