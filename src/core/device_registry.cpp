/**
 * @file device_registry.cpp
 * @brief DeviceRegistry implementation.
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#include "lightscout/core/device_registry.hpp"
#include "lightscout/utils/logger.hpp"

namespace lightscout {
namespace core {

UpsertResult DeviceRegistry::upsert(const DeviceInfo& info) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = index_.find(info.id);
    if (it == index_.end()) {
        index_.emplace(info.id, devices_.size());
        devices_.push_back(info);
        LOG_DEBUG("DeviceRegistry", "New device {} ({}) at {}",
                  info.id, info.model, info.endpoint());
        return UpsertResult::ADDED;
    }

    devices_[it->second] = info;
    LOG_TRACE("DeviceRegistry", "Updated device {} at index {}", info.id, it->second);
    return UpsertResult::UPDATED;
}

std::vector<DeviceInfo> DeviceRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

size_t DeviceRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

std::optional<DeviceInfo> DeviceRegistry::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return devices_[it->second];
}

void DeviceRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    devices_.clear();
    index_.clear();
}

}  // namespace core
}  // namespace lightscout
