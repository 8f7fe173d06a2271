/**
 * @file device_registry.hpp
 * @brief Thread-safe ordered registry of discovered bulbs.
 *
 * The DeviceRegistry keeps one record per device id, in the order the
 * ids were first seen. Replies for an id that is already known replace
 * the stored record in place (last write wins).
 *
 * @copyright Copyright (c) 2024 LightScout Contributors
 * @license MIT License
 */

#pragma once

#include "lightscout/core/device_info.hpp"
#include "lightscout/core/export.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lightscout {
namespace core {

/**
 * @enum UpsertResult
 * @brief Outcome of DeviceRegistry::upsert().
 */
enum class UpsertResult {
    ADDED,      ///< First record for this id, appended
    UPDATED     ///< Replaced the existing record in place
};

inline const char* upsertResultToString(UpsertResult result) {
    switch (result) {
        case UpsertResult::ADDED: return "added";
        case UpsertResult::UPDATED: return "updated";
        default: return "unknown";
    }
}

/**
 * @class DeviceRegistry
 * @brief Insertion-ordered, id-keyed device collection.
 *
 * All access is thread-safe using a read-write lock (shared_mutex).
 *
 * Usage:
 * @code
 * DeviceRegistry registry;
 * registry.upsert(info);
 * for (const auto& device : registry.snapshot()) { ... }
 * @endcode
 */
class LIGHTSCOUT_CORE_API DeviceRegistry {
public:
    DeviceRegistry() = default;
    ~DeviceRegistry() = default;

    // Non-copyable
    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    /**
     * @brief Insert a new record or replace the record with the same id.
     * @param info Record to store.
     * @return ADDED if the id was unknown, UPDATED otherwise.
     */
    UpsertResult upsert(const DeviceInfo& info);

    /**
     * @brief Copy of all records in first-seen order.
     */
    std::vector<DeviceInfo> snapshot() const;

    /**
     * @brief Number of distinct device ids.
     */
    size_t count() const;

    /**
     * @brief Copy of the record for an id, if present.
     */
    std::optional<DeviceInfo> find(const std::string& id) const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::vector<DeviceInfo> devices_;

    // id -> position in devices_
    std::unordered_map<std::string, size_t> index_;
};

}  // namespace core
}  // namespace lightscout
