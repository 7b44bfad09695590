/*
 * device_catalog.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Device catalog built by discovery, with a name index

*************************************************/

#ifndef HUBBRIDGE_DEVICE_DEVICE_CATALOG_HPP
#define HUBBRIDGE_DEVICE_DEVICE_CATALOG_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "device_types.hpp"

namespace hubbridge::device {

/**
 * @brief Mapping from device id to metadata
 *
 * Filled once by the background worker during startup and read by caller
 * threads afterwards. Display names are not unique on the platform; when two
 * devices share a name the one added last owns the name index entry.
 */
class DeviceCatalog {
public:
    DeviceCatalog() = default;

    DeviceCatalog(const DeviceCatalog&) = delete;
    DeviceCatalog& operator=(const DeviceCatalog&) = delete;

    /**
     * @brief Add or replace a device
     */
    void add(const Device& device);

    /**
     * @brief Resolve a display name or id to an id
     * @param nameOrId Known id (returned unchanged) or a display name,
     *                 matched case-insensitively
     * @return Device id, or nullopt for an unknown device
     */
    [[nodiscard]] auto resolve(const std::string& nameOrId) const
        -> std::optional<std::string>;

    [[nodiscard]] auto get(const std::string& id) const
        -> std::optional<Device>;

    /**
     * @brief Snapshot copy of all devices, in discovery order
     */
    [[nodiscard]] auto list() const -> std::vector<Device>;

    [[nodiscard]] auto size() const -> size_t;
    [[nodiscard]] auto empty() const -> bool;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Device> devices_;
    std::unordered_map<std::string, std::string> nameIndex_;
    std::vector<std::string> order_;
};

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_DEVICE_CATALOG_HPP
