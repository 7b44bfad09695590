/*
 * device_catalog.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Device catalog implementation

*************************************************/

#include "device_catalog.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

namespace hubbridge::device {

namespace {

// ASCII lower-case, for the name index
auto toLowerCopy(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

}  // namespace

void DeviceCatalog::add(const Device& device) {
    std::unique_lock lock(mutex_);
    auto [it, inserted] = devices_.insert_or_assign(device.id, device);
    if (inserted) {
        order_.push_back(device.id);
    }
    nameIndex_[toLowerCopy(device.name)] = device.id;
}

auto DeviceCatalog::resolve(const std::string& nameOrId) const
    -> std::optional<std::string> {
    std::shared_lock lock(mutex_);
    if (devices_.contains(nameOrId)) {
        return nameOrId;
    }
    auto it = nameIndex_.find(toLowerCopy(nameOrId));
    if (it != nameIndex_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto DeviceCatalog::get(const std::string& id) const -> std::optional<Device> {
    std::shared_lock lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto DeviceCatalog::list() const -> std::vector<Device> {
    std::shared_lock lock(mutex_);
    std::vector<Device> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(devices_.at(id));
    }
    return result;
}

auto DeviceCatalog::size() const -> size_t {
    std::shared_lock lock(mutex_);
    return devices_.size();
}

auto DeviceCatalog::empty() const -> bool {
    std::shared_lock lock(mutex_);
    return devices_.empty();
}

void DeviceCatalog::clear() {
    std::unique_lock lock(mutex_);
    devices_.clear();
    nameIndex_.clear();
    order_.clear();
}

}  // namespace hubbridge::device
