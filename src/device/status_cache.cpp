/*
 * status_cache.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Status cache implementation

*************************************************/

#include "status_cache.hpp"

namespace hubbridge::device {

StatusCache::StatusCache(std::chrono::milliseconds ttl, NowFunction now)
    : ttl_(ttl), now_(std::move(now)) {}

auto StatusCache::get(const std::string& deviceId)
    -> std::optional<StatusSnapshot> {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(deviceId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now_() - it->second.observedAt >= ttl_) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.snapshot;
}

auto StatusCache::put(const std::string& deviceId,
                      const StatusSnapshot& snapshot) -> bool {
    if (snapshot.error) {
        return false;
    }
    std::lock_guard lock(mutex_);
    entries_.insert_or_assign(deviceId,
                              StatusEntry{deviceId, snapshot, now_()});
    return true;
}

void StatusCache::invalidate(const std::string& deviceId) {
    std::lock_guard lock(mutex_);
    entries_.erase(deviceId);
}

auto StatusCache::contains(const std::string& deviceId) const -> bool {
    std::lock_guard lock(mutex_);
    return entries_.contains(deviceId);
}

void StatusCache::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

}  // namespace hubbridge::device
