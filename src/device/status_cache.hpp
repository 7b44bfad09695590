/*
 * status_cache.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Short-TTL cache of last-known device status

*************************************************/

#ifndef HUBBRIDGE_DEVICE_STATUS_CACHE_HPP
#define HUBBRIDGE_DEVICE_STATUS_CACHE_HPP

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "device_types.hpp"

namespace hubbridge::device {

/**
 * @brief Cached status with the time it was observed
 */
struct StatusEntry {
    std::string deviceId;
    StatusSnapshot snapshot;
    std::chrono::steady_clock::time_point observedAt;
};

/**
 * @brief Device id to last-known status, valid for a fixed TTL
 *
 * Caller threads invalidate, the worker populates. Invalidation is
 * delete-if-present and population is an overwrite keyed by id, so an
 * interleaving can at worst serve data that is replaced moments later.
 */
class StatusCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;

    static constexpr std::chrono::milliseconds kDefaultTtl{10000};

    explicit StatusCache(std::chrono::milliseconds ttl = kDefaultTtl,
                         NowFunction now = &Clock::now);

    /**
     * @brief Fresh snapshot for a device, if any
     *
     * Expired entries are dropped on read.
     */
    [[nodiscard]] auto get(const std::string& deviceId)
        -> std::optional<StatusSnapshot>;

    /**
     * @brief Store a snapshot; snapshots carrying an error are ignored
     * @return true if the snapshot was stored
     */
    auto put(const std::string& deviceId, const StatusSnapshot& snapshot)
        -> bool;

    /**
     * @brief Remove the entry for a device, if present
     */
    void invalidate(const std::string& deviceId);

    [[nodiscard]] auto contains(const std::string& deviceId) const -> bool;

    void clear();

    [[nodiscard]] auto ttl() const noexcept -> std::chrono::milliseconds {
        return ttl_;
    }

private:
    std::chrono::milliseconds ttl_;
    NowFunction now_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StatusEntry> entries_;
};

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_STATUS_CACHE_HPP
