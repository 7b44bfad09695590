/*
 * command_executor.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Executes control and query operations against the platform,
preferring the class controllers and falling back to direct state access

*************************************************/

#ifndef HUBBRIDGE_DEVICE_COMMAND_EXECUTOR_HPP
#define HUBBRIDGE_DEVICE_COMMAND_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "client/afero/session.hpp"
#include "common/device_result.hpp"
#include "device_catalog.hpp"
#include "device_types.hpp"
#include "status_cache.hpp"
#include "worker/sync_bridge.hpp"

namespace hubbridge::device {

/**
 * @brief Executor settings
 */
struct ExecutorConfig {
    std::string dataHost{"https://semantics2.afero.net"};
    std::chrono::milliseconds commandTimeout{10000};
};

/**
 * @brief A device together with its status, as reported by statusAll()
 */
struct DeviceStatus {
    Device device;
    StatusSnapshot status;

    /**
     * @brief Device fields merged with the snapshot fields
     */
    [[nodiscard]] auto toJson() const -> json {
        auto j = device.toJson();
        j.update(status.toJson());
        return j;
    }
};

/**
 * @brief Control and query operations on cataloged devices
 *
 * Every mutating operation:
 *
 * 1. Fails with NotConnected when there is no session, then with
 *    UnknownDevice when the name or id does not resolve.
 * 2. Drops the cached status of the device.
 * 3. Runs on the worker: the class controller is used when it holds the
 *    device; a throw or a device it does not hold sends the operation
 *    through a direct state write instead.
 *
 * Only power has a controller operation; brightness, colour, effect and
 * colour temperature are always direct state writes, each preceded by a
 * power-on whose outcome is ignored. Brightness 0 is a power-off.
 */
class CommandExecutor {
public:
    CommandExecutor(DeviceCatalog& catalog, StatusCache& cache,
                    worker::SyncBridge& bridge, ExecutorConfig config = {});

    auto turnOn(const std::string& nameOrId) -> DeviceVoidResult;
    auto turnOff(const std::string& nameOrId) -> DeviceVoidResult;

    /**
     * @brief Set brightness in percent; 0 turns the device off
     */
    auto setBrightness(const std::string& nameOrId, int percent)
        -> DeviceVoidResult;

    auto setColor(const std::string& nameOrId, RgbColor color)
        -> DeviceVoidResult;

    /**
     * @brief Start a named colour sequence
     */
    auto setEffect(const std::string& nameOrId, const std::string& effect)
        -> DeviceVoidResult;

    auto setColorTemperature(const std::string& nameOrId, int kelvin)
        -> DeviceVoidResult;

    /**
     * @brief Current status of one device
     *
     * Served from the cache while fresh, otherwise from the class
     * controller's in-memory state or a direct fetch. A device that is off
     * reports brightness 0. A failed read is returned as an error snapshot
     * and never cached.
     *
     * @return The snapshot, or UnknownDevice
     */
    auto status(const std::string& nameOrId) -> DeviceResult<StatusSnapshot>;

    /**
     * @brief Status of every light; failures stay confined to their device
     */
    auto statusAll() -> std::vector<DeviceStatus>;

private:
    auto prepare(const std::string& nameOrId) -> DeviceResult<Device>;
    auto mutate(const std::string& operation, const std::string& nameOrId,
                const std::function<DeviceVoidResult(afero::SessionProvider&,
                                                     const Device&)>& work)
        -> DeviceVoidResult;

    /// Worker-side: controller first, direct state write as fallback.
    auto setPower(afero::SessionProvider& session, const Device& device,
                  bool on) -> DeviceVoidResult;
    /// Worker-side: power-on (outcome ignored) followed by a value write.
    auto setValue(afero::SessionProvider& session, const Device& device,
                  std::string_view functionClass, const json& value)
        -> DeviceVoidResult;
    /// Worker-side: PUT one function class value to the state endpoint and
    /// record it in the controller's held state once accepted.
    auto writeState(afero::SessionProvider& session, const Device& device,
                    std::string_view functionClass, const json& value)
        -> DeviceVoidResult;
    /// Worker-side: controller memory first, direct fetch as fallback.
    auto readStatus(afero::SessionProvider& session, const Device& device)
        -> DeviceResult<StatusSnapshot>;

    DeviceCatalog& catalog_;
    StatusCache& cache_;
    worker::SyncBridge& bridge_;
    ExecutorConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_COMMAND_EXECUTOR_HPP
