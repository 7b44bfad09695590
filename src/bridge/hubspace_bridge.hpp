/*
 * hubspace_bridge.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Synchronous facade over the background worker, catalog,
status cache and command executor

**************************************************/

#ifndef HUBBRIDGE_BRIDGE_HUBSPACE_BRIDGE_HPP
#define HUBBRIDGE_BRIDGE_HUBSPACE_BRIDGE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config/config_loader.hpp"
#include "device/command_executor.hpp"
#include "device/device_catalog.hpp"
#include "device/status_cache.hpp"
#include "worker/background_worker.hpp"
#include "worker/sync_bridge.hpp"

namespace hubbridge {

using json = nlohmann::json;

/**
 * @brief Outcome of a mutating call: `{ok: true}` or `{error: message}`
 */
struct ActionResult {
    bool ok{false};
    std::string error;

    static auto fromResult(const device::DeviceVoidResult& result)
        -> ActionResult {
        if (result) {
            return ActionResult{true, {}};
        }
        return ActionResult{false, result.error().message};
    }

    [[nodiscard]] auto toJson() const -> json {
        if (ok) {
            return json{{"ok", true}};
        }
        return json{{"error", error}};
    }
};

/**
 * @brief Session factory talking to the real platform over libcurl
 */
[[nodiscard]] auto makeCloudSessionFactory(const config::BridgeConfig& config)
    -> worker::SessionFactory;

/**
 * @brief The bridge as seen by synchronous callers
 *
 * Owns the device catalog, the status cache and the background worker
 * (which owns the session). Every method may be called from any thread and
 * none of them throws; failures come back as ActionResult or `{error}`
 * objects.
 */
class HubspaceBridge {
public:
    /**
     * @brief Bridge backed by the cloud platform
     */
    explicit HubspaceBridge(const config::AppConfig& config);

    /**
     * @brief Bridge with a custom session factory
     */
    HubspaceBridge(const config::AppConfig& config,
                   worker::SessionFactory factory);

    ~HubspaceBridge();

    HubspaceBridge(const HubspaceBridge&) = delete;
    HubspaceBridge& operator=(const HubspaceBridge&) = delete;

    /**
     * @brief Start the worker and wait (bounded) for startup to complete
     * @return true if startup completed within the configured wait
     */
    auto start() -> bool;

    void stop();

    [[nodiscard]] auto isReady() const -> bool;
    [[nodiscard]] auto isConnected() const -> bool;

    // ==================== Catalog ====================

    [[nodiscard]] auto resolve(const std::string& nameOrId) const
        -> std::optional<std::string>;
    [[nodiscard]] auto list() const -> std::vector<device::Device>;

    // ==================== Control ====================

    auto turnOn(const std::string& nameOrId) -> ActionResult;
    auto turnOff(const std::string& nameOrId) -> ActionResult;
    auto setBrightness(const std::string& nameOrId, int percent)
        -> ActionResult;
    auto setColor(const std::string& nameOrId, std::uint8_t r, std::uint8_t g,
                  std::uint8_t b) -> ActionResult;
    auto setEffect(const std::string& nameOrId, const std::string& effect)
        -> ActionResult;
    auto setColorTemperature(const std::string& nameOrId, int kelvin)
        -> ActionResult;

    // ==================== Query ====================

    /**
     * @brief Snapshot JSON, or `{error}` for an unknown device
     */
    auto status(const std::string& nameOrId) -> json;

    /**
     * @brief Object keyed by light id; each value merges device and status
     */
    auto statusAll() -> json;

    /**
     * @brief Inventory report: every device of every class, in discovery
     * order, with its current state merged in
     *
     * A device whose state cannot be read carries an `error` field.
     */
    auto discover() -> json;

    // ==================== Presets ====================

    /**
     * @brief Configured presets keyed by preset key
     */
    [[nodiscard]] auto presets() const -> json;

    /**
     * @brief Apply every entry of a preset
     *
     * Entries are applied independently; the result is an error naming
     * every entry that failed.
     */
    auto applyPreset(const std::string& key) -> ActionResult;

private:
    config::AppConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    device::DeviceCatalog catalog_;
    device::StatusCache cache_;
    worker::BackgroundWorker worker_;
    worker::SyncBridge syncBridge_;
    device::CommandExecutor executor_;
};

}  // namespace hubbridge

#endif  // HUBBRIDGE_BRIDGE_HUBSPACE_BRIDGE_HPP
