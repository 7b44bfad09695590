/*
 * hubspace_bridge.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Bridge facade implementation

**************************************************/

#include "hubspace_bridge.hpp"

#include "client/afero/cloud_session.hpp"
#include "client/afero/http_transport.hpp"
#include "client/afero/token_source.hpp"
#include "logging/logging.hpp"

namespace hubbridge {

namespace {

auto toCredentials(const config::CredentialsConfig& credentials)
    -> afero::Credentials {
    return afero::Credentials{credentials.email, credentials.password,
                              credentials.refreshToken};
}

auto toWorkerConfig(const config::AppConfig& config) -> worker::WorkerConfig {
    worker::WorkerConfig workerConfig;
    workerConfig.credentials = toCredentials(config.credentials);
    workerConfig.dataHost = config.bridge.dataHost;
    workerConfig.authTimeout = config.bridge.authTimeout;
    workerConfig.closeTimeout = config.bridge.closeTimeout;
    return workerConfig;
}

auto toExecutorConfig(const config::BridgeConfig& config)
    -> device::ExecutorConfig {
    return device::ExecutorConfig{config.dataHost, config.commandTimeout};
}

}  // namespace

auto makeCloudSessionFactory(const config::BridgeConfig& config)
    -> worker::SessionFactory {
    return [config]() -> std::unique_ptr<afero::SessionProvider> {
        afero::CurlTransportConfig transportConfig;
        transportConfig.user_agent = config.userAgent;
        transportConfig.verify_ssl = config.verifySsl;
        auto transport =
            std::make_shared<afero::CurlTransport>(transportConfig);

        afero::TokenEndpointConfig tokenConfig;
        tokenConfig.token_url = config.tokenUrl;
        tokenConfig.client_id = config.clientId;
        tokenConfig.timeout = config.httpTimeout;

        afero::CloudSessionConfig sessionConfig;
        sessionConfig.api_host = config.apiHost;
        sessionConfig.data_host = config.dataHost;
        sessionConfig.http_timeout = config.httpTimeout;

        return std::make_unique<afero::AferoCloudSession>(
            transport,
            std::make_unique<afero::RefreshTokenSource>(transport, tokenConfig),
            sessionConfig);
    };
}

HubspaceBridge::HubspaceBridge(const config::AppConfig& config)
    : HubspaceBridge(config, makeCloudSessionFactory(config.bridge)) {}

HubspaceBridge::HubspaceBridge(const config::AppConfig& config,
                               worker::SessionFactory factory)
    : config_(config),
      logger_(logging::get("hubbridge")),
      cache_(config.bridge.cacheTtl),
      worker_(toWorkerConfig(config), std::move(factory), catalog_),
      syncBridge_(worker_, config.bridge.commandTimeout),
      executor_(catalog_, cache_, syncBridge_,
                toExecutorConfig(config.bridge)) {}

HubspaceBridge::~HubspaceBridge() { stop(); }

auto HubspaceBridge::start() -> bool {
    worker_.start();
    if (!worker_.waitReady(config_.bridge.startupWait)) {
        logger_->warn("Startup still running after {}ms; continuing",
                      config_.bridge.startupWait.count());
        return false;
    }
    return true;
}

void HubspaceBridge::stop() { worker_.stop(); }

auto HubspaceBridge::isReady() const -> bool { return worker_.isReady(); }

auto HubspaceBridge::isConnected() const -> bool {
    return worker_.hasSession();
}

auto HubspaceBridge::resolve(const std::string& nameOrId) const
    -> std::optional<std::string> {
    return catalog_.resolve(nameOrId);
}

auto HubspaceBridge::list() const -> std::vector<device::Device> {
    return catalog_.list();
}

auto HubspaceBridge::turnOn(const std::string& nameOrId) -> ActionResult {
    return ActionResult::fromResult(executor_.turnOn(nameOrId));
}

auto HubspaceBridge::turnOff(const std::string& nameOrId) -> ActionResult {
    return ActionResult::fromResult(executor_.turnOff(nameOrId));
}

auto HubspaceBridge::setBrightness(const std::string& nameOrId, int percent)
    -> ActionResult {
    return ActionResult::fromResult(
        executor_.setBrightness(nameOrId, percent));
}

auto HubspaceBridge::setColor(const std::string& nameOrId, std::uint8_t r,
                              std::uint8_t g, std::uint8_t b) -> ActionResult {
    return ActionResult::fromResult(
        executor_.setColor(nameOrId, device::RgbColor{r, g, b}));
}

auto HubspaceBridge::setEffect(const std::string& nameOrId,
                               const std::string& effect) -> ActionResult {
    return ActionResult::fromResult(executor_.setEffect(nameOrId, effect));
}

auto HubspaceBridge::setColorTemperature(const std::string& nameOrId,
                                         int kelvin) -> ActionResult {
    return ActionResult::fromResult(
        executor_.setColorTemperature(nameOrId, kelvin));
}

auto HubspaceBridge::status(const std::string& nameOrId) -> json {
    auto result = executor_.status(nameOrId);
    if (!result) {
        return result.error().toJson();
    }
    return result->toJson();
}

auto HubspaceBridge::statusAll() -> json {
    json result = json::object();
    for (const auto& entry : executor_.statusAll()) {
        result[entry.device.id] = entry.toJson();
    }
    return result;
}

auto HubspaceBridge::discover() -> json {
    json report = json::array();
    for (const auto& device : catalog_.list()) {
        auto status = executor_.status(device.id);
        device::DeviceStatus entry{
            device, status ? *status
                           : device::StatusSnapshot::failed(
                                 status.error().message)};
        report.push_back(entry.toJson());
    }
    logger_->info("Discovery report covers {} device(s)", report.size());
    return report;
}

auto HubspaceBridge::presets() const -> json {
    return config_.presets.toJson();
}

auto HubspaceBridge::applyPreset(const std::string& key) -> ActionResult {
    const auto* preset = config_.presets.find(key);
    if (preset == nullptr) {
        return ActionResult{false, "Unknown preset: " + key};
    }

    logger_->info("Applying preset '{}' ({} entries)", preset->name,
                  preset->entries.size());

    std::string failures;
    for (const auto& entry : preset->entries) {
        auto result = entry.brightness == 0
                          ? executor_.turnOff(entry.device)
                          : executor_.setBrightness(entry.device,
                                                    entry.brightness);
        if (result && entry.brightness > 0 && entry.color) {
            result = executor_.setColor(entry.device, *entry.color);
        }
        if (!result) {
            logger_->warn("Preset '{}': {} failed: {}", key, entry.device,
                          result.error().message);
            failures += (failures.empty() ? "" : "; ") + entry.device + ": " +
                        result.error().message;
        }
    }

    if (!failures.empty()) {
        return ActionResult{false, "Preset '" + key +
                                       "' partially applied: " + failures};
    }
    return ActionResult{true, {}};
}

}  // namespace hubbridge
