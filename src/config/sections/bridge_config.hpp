/*
 * bridge_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Platform endpoints and bridge time budgets

**************************************************/

#ifndef HUBBRIDGE_CONFIG_SECTIONS_BRIDGE_CONFIG_HPP
#define HUBBRIDGE_CONFIG_SECTIONS_BRIDGE_CONFIG_HPP

#include <chrono>
#include <string>

#include "../core/config_section.hpp"

namespace hubbridge::config {

/**
 * @brief Bridge configuration
 *
 * Durations are stored as milliseconds; the JSON keys carry an `Ms` suffix.
 *
 * @example
 * ```yaml
 * bridge:
 *   commandTimeoutMs: 10000
 *   cacheTtlMs: 10000
 * ```
 */
struct BridgeConfig : ConfigSection<BridgeConfig> {
    static constexpr std::string_view PATH = "bridge";

    // ========================================================================
    // Endpoints
    // ========================================================================

    std::string apiHost{"https://api2.afero.net"};
    std::string dataHost{"https://semantics2.afero.net"};
    std::string tokenUrl{
        "https://accounts.hubspaceconnect.com/auth/realms/thd/protocol/"
        "openid-connect/token"};
    std::string clientId{"hubspace_android"};
    std::string userAgent{"Dart/2.15 (dart:io)"};
    bool verifySsl{true};

    // ========================================================================
    // Time budgets
    // ========================================================================

    std::chrono::milliseconds authTimeout{20000};     ///< Startup initialize
    std::chrono::milliseconds startupWait{25000};     ///< start() ready wait
    std::chrono::milliseconds commandTimeout{10000};  ///< Per blocking call
    std::chrono::milliseconds closeTimeout{5000};     ///< Session close
    std::chrono::milliseconds httpTimeout{10000};     ///< Per HTTP request
    std::chrono::milliseconds cacheTtl{10000};        ///< Status cache TTL

    [[nodiscard]] json serialize() const {
        return {{"apiHost", apiHost},
                {"dataHost", dataHost},
                {"tokenUrl", tokenUrl},
                {"clientId", clientId},
                {"userAgent", userAgent},
                {"verifySsl", verifySsl},
                {"authTimeoutMs", authTimeout.count()},
                {"startupWaitMs", startupWait.count()},
                {"commandTimeoutMs", commandTimeout.count()},
                {"closeTimeoutMs", closeTimeout.count()},
                {"httpTimeoutMs", httpTimeout.count()},
                {"cacheTtlMs", cacheTtl.count()}};
    }

    [[nodiscard]] static BridgeConfig deserialize(const json& j) {
        BridgeConfig cfg;
        cfg.apiHost = j.value("apiHost", cfg.apiHost);
        cfg.dataHost = j.value("dataHost", cfg.dataHost);
        cfg.tokenUrl = j.value("tokenUrl", cfg.tokenUrl);
        cfg.clientId = j.value("clientId", cfg.clientId);
        cfg.userAgent = j.value("userAgent", cfg.userAgent);
        cfg.verifySsl = j.value("verifySsl", cfg.verifySsl);

        cfg.authTimeout = readDuration(j, "authTimeoutMs", cfg.authTimeout);
        cfg.startupWait = readDuration(j, "startupWaitMs", cfg.startupWait);
        cfg.commandTimeout =
            readDuration(j, "commandTimeoutMs", cfg.commandTimeout);
        cfg.closeTimeout = readDuration(j, "closeTimeoutMs", cfg.closeTimeout);
        cfg.httpTimeout = readDuration(j, "httpTimeoutMs", cfg.httpTimeout);
        cfg.cacheTtl = readDuration(j, "cacheTtlMs", cfg.cacheTtl);
        return cfg;
    }

private:
    static std::chrono::milliseconds readDuration(
        const json& j, const char* key, std::chrono::milliseconds fallback) {
        auto value = j.value(key, static_cast<long long>(fallback.count()));
        if (value <= 0) {
            throw device::ConfigurationException(
                std::string("bridge.") + key + " must be positive");
        }
        return std::chrono::milliseconds(value);
    }
};

}  // namespace hubbridge::config

#endif  // HUBBRIDGE_CONFIG_SECTIONS_BRIDGE_CONFIG_HPP
