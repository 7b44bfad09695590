/**
 * @file logging.hpp
 * @brief Main header for hubbridge logging.
 *
 * @par Usage Example:
 * @code
 * #include "logging/logging.hpp"
 *
 * hubbridge::logging::initialize(config.logging);
 *
 * auto logger = hubbridge::logging::get("worker");
 * logger->info("Hello, logging!");
 * @endcode
 *
 * Logger names in use: "hubbridge" (facade, configuration), "afero"
 * (platform client), "worker" (background worker and executor).
 *
 * @date 2026-10
 * @author Max Qian <lightapt.com>
 * @copyright Copyright (C) 2023-2024 Max Qian
 */

#ifndef HUBBRIDGE_LOGGING_LOGGING_HPP
#define HUBBRIDGE_LOGGING_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "core/logging_manager.hpp"

namespace hubbridge::logging {

/**
 * @brief Configure sinks, level and pattern for every logger.
 * @param config Logging section of the configuration.
 */
inline void initialize(const config::LoggingConfig& config) {
    LoggingManager::getInstance().initialize(config);
}

/**
 * @brief Get (creating on first use) a named logger.
 * @param name Logger name.
 * @return Shared pointer to the logger.
 */
[[nodiscard]] inline auto get(const std::string& name)
    -> std::shared_ptr<spdlog::logger> {
    return LoggingManager::getInstance().getLogger(name);
}

}  // namespace hubbridge::logging

#endif  // HUBBRIDGE_LOGGING_LOGGING_HPP
