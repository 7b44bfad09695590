/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Central Logging Manager - owns sinks and named loggers

**************************************************/

#ifndef HUBBRIDGE_LOGGING_LOGGING_MANAGER_HPP
#define HUBBRIDGE_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/sections/logging_config.hpp"

namespace hubbridge::logging {

/**
 * @brief Map a configured level onto spdlog's
 */
[[nodiscard]] auto toSpdlogLevel(config::LogLevel level)
    -> spdlog::level::level_enum;

/**
 * @brief Central logging manager with spdlog integration
 *
 * Provides:
 * - A shared set of sinks (colour console, optional rotating file)
 * - Named loggers created on demand over those sinks
 * - Runtime level configuration
 *
 * Before initialize() is called, loggers are created over a plain colour
 * console sink at info level, so library code can log unconditionally.
 */
class LoggingManager {
public:
    /**
     * @brief Get singleton instance
     */
    static auto getInstance() -> LoggingManager&;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief (Re)build sinks and loggers from configuration
     * @throws spdlog::spdlog_ex if the log file cannot be opened
     */
    void initialize(const config::LoggingConfig& config);

    /**
     * @brief Flush and drop every logger
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Get or create a named logger
     */
    auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger>;

    /**
     * @brief Set log level for all loggers
     */
    void setGlobalLevel(spdlog::level::level_enum level);

    /**
     * @brief Flush all loggers
     */
    void flush();

private:
    LoggingManager();
    ~LoggingManager();

    void buildSinks(const config::LoggingConfig& config);
    auto createLogger(const std::string& name)
        -> std::shared_ptr<spdlog::logger>;
    void setupDefaultLogger();

    mutable std::shared_mutex mutex_;
    config::LoggingConfig config_;
    std::vector<spdlog::sink_ptr> sinks_;
    std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> loggers_;
    bool initialized_{false};
};

}  // namespace hubbridge::logging

#endif  // HUBBRIDGE_LOGGING_LOGGING_MANAGER_HPP
