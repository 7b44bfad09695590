/*
 * logging_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Logging configuration section

**************************************************/

#ifndef HUBBRIDGE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
#define HUBBRIDGE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP

#include <string>

#include "../core/config_section.hpp"

namespace hubbridge::config {

/**
 * @brief Log level enumeration
 */
enum class LogLevel { Trace, Debug, Info, Warn, Error, Critical, Off };

/**
 * @brief Convert LogLevel to string
 */
[[nodiscard]] inline std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

/**
 * @brief Convert string to LogLevel
 */
[[nodiscard]] inline std::optional<LogLevel> logLevelFromString(
    const std::string& str) {
    if (str == "trace") return LogLevel::Trace;
    if (str == "debug") return LogLevel::Debug;
    if (str == "info") return LogLevel::Info;
    if (str == "warn" || str == "warning") return LogLevel::Warn;
    if (str == "error" || str == "err") return LogLevel::Error;
    if (str == "critical" || str == "fatal") return LogLevel::Critical;
    if (str == "off" || str == "none") return LogLevel::Off;
    return std::nullopt;
}

/**
 * @brief Logging configuration
 *
 * @example
 * ```yaml
 * logging:
 *   level: debug
 *   logFile: logs/hubbridge.log
 *   maxFileSize: 10485760  # 10 MB
 *   maxFiles: 5
 * ```
 */
struct LoggingConfig : ConfigSection<LoggingConfig> {
    static constexpr std::string_view PATH = "logging";

    LogLevel level{LogLevel::Info};  ///< Level applied to every logger
    bool consoleColor{true};         ///< Enable ANSI color codes

    /// Placeholders: %Y %m %d %H %M %S %e (milliseconds), %l (level),
    /// %n (logger name), %t (thread id), %v (message)
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v"};

    std::string logFile;                   ///< Rotating file sink; empty = off
    size_t maxFileSize{10 * 1024 * 1024};  ///< Max file size before rotation
    size_t maxFiles{5};                    ///< Max number of rotated files

    [[nodiscard]] json serialize() const {
        return {{"level", logLevelToString(level)},
                {"consoleColor", consoleColor},
                {"pattern", pattern},
                {"logFile", logFile},
                {"maxFileSize", maxFileSize},
                {"maxFiles", maxFiles}};
    }

    [[nodiscard]] static LoggingConfig deserialize(const json& j) {
        LoggingConfig cfg;

        auto levelName = j.value("level", logLevelToString(cfg.level));
        auto parsed = logLevelFromString(levelName);
        if (!parsed) {
            throw device::ConfigurationException("Unknown log level: " +
                                                  levelName);
        }
        cfg.level = *parsed;

        cfg.consoleColor = j.value("consoleColor", cfg.consoleColor);
        cfg.pattern = j.value("pattern", cfg.pattern);
        cfg.logFile = j.value("logFile", cfg.logFile);
        cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
        cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);

        if (cfg.maxFileSize < 1024) {
            throw device::ConfigurationException(
                "logging.maxFileSize must be at least 1024 bytes");
        }
        if (cfg.maxFiles == 0) {
            throw device::ConfigurationException(
                "logging.maxFiles must be positive");
        }
        return cfg;
    }
};

}  // namespace hubbridge::config

#endif  // HUBBRIDGE_CONFIG_SECTIONS_LOGGING_CONFIG_HPP
