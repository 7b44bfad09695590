/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Loads the bridge configuration from file, dotenv and
environment

**************************************************/

#ifndef HUBBRIDGE_CONFIG_CONFIG_LOADER_HPP
#define HUBBRIDGE_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "sections/sections.hpp"

namespace hubbridge::config {

namespace fs = std::filesystem;

/// Environment variables consulted for credentials.
inline constexpr const char* ENV_EMAIL = "HUBSPACE_EMAIL";
inline constexpr const char* ENV_PASSWORD = "HUBSPACE_PASSWORD";
inline constexpr const char* ENV_REFRESH_TOKEN = "HUBSPACE_REFRESH_TOKEN";

/**
 * @brief The complete, validated configuration of one process
 */
struct AppConfig {
    CredentialsConfig credentials;
    BridgeConfig bridge;
    LoggingConfig logging;
    PresetConfig presets;

    /**
     * @brief Whole document with credentials redacted
     */
    [[nodiscard]] json toJson() const;
};

/**
 * @brief Configuration loader
 *
 * Precedence, lowest first: section defaults, configuration file, dotenv
 * file, process environment. Every error surfaces as
 * device::ConfigurationException.
 */
class ConfigLoader {
public:
    using EnvLookup =
        std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Read a JSON (`.json`) or YAML (`.yaml`, `.yml`) document
     */
    [[nodiscard]] static json readDocument(const fs::path& path);

    /**
     * @brief Build and validate every section of a document
     */
    [[nodiscard]] static AppConfig fromDocument(const json& document);

    /**
     * @brief readDocument() followed by fromDocument()
     */
    [[nodiscard]] static AppConfig loadFile(const fs::path& path);

    /**
     * @brief Parse `KEY=VALUE` lines
     *
     * Blank lines and `#` comments are skipped, an `export ` prefix is
     * accepted and matching surrounding quotes are stripped.
     */
    [[nodiscard]] static std::map<std::string, std::string> parseDotenv(
        std::string_view content);

    /**
     * @brief parseDotenv() on a file; a missing file yields no entries
     */
    [[nodiscard]] static std::map<std::string, std::string> loadDotenv(
        const fs::path& path);

    /**
     * @brief Overlay dotenv values, then environment values, on credentials
     */
    static void applyCredentialOverrides(
        CredentialsConfig& credentials,
        const std::map<std::string, std::string>& dotenv,
        const EnvLookup& env = systemEnv);

    /**
     * @brief Full load used by the executable
     *
     * @param configPath Optional configuration file
     * @param envFile Optional dotenv file
     */
    [[nodiscard]] static AppConfig load(
        const std::optional<fs::path>& configPath,
        const std::optional<fs::path>& envFile,
        const EnvLookup& env = systemEnv);

    /**
     * @brief std::getenv, with empty values treated as unset
     */
    [[nodiscard]] static std::optional<std::string> systemEnv(
        const std::string& name);
};

}  // namespace hubbridge::config

#endif  // HUBBRIDGE_CONFIG_CONFIG_LOADER_HPP
