/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Configuration loader implementation

**************************************************/

#include "config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "components/yaml_parser.hpp"
#include "logging/logging.hpp"

namespace hubbridge::config {

namespace {

std::string trim(std::string_view value) {
    auto begin = value.find_first_not_of(" \t\r");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r");
    return std::string(value.substr(begin, end - begin + 1));
}

std::string lowerExtension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return ext;
}

}  // namespace

json AppConfig::toJson() const {
    return {{std::string(CredentialsConfig::PATH), credentials.redacted()},
            {std::string(BridgeConfig::PATH), bridge.toJson()},
            {std::string(LoggingConfig::PATH), logging.toJson()},
            {std::string(PresetConfig::PATH), presets.toJson()}};
}

json ConfigLoader::readDocument(const fs::path& path) {
    if (!fs::exists(path)) {
        throw device::ConfigurationException("Configuration file not found: " +
                                              path.string());
    }

    const auto ext = lowerExtension(path);
    if (ext == ".yaml" || ext == ".yml") {
        auto document = YamlParser::parseFile(path);
        if (!document) {
            throw device::ConfigurationException(
                "Failed to parse " + path.string() + ": " +
                YamlParser::getLastError());
        }
        return document->is_null() ? json::object() : *document;
    }

    if (ext != ".json") {
        throw device::ConfigurationException(
            "Unsupported configuration format: " + path.string());
    }

    std::ifstream file(path);
    if (!file) {
        throw device::ConfigurationException("Cannot open " + path.string());
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw device::ConfigurationException("Failed to parse " +
                                              path.string() + ": " + e.what());
    }
}

AppConfig ConfigLoader::fromDocument(const json& document) {
    if (!document.is_object()) {
        throw device::ConfigurationException(
            "Configuration document must be an object");
    }

    AppConfig config;
    config.credentials = CredentialsConfig::fromDocument(document);
    config.bridge = BridgeConfig::fromDocument(document);
    config.logging = LoggingConfig::fromDocument(document);
    config.presets = PresetConfig::fromDocument(document);
    return config;
}

AppConfig ConfigLoader::loadFile(const fs::path& path) {
    auto config = fromDocument(readDocument(path));
    logging::get("hubbridge")
        ->debug("Loaded configuration from {} ({} presets)", path.string(),
                config.presets.presets.size());
    return config;
}

std::map<std::string, std::string> ConfigLoader::parseDotenv(
    std::string_view content) {
    std::map<std::string, std::string> values;
    std::istringstream stream{std::string(content)};
    std::string line;

    while (std::getline(stream, line)) {
        auto text = trim(line);
        if (text.empty() || text.front() == '#') {
            continue;
        }
        if (text.rfind("export ", 0) == 0) {
            text = trim(std::string_view(text).substr(7));
        }

        auto eq = text.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        auto key = trim(std::string_view(text).substr(0, eq));
        auto value = trim(std::string_view(text).substr(eq + 1));
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        }
        if (!key.empty()) {
            values[key] = value;
        }
    }
    return values;
}

std::map<std::string, std::string> ConfigLoader::loadDotenv(
    const fs::path& path) {
    std::ifstream file(path);
    if (!file) {
        logging::get("hubbridge")->debug("No dotenv file at {}", path.string());
        return {};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseDotenv(buffer.str());
}

void ConfigLoader::applyCredentialOverrides(
    CredentialsConfig& credentials,
    const std::map<std::string, std::string>& dotenv, const EnvLookup& env) {
    auto overlay = [&](const char* name, std::string& field) {
        if (auto it = dotenv.find(name); it != dotenv.end() &&
                                         !it->second.empty()) {
            field = it->second;
        }
        if (env) {
            if (auto value = env(name)) {
                field = *value;
            }
        }
    };

    overlay(ENV_EMAIL, credentials.email);
    overlay(ENV_PASSWORD, credentials.password);
    overlay(ENV_REFRESH_TOKEN, credentials.refreshToken);
}

AppConfig ConfigLoader::load(const std::optional<fs::path>& configPath,
                             const std::optional<fs::path>& envFile,
                             const EnvLookup& env) {
    AppConfig config = configPath ? loadFile(*configPath) : AppConfig{};
    std::map<std::string, std::string> dotenv;
    if (envFile) {
        dotenv = loadDotenv(*envFile);
    }
    applyCredentialOverrides(config.credentials, dotenv, env);
    return config;
}

std::optional<std::string> ConfigLoader::systemEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

}  // namespace hubbridge::config
