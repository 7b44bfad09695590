/*
 * yaml_parser.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: YAML to JSON conversion for configuration files

**************************************************/

#ifndef HUBBRIDGE_CONFIG_COMPONENTS_YAML_PARSER_HPP
#define HUBBRIDGE_CONFIG_COMPONENTS_YAML_PARSER_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace hubbridge::config {

using json = nlohmann::json;

/**
 * @brief YAML parsing options
 */
struct YamlParseOptions {
    size_t maxDepth{100};  ///< Maximum nesting depth
};

/**
 * @brief YAML parser built on yaml-cpp
 *
 * Converts YAML documents into JSON so that every configuration section
 * deserializes from one representation. Untagged scalars are typed the way
 * YAML 1.1 reads them: booleans, null, integers, floats, then strings.
 */
class YamlParser {
public:
    /**
     * @brief Parse YAML string to JSON
     * @return JSON value or nullopt on error (see getLastError())
     */
    [[nodiscard]] static std::optional<json> parse(
        std::string_view content, const YamlParseOptions& options = {});

    /**
     * @brief Parse YAML file to JSON
     * @return JSON value or nullopt on error (see getLastError())
     */
    [[nodiscard]] static std::optional<json> parseFile(
        const fs::path& path, const YamlParseOptions& options = {});

    /**
     * @brief Get the last error message of the calling thread
     */
    [[nodiscard]] static std::string getLastError();

private:
    static thread_local std::string lastError_;
};

}  // namespace hubbridge::config

#endif  // HUBBRIDGE_CONFIG_COMPONENTS_YAML_PARSER_HPP
