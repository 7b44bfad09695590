/*
 * yaml_parser.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: YAML parser implementation

**************************************************/

#include "yaml_parser.hpp"

#include <stdexcept>

#include <yaml-cpp/yaml.h>

#include "logging/logging.hpp"

namespace hubbridge::config {

thread_local std::string YamlParser::lastError_;

namespace {

std::optional<long long> parseInteger(const std::string& value) {
    try {
        size_t pos;
        long long intVal = std::stoll(value, &pos);
        if (pos == value.size()) {
            return intVal;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    return std::nullopt;
}

std::optional<double> parseFloat(const std::string& value) {
    try {
        size_t pos;
        double floatVal = std::stod(value, &pos);
        if (pos == value.size()) {
            return floatVal;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    return std::nullopt;
}

json scalarToJson(const YAML::Node& node) {
    std::string value = node.as<std::string>();

    // Quoted scalars stay strings
    if (node.Tag() == "!") {
        return json(value);
    }

    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" || value == "on" ||
        value == "On" || value == "ON") {
        return json(true);
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" || value == "off" ||
        value == "Off" || value == "OFF") {
        return json(false);
    }
    if (value == "null" || value == "Null" || value == "NULL" ||
        value == "~" || value.empty()) {
        return json(nullptr);
    }
    if (auto intVal = parseInteger(value)) {
        return json(*intVal);
    }
    if (auto floatVal = parseFloat(value)) {
        return json(*floatVal);
    }
    return json(value);
}

json yamlNodeToJson(const YAML::Node& node, size_t depth, size_t maxDepth) {
    if (depth > maxDepth) {
        throw std::runtime_error("Maximum nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Null:
            return json(nullptr);

        case YAML::NodeType::Scalar:
            return scalarToJson(node);

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1, maxDepth));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                std::string key = pair.first.as<std::string>();
                obj[key] = yamlNodeToJson(pair.second, depth + 1, maxDepth);
            }
            return obj;
        }

        default:
            return json(nullptr);
    }
}

}  // namespace

std::optional<json> YamlParser::parse(std::string_view content,
                                      const YamlParseOptions& options) {
    lastError_.clear();

    try {
        YAML::Node root = YAML::Load(std::string(content));
        return yamlNodeToJson(root, 0, options.maxDepth);
    } catch (const YAML::Exception& e) {
        lastError_ = std::string("YAML parse error: ") + e.what();
        logging::get("hubbridge")->error("YamlParser: {}", lastError_);
        return std::nullopt;
    } catch (const std::exception& e) {
        lastError_ = std::string("Parse error: ") + e.what();
        logging::get("hubbridge")->error("YamlParser: {}", lastError_);
        return std::nullopt;
    }
}

std::optional<json> YamlParser::parseFile(const fs::path& path,
                                          const YamlParseOptions& options) {
    lastError_.clear();

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return yamlNodeToJson(root, 0, options.maxDepth);
    } catch (const YAML::Exception& e) {
        lastError_ = std::string("YAML parse error: ") + e.what();
        logging::get("hubbridge")->error("YamlParser: Failed to parse {}: {}",
                                         path.string(), lastError_);
        return std::nullopt;
    } catch (const std::exception& e) {
        lastError_ = std::string("Parse error: ") + e.what();
        logging::get("hubbridge")->error("YamlParser: Failed to parse {}: {}",
                                         path.string(), lastError_);
        return std::nullopt;
    }
}

std::string YamlParser::getLastError() { return lastError_; }

}  // namespace hubbridge::config
