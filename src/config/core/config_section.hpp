/*
 * config_section.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: ConfigSection CRTP base class for typed configuration sections

**************************************************/

#ifndef HUBBRIDGE_CONFIG_CORE_CONFIG_SECTION_HPP
#define HUBBRIDGE_CONFIG_CORE_CONFIG_SECTION_HPP

#include <concepts>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "device/common/device_exceptions.hpp"

namespace hubbridge::config {

using json = nlohmann::json;

/**
 * @brief Concept for valid ConfigSection derived types
 */
template <typename T>
concept ConfigSectionDerived = requires(T t, const json& j) {
    { T::PATH } -> std::convertible_to<std::string_view>;
    { t.serialize() } -> std::convertible_to<json>;
    { T::deserialize(j) } -> std::convertible_to<T>;
};

/**
 * @brief CRTP base class for typed configuration sections
 *
 * Derived classes must:
 *
 * 1. Define a static constexpr PATH member naming the section key
 * 2. Implement serialize() to convert to JSON
 * 3. Implement static deserialize(const json&) to create from JSON,
 *    throwing device::ConfigurationException on invalid content
 *
 * @tparam Derived The derived configuration struct type (CRTP)
 *
 * @example
 * ```cpp
 * struct CredentialsConfig : ConfigSection<CredentialsConfig> {
 *     static constexpr std::string_view PATH = "credentials";
 *
 *     std::string email;
 *
 *     [[nodiscard]] json serialize() const { return {{"email", email}}; }
 *
 *     [[nodiscard]] static CredentialsConfig deserialize(const json& j) {
 *         CredentialsConfig config;
 *         config.email = j.value("email", config.email);
 *         return config;
 *     }
 * };
 * ```
 */
template <typename Derived>
class ConfigSection {
public:
    /**
     * @brief Get the key of this section in the configuration document
     */
    [[nodiscard]] static constexpr std::string_view path() noexcept {
        return Derived::PATH;
    }

    /**
     * @brief Convert this config to JSON
     */
    [[nodiscard]] json toJson() const {
        return static_cast<const Derived*>(this)->serialize();
    }

    /**
     * @brief Create a configuration from JSON
     * @throws device::ConfigurationException if the content is invalid
     */
    [[nodiscard]] static Derived fromJson(const json& j) {
        try {
            return Derived::deserialize(j);
        } catch (const json::exception& e) {
            throw device::ConfigurationException(
                "Invalid '" + std::string(Derived::PATH) +
                "' section: " + e.what());
        }
    }

    /**
     * @brief Read this section out of a whole configuration document
     *
     * A missing section yields the defaults.
     */
    [[nodiscard]] static Derived fromDocument(const json& document) {
        const std::string key(Derived::PATH);
        if (!document.is_object() || !document.contains(key) ||
            document[key].is_null()) {
            return Derived{};
        }
        return fromJson(document[key]);
    }

    /**
     * @brief Try to create a configuration from JSON
     * @return Configuration instance or nullopt when the content is invalid
     */
    [[nodiscard]] static std::optional<Derived> tryFromJson(const json& j) {
        try {
            return fromJson(j);
        } catch (const device::ConfigurationException&) {
            return std::nullopt;
        }
    }

    /**
     * @brief Get a default-constructed configuration
     */
    [[nodiscard]] static Derived defaults() { return Derived{}; }

    /**
     * @brief Merge another configuration into this one
     *
     * Values from other override values in this config; null values are
     * skipped.
     */
    void merge(const Derived& other) {
        auto thisJson = toJson();
        mergeJson(thisJson, other.toJson());
        *static_cast<Derived*>(this) = Derived::deserialize(thisJson);
    }

    [[nodiscard]] bool operator==(const ConfigSection& other) const {
        return toJson() == static_cast<const Derived&>(other).toJson();
    }

private:
    static void mergeJson(json& target, const json& source) {
        if (source.is_object()) {
            for (auto& [key, value] : source.items()) {
                if (value.is_object() && target.contains(key) &&
                    target[key].is_object()) {
                    mergeJson(target[key], value);
                } else if (!value.is_null()) {
                    target[key] = value;
                }
            }
        }
    }
};

}  // namespace hubbridge::config

#endif  // HUBBRIDGE_CONFIG_CORE_CONFIG_SECTION_HPP
