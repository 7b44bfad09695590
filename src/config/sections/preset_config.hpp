/*
 * preset_config.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Named lighting presets, validated at load time

**************************************************/

#ifndef HUBBRIDGE_CONFIG_SECTIONS_PRESET_CONFIG_HPP
#define HUBBRIDGE_CONFIG_SECTIONS_PRESET_CONFIG_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "../core/config_section.hpp"
#include "device/device_types.hpp"

namespace hubbridge::config {

/**
 * @brief Target state of one device within a preset
 */
struct PresetEntry {
    std::string device;  ///< Display name or id, resolved when applied
    int brightness{0};   ///< 0 turns the device off
    std::optional<device::RgbColor> color;

    [[nodiscard]] json toJson() const {
        json j{{"brightness", brightness}};
        if (color) {
            j["color"] = {color->r, color->g, color->b};
        }
        return j;
    }

    /**
     * @throws device::ConfigurationException on out-of-range values
     */
    [[nodiscard]] static PresetEntry fromJson(const std::string& reference,
                                              const json& j) {
        if (reference.empty()) {
            throw device::ConfigurationException(
                "Preset entry without a device reference");
        }
        if (!j.is_object()) {
            throw device::ConfigurationException("Preset entry for '" +
                                                  reference +
                                                  "' is not an object");
        }

        PresetEntry entry;
        entry.device = reference;
        entry.brightness = j.value("brightness", 0);
        if (entry.brightness < 0 || entry.brightness > 100) {
            throw device::ConfigurationException(
                "Preset brightness for '" + reference + "' must be 0..100");
        }

        if (j.contains("color") && !j["color"].is_null()) {
            const auto& color = j["color"];
            if (!color.is_array() || color.size() != 3) {
                throw device::ConfigurationException(
                    "Preset color for '" + reference + "' must be [r, g, b]");
            }
            std::uint8_t channels[3];
            for (size_t i = 0; i < 3; ++i) {
                if (!color[i].is_number_integer()) {
                    throw device::ConfigurationException(
                        "Preset color for '" + reference +
                        "' must contain integers");
                }
                auto value = color[i].get<int>();
                if (value < 0 || value > 255) {
                    throw device::ConfigurationException(
                        "Preset color for '" + reference + "' must be 0..255");
                }
                channels[i] = static_cast<std::uint8_t>(value);
            }
            entry.color = device::RgbColor{channels[0], channels[1],
                                           channels[2]};
        }
        return entry;
    }
};

/**
 * @brief A named scene applied device by device
 */
struct Preset {
    std::string key;
    std::string name;
    std::vector<PresetEntry> entries;

    [[nodiscard]] json toJson() const {
        json lights = json::object();
        for (const auto& entry : entries) {
            lights[entry.device] = entry.toJson();
        }
        return {{"name", name}, {"lights", lights}};
    }
};

/**
 * @brief The `presets` section
 *
 * @example
 * ```yaml
 * presets:
 *   movie:
 *     name: Movie Night
 *     lights:
 *       kitchen light: {brightness: 15, color: [255, 147, 41]}
 *       porch: {brightness: 0}
 * ```
 */
struct PresetConfig : ConfigSection<PresetConfig> {
    static constexpr std::string_view PATH = "presets";

    std::map<std::string, Preset> presets;

    [[nodiscard]] const Preset* find(const std::string& key) const {
        auto it = presets.find(key);
        return it == presets.end() ? nullptr : &it->second;
    }

    [[nodiscard]] json serialize() const {
        json j = json::object();
        for (const auto& [key, preset] : presets) {
            j[key] = preset.toJson();
        }
        return j;
    }

    [[nodiscard]] static PresetConfig deserialize(const json& j) {
        PresetConfig cfg;
        if (!j.is_object()) {
            throw device::ConfigurationException(
                "presets must be an object keyed by preset name");
        }
        for (const auto& [key, value] : j.items()) {
            if (!value.is_object()) {
                throw device::ConfigurationException("Preset '" + key +
                                                      "' is not an object");
            }
            Preset preset;
            preset.key = key;
            preset.name = value.value("name", key);
            if (value.contains("lights")) {
                const auto& lights = value["lights"];
                if (!lights.is_object()) {
                    throw device::ConfigurationException(
                        "Preset '" + key + "' lights must be an object");
                }
                for (const auto& [reference, target] : lights.items()) {
                    preset.entries.push_back(
                        PresetEntry::fromJson(reference, target));
                }
            }
            cfg.presets.emplace(key, std::move(preset));
        }
        return cfg;
    }
};

}  // namespace hubbridge::config

#endif  // HUBBRIDGE_CONFIG_SECTIONS_PRESET_CONFIG_HPP
