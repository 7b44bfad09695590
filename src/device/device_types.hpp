/*
 * device_types.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Device, device class and status snapshot definitions

*************************************************/

#ifndef HUBBRIDGE_DEVICE_DEVICE_TYPES_HPP
#define HUBBRIDGE_DEVICE_DEVICE_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace hubbridge::device {

using json = nlohmann::json;

/**
 * @brief Device classes exposed by the platform
 */
enum class DeviceClass { Light, Fan, Switch };

/**
 * @brief Convert DeviceClass to its wire/display name
 */
inline auto deviceClassToString(DeviceClass cls) -> std::string {
    switch (cls) {
        case DeviceClass::Light:
            return "light";
        case DeviceClass::Fan:
            return "fan";
        case DeviceClass::Switch:
            return "switch";
    }
    return "light";
}

/**
 * @brief Map a platform `deviceClass` string to a supported class
 *
 * Ceiling fans report "fan" on their fan half and "light" on their light
 * half, so only the exact names are accepted.
 */
inline auto deviceClassFromString(std::string_view str)
    -> std::optional<DeviceClass> {
    if (str == "light") {
        return DeviceClass::Light;
    }
    if (str == "fan") {
        return DeviceClass::Fan;
    }
    if (str == "switch") {
        return DeviceClass::Switch;
    }
    return std::nullopt;
}

/// All classes discovery walks through, in discovery order
inline constexpr DeviceClass kAllDeviceClasses[] = {
    DeviceClass::Light, DeviceClass::Fan, DeviceClass::Switch};

/**
 * @brief Cataloged device; immutable after discovery
 */
struct Device {
    std::string id;    // Platform-assigned opaque identifier
    std::string name;  // Display name
    DeviceClass deviceClass{DeviceClass::Light};

    bool operator==(const Device&) const = default;

    [[nodiscard]] auto toJson() const -> json {
        return json{{"id", id},
                    {"name", name},
                    {"type", deviceClassToString(deviceClass)}};
    }
};

struct RgbColor {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};

    bool operator==(const RgbColor&) const = default;
};

/**
 * @brief Last-known state of a device
 *
 * `error` is only set on snapshots produced by a failed read; those are
 * never cached.
 */
struct StatusSnapshot {
    bool on{false};
    int brightnessPercent{0};
    std::optional<RgbColor> colorRgb;
    std::optional<std::string> mode;
    std::optional<int> colorTemperatureKelvin;
    std::optional<std::string> effect;
    std::optional<std::string> error;

    bool operator==(const StatusSnapshot&) const = default;

    /**
     * @brief Build the error-status shape `{on:false, brightness:0, error}`
     */
    static auto failed(std::string message) -> StatusSnapshot {
        StatusSnapshot snapshot;
        snapshot.error = std::move(message);
        return snapshot;
    }

    [[nodiscard]] auto toJson() const -> json {
        json j{{"on", on}, {"brightness", brightnessPercent}};
        if (colorRgb) {
            j["color"] = {colorRgb->r, colorRgb->g, colorRgb->b};
        }
        if (mode) {
            j["mode"] = *mode;
        }
        if (colorTemperatureKelvin) {
            j["colorTemperature"] = *colorTemperatureKelvin;
        }
        if (effect) {
            j["effect"] = *effect;
        }
        if (error) {
            j["error"] = *error;
        }
        return j;
    }
};

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_DEVICE_TYPES_HPP
