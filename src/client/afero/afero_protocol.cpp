#include "afero_protocol.hpp"

#include <algorithm>
#include <chrono>

#include "device/common/device_exceptions.hpp"

namespace hubbridge::afero {

namespace {

std::optional<int> as_int(const json& value) {
    if (value.is_number()) {
        return static_cast<int>(value.get<double>());
    }
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::uint8_t channel(const json& rgb, const char* key) {
    auto value = rgb.contains(key) ? as_int(rgb[key]) : std::nullopt;
    return static_cast<std::uint8_t>(std::clamp(value.value_or(0), 0, 255));
}

std::string string_field(const json& object, const char* key,
                         std::string fallback) {
    if (object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return fallback;
}

}  // namespace

std::string metadevices_url(const std::string& data_host,
                            const std::string& account_id) {
    return data_host + "/v1/accounts/" + account_id + "/metadevices";
}

std::string metadevice_url(const std::string& data_host,
                           const std::string& account_id,
                           const std::string& device_id) {
    return metadevices_url(data_host, account_id) + "/" + device_id;
}

std::string state_url(const std::string& data_host,
                      const std::string& account_id,
                      const std::string& device_id) {
    return metadevice_url(data_host, account_id, device_id) + "/state";
}

json build_state_payload(const std::string& device_id,
                         const std::vector<StateValue>& values,
                         std::int64_t timestamp_ms) {
    json entries = json::array();
    for (const auto& value : values) {
        entries.push_back({
            {"functionClass", value.function_class},
            {"functionInstance", value.function_instance
                                     ? json(*value.function_instance)
                                     : json(nullptr)},
            {"value", value.value},
            {"lastUpdateTime", timestamp_ms},
        });
    }
    return {{"metadeviceId", device_id}, {"values", std::move(entries)}};
}

std::vector<StateValue> parse_state_values(const json& metadevice) {
    std::vector<StateValue> result;
    if (!metadevice.is_object() || !metadevice.contains("state")) {
        return result;
    }
    const auto& state = metadevice["state"];
    if (!state.is_object() || !state.contains("values") ||
        !state["values"].is_array()) {
        return result;
    }

    for (const auto& entry : state["values"]) {
        if (!entry.is_object() || !entry.contains("functionClass") ||
            !entry["functionClass"].is_string()) {
            continue;
        }
        StateValue value;
        value.function_class = entry["functionClass"].get<std::string>();
        if (entry.contains("functionInstance") &&
            entry["functionInstance"].is_string()) {
            value.function_instance =
                entry["functionInstance"].get<std::string>();
        }
        value.value = entry.value("value", json(nullptr));
        result.push_back(std::move(value));
    }
    return result;
}

Metadevice parse_metadevice(const json& object) {
    if (!object.is_object() || !object.contains("id") ||
        !object["id"].is_string()) {
        throw device::ProtocolException("Metadevice without an id");
    }

    Metadevice device;
    device.id = object["id"].get<std::string>();
    device.friendly_name = string_field(object, "friendlyName", "unnamed");
    device.type_id = string_field(object, "typeId", "");
    if (object.contains("description") && object["description"].is_object()) {
        const auto& description = object["description"];
        if (description.contains("device") &&
            description["device"].is_object()) {
            device.device_class =
                string_field(description["device"], "deviceClass", "");
        }
    }
    device.values = parse_state_values(object);
    return device;
}

std::vector<Metadevice> parse_metadevices(const json& array) {
    if (!array.is_array()) {
        throw device::ProtocolException(
            "Metadevice listing is not a JSON array");
    }
    std::vector<Metadevice> result;
    for (const auto& object : array) {
        try {
            result.push_back(parse_metadevice(object));
        } catch (const device::ProtocolException&) {
            continue;
        } catch (const json::exception&) {
            continue;
        }
    }
    return result;
}

const StateValue* find_value(const std::vector<StateValue>& values,
                             std::string_view function_class) {
    auto it = std::find_if(values.begin(), values.end(),
                           [&](const StateValue& value) {
                               return value.function_class == function_class;
                           });
    return it == values.end() ? nullptr : &*it;
}

bool has_function_class(const std::vector<StateValue>& values,
                        std::string_view function_class) {
    return find_value(values, function_class) != nullptr;
}

void apply_state_value(device::StatusSnapshot& snapshot,
                       const StateValue& entry) {
    const auto& value = entry.value;
    const std::string_view cls = entry.function_class;

    if (cls == function_class::kPower) {
        snapshot.on = value.is_string() && value.get<std::string>() == "on";
    } else if (cls == function_class::kBrightness) {
        snapshot.brightnessPercent =
            std::clamp(as_int(value).value_or(0), 0, 100);
    } else if (cls == function_class::kColorRgb) {
        if (value.is_object()) {
            const auto& rgb =
                value.contains("color-rgb") && value["color-rgb"].is_object()
                    ? value["color-rgb"]
                    : value;
            snapshot.colorRgb = device::RgbColor{
                channel(rgb, "r"), channel(rgb, "g"), channel(rgb, "b")};
        }
    } else if (cls == function_class::kColorMode) {
        if (value.is_string()) {
            snapshot.mode = value.get<std::string>();
        }
    } else if (cls == function_class::kColorTemperature) {
        snapshot.colorTemperatureKelvin = as_int(value);
    } else if (cls == function_class::kColorSequence) {
        if (value.is_string()) {
            snapshot.effect = value.get<std::string>();
        }
    }
}

device::StatusSnapshot snapshot_from_state(
    const std::vector<StateValue>& values) {
    device::StatusSnapshot snapshot;

    // Later entries for the same function class override earlier ones
    for (const auto& entry : values) {
        apply_state_value(snapshot, entry);
    }

    return snapshot;
}

std::string parse_account_id(const json& users_me) {
    if (users_me.is_object() && users_me.contains("accountAccess") &&
        users_me["accountAccess"].is_array()) {
        for (const auto& access : users_me["accountAccess"]) {
            if (access.is_object() && access.contains("account") &&
                access["account"].is_object()) {
                auto id = access["account"].value("accountId", std::string());
                if (!id.empty()) {
                    return id;
                }
            }
        }
    }
    throw device::AuthenticationException(
        "No account listed for the authenticated user");
}

std::int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace hubbridge::afero
