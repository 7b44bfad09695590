#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "device/device_types.hpp"

namespace hubbridge::afero {

using json = nlohmann::json;

/// Function classes understood by the direct state endpoint.
namespace function_class {
inline constexpr std::string_view kPower = "power";
inline constexpr std::string_view kBrightness = "brightness";
inline constexpr std::string_view kColorRgb = "color-rgb";
inline constexpr std::string_view kColorMode = "color-mode";
inline constexpr std::string_view kColorSequence = "color-sequence";
inline constexpr std::string_view kColorTemperature = "color-temperature";
}  // namespace function_class

/// `typeId` of metadevices that represent physical devices.
inline constexpr std::string_view kDeviceTypeId = "metadevice.device";

/**
 * @brief One entry of a metadevice state vector.
 */
struct StateValue {
    std::string function_class;
    std::optional<std::string> function_instance;
    json value;
};

/**
 * @brief A metadevice as returned by the listing endpoint.
 */
struct Metadevice {
    std::string id;
    std::string friendly_name;
    std::string type_id;
    std::string device_class;  ///< `description.device.deviceClass`, may be empty.
    std::vector<StateValue> values;
};

// URL builders

std::string metadevices_url(const std::string& data_host,
                            const std::string& account_id);
std::string metadevice_url(const std::string& data_host,
                           const std::string& account_id,
                           const std::string& device_id);
std::string state_url(const std::string& data_host,
                      const std::string& account_id,
                      const std::string& device_id);

/**
 * @brief Build the body of a direct state mutation.
 *
 * @param device_id Target metadevice.
 * @param values Values to write; a missing instance is sent as null.
 * @param timestamp_ms `lastUpdateTime` stamped on every value.
 */
json build_state_payload(const std::string& device_id,
                         const std::vector<StateValue>& values,
                         std::int64_t timestamp_ms);

/**
 * @brief Extract `state.values` of a metadevice; absent state yields none.
 */
std::vector<StateValue> parse_state_values(const json& metadevice);

/**
 * @brief Parse one metadevice object.
 * @throws device::ProtocolException if the object has no string id.
 */
Metadevice parse_metadevice(const json& object);

/**
 * @brief Parse a listing response; malformed entries are skipped.
 * @throws device::ProtocolException if the body is not an array.
 */
std::vector<Metadevice> parse_metadevices(const json& array);

bool has_function_class(const std::vector<StateValue>& values,
                        std::string_view function_class);

/**
 * @brief First value for a function class, if present.
 */
const StateValue* find_value(const std::vector<StateValue>& values,
                             std::string_view function_class);

/**
 * @brief Fold one state value into a snapshot.
 *
 * Unknown function classes and values of the wrong shape leave the snapshot
 * unchanged.
 */
void apply_state_value(device::StatusSnapshot& snapshot,
                       const StateValue& entry);

/**
 * @brief Reconstruct a status snapshot from a state vector.
 *
 * Power "on" maps to on=true and brightness defaults to 0, clamped to
 * 0..100. `color-rgb` is accepted both wrapped (`{"color-rgb": {r,g,b}}`)
 * and bare (`{r,g,b}`). When a class repeats, its last entry wins.
 */
device::StatusSnapshot snapshot_from_state(
    const std::vector<StateValue>& values);

/**
 * @brief Read the account id out of a `/v1/users/me` response.
 * @throws device::AuthenticationException if no account is listed.
 */
std::string parse_account_id(const json& users_me);

/**
 * @brief Current wall-clock time in milliseconds, for `lastUpdateTime`.
 */
std::int64_t now_epoch_ms();

}  // namespace hubbridge::afero
