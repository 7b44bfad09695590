#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "afero_protocol.hpp"
#include "device/common/device_result.hpp"
#include "device/device_types.hpp"
#include "http_transport.hpp"
#include "token_source.hpp"

namespace hubbridge::afero {

/**
 * @brief A device as held in memory by a class controller.
 */
struct DeviceHandle {
    std::string id;
    std::string name;
    device::DeviceClass device_class{device::DeviceClass::Light};
    device::StatusSnapshot state;  ///< Last state seen by the controller.
};

/**
 * @brief Structured access to the devices of one class.
 *
 * Methods throw (device::DeviceException or any std::exception) on failure;
 * callers treat any throw as "primary path unavailable".
 */
class DeviceController {
public:
    virtual ~DeviceController() = default;

    virtual device::DeviceClass deviceClass() const = 0;

    /**
     * @brief Devices of this class known to the session.
     */
    virtual std::vector<DeviceHandle> listDevices() = 0;

    /**
     * @brief In-memory lookup; never touches the network.
     */
    virtual std::optional<DeviceHandle> getDevice(const std::string& id) = 0;

    virtual void turnOn(const std::string& id) = 0;
    virtual void turnOff(const std::string& id) = 0;

    /**
     * @brief Record a state write the platform accepted.
     *
     * Keeps the held state in step with writes made outside the controller.
     * Devices the controller does not hold are ignored.
     */
    virtual void applyState(const std::string& id,
                            std::string_view function_class,
                            const json& value) = 0;
};

/**
 * @brief The single authenticated platform session.
 *
 * Owned and driven exclusively by the background worker; nothing here is
 * thread-safe.
 */
class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    /**
     * @brief Authenticate and load the device inventory.
     *
     * @param credentials Account credentials.
     * @param budget Upper bound for the whole sequence.
     * @return An error when authentication or loading fails or the budget
     *         runs out; partial state may remain usable.
     */
    virtual device::DeviceVoidResult initialize(
        const Credentials& credentials, std::chrono::milliseconds budget) = 0;

    /**
     * @brief Controller for a device class, or nullptr if unavailable.
     */
    virtual DeviceController* controller(device::DeviceClass cls) = 0;

    /**
     * @brief Current bearer token, refreshed when close to expiry.
     * @throws device::AuthenticationException when no token can be obtained.
     */
    virtual std::string accessToken() = 0;

    /**
     * @brief Account id resolved during initialize(); empty before.
     */
    virtual std::string accountId() const = 0;

    /**
     * @brief Send a request with the bearer token attached.
     * @throws device::BackendException on transport failure.
     */
    virtual HttpResponse rawRequest(HttpRequest request) = 0;

    /**
     * @brief Release the session within `budget`.
     */
    virtual device::DeviceVoidResult close(
        std::chrono::milliseconds budget) = 0;
};

}  // namespace hubbridge::afero
