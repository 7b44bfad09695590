/*
 * device_error.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Bridge error codes and structures for unified error handling

**************************************************/

#ifndef HUBBRIDGE_DEVICE_COMMON_DEVICE_ERROR_HPP
#define HUBBRIDGE_DEVICE_COMMON_DEVICE_ERROR_HPP

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace hubbridge::device {

/**
 * @brief Error codes for categorizing bridge failures
 */
enum class DeviceErrorCode {
    // General errors (0-99)
    Unknown = 0,
    Success = 1,
    InvalidArgument = 10,

    // Resolution errors (100-199)
    UnknownDevice = 100,

    // Session errors (200-299)
    NotConnected = 200,
    AuthenticationFailed = 201,

    // Backend errors (300-399)
    TransientBackendFailure = 300,
    ProtocolError = 301,

    // Timing errors (400-499)
    Timeout = 400,

    // Internal errors (900-999)
    InternalError = 900,
    ConfigurationError = 901
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] inline auto deviceErrorCodeToString(DeviceErrorCode code)
    -> std::string {
    switch (code) {
        case DeviceErrorCode::Unknown:
            return "Unknown";
        case DeviceErrorCode::Success:
            return "Success";
        case DeviceErrorCode::InvalidArgument:
            return "InvalidArgument";
        case DeviceErrorCode::UnknownDevice:
            return "UnknownDevice";
        case DeviceErrorCode::NotConnected:
            return "NotConnected";
        case DeviceErrorCode::AuthenticationFailed:
            return "AuthenticationFailed";
        case DeviceErrorCode::TransientBackendFailure:
            return "TransientBackendFailure";
        case DeviceErrorCode::ProtocolError:
            return "ProtocolError";
        case DeviceErrorCode::Timeout:
            return "Timeout";
        case DeviceErrorCode::InternalError:
            return "InternalError";
        case DeviceErrorCode::ConfigurationError:
            return "ConfigurationError";
        default:
            return "Unknown(" + std::to_string(static_cast<int>(code)) + ")";
    }
}

/**
 * @brief Check if error code is recoverable by retrying later
 */
[[nodiscard]] inline auto isRecoverable(DeviceErrorCode code) -> bool {
    switch (code) {
        case DeviceErrorCode::TransientBackendFailure:
        case DeviceErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error structure carried by every failed bridge operation
 */
struct DeviceError {
    DeviceErrorCode code{DeviceErrorCode::Unknown};
    std::string message;
    std::optional<std::string> deviceId;
    std::optional<std::string> operationName;
    std::chrono::system_clock::time_point timestamp{
        std::chrono::system_clock::now()};

    DeviceError() = default;

    explicit DeviceError(DeviceErrorCode errorCode,
                         std::string errorMessage = "")
        : code(errorCode), message(std::move(errorMessage)) {}

    DeviceError(DeviceErrorCode errorCode, std::string errorMessage,
                std::string device)
        : code(errorCode),
          message(std::move(errorMessage)),
          deviceId(std::move(device)) {}

    /**
     * @brief Get formatted error string for logs
     */
    [[nodiscard]] auto toString() const -> std::string {
        std::string result =
            "[" + deviceErrorCodeToString(code) + "] " + message;
        if (deviceId) {
            result += " (device: " + *deviceId + ")";
        }
        if (operationName) {
            result += " (operation: " + *operationName + ")";
        }
        return result;
    }

    /**
     * @brief Convert to the uniform `{error: message}` shape
     */
    [[nodiscard]] auto toJson() const -> nlohmann::json {
        return nlohmann::json{{"error", message}};
    }

    [[nodiscard]] auto isRecoverable() const -> bool {
        return hubbridge::device::isRecoverable(code);
    }
};

// Convenient factory functions
namespace error {

inline auto invalidArgument(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::InvalidArgument, msg);
}

inline auto unknownDevice(const std::string& nameOrId) -> DeviceError {
    return DeviceError(DeviceErrorCode::UnknownDevice,
                       "Unknown device: " + nameOrId, nameOrId);
}

inline auto notConnected() -> DeviceError {
    return DeviceError(DeviceErrorCode::NotConnected, "Hubspace not connected");
}

inline auto backendFailure(const std::string& reason) -> DeviceError {
    return DeviceError(DeviceErrorCode::TransientBackendFailure, reason);
}

inline auto timeout(const std::string& operation) -> DeviceError {
    DeviceError err(DeviceErrorCode::Timeout, operation + " timed out");
    err.operationName = operation;
    return err;
}

inline auto internalError(const std::string& msg) -> DeviceError {
    return DeviceError(DeviceErrorCode::InternalError, msg);
}

}  // namespace error

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_COMMON_DEVICE_ERROR_HPP
