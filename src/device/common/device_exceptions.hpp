/*
 * device_exceptions.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Exception hierarchy used inside the session and transport layer

**************************************************/

#ifndef HUBBRIDGE_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
#define HUBBRIDGE_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP

#include <stdexcept>
#include <string>

#include "device_error.hpp"

namespace hubbridge::device {

/**
 * @brief Base exception class for all bridge exceptions
 *
 * Exceptions never leave the worker context: the sync bridge converts them
 * into DeviceError values.
 */
class DeviceException : public std::runtime_error {
public:
    explicit DeviceException(const std::string& message,
                             DeviceErrorCode code = DeviceErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message) {}

    explicit DeviceException(const DeviceError& error)
        : std::runtime_error(error.message), error_(error) {}

    DeviceException(const std::string& message, const std::string& deviceId,
                    DeviceErrorCode code = DeviceErrorCode::Unknown)
        : std::runtime_error(message), error_(code, message, deviceId) {}

    [[nodiscard]] auto error() const noexcept -> const DeviceError& {
        return error_;
    }

    [[nodiscard]] auto code() const noexcept -> DeviceErrorCode {
        return error_.code;
    }

protected:
    DeviceError error_;
};

/**
 * @brief Exception for backend (platform) failures
 *
 * Raised for transport errors and for non-success HTTP responses.
 */
class BackendException : public DeviceException {
public:
    explicit BackendException(
        const std::string& message,
        DeviceErrorCode code = DeviceErrorCode::TransientBackendFailure)
        : DeviceException(message, code) {}

    BackendException(const std::string& message, long httpStatus)
        : DeviceException(message + " (HTTP " + std::to_string(httpStatus) + ")",
                          DeviceErrorCode::TransientBackendFailure),
          httpStatus_(httpStatus) {}

    /// HTTP status of the failed response, 0 when no response arrived
    [[nodiscard]] auto httpStatus() const noexcept -> long {
        return httpStatus_;
    }

private:
    long httpStatus_{0};
};

/**
 * @brief Exception for token acquisition and account lookup failures
 */
class AuthenticationException : public DeviceException {
public:
    explicit AuthenticationException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::AuthenticationFailed) {}
};

/**
 * @brief Exception for malformed platform payloads
 */
class ProtocolException : public DeviceException {
public:
    explicit ProtocolException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::ProtocolError) {}
};

/**
 * @brief Exception for an exhausted time budget
 */
class DeviceTimeoutException : public DeviceException {
public:
    explicit DeviceTimeoutException(const std::string& operationName,
                                    int timeoutMs = 0)
        : DeviceException(
              operationName + " timed out" +
                  (timeoutMs > 0
                       ? " after " + std::to_string(timeoutMs) + "ms"
                       : ""),
              DeviceErrorCode::Timeout),
          timeoutMs_(timeoutMs) {
        error_.operationName = operationName;
    }

    [[nodiscard]] auto timeoutMs() const noexcept -> int { return timeoutMs_; }

private:
    int timeoutMs_;
};

/**
 * @brief Exception for invalid configuration
 */
class ConfigurationException : public DeviceException {
public:
    explicit ConfigurationException(const std::string& message)
        : DeviceException(message, DeviceErrorCode::ConfigurationError) {}
};

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_COMMON_DEVICE_EXCEPTIONS_HPP
