/*
 * device_result.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10

Description: Bridge operation result types using std::expected

**************************************************/

#ifndef HUBBRIDGE_DEVICE_COMMON_DEVICE_RESULT_HPP
#define HUBBRIDGE_DEVICE_COMMON_DEVICE_RESULT_HPP

#include <expected>
#include <functional>
#include <type_traits>

#include "device_error.hpp"
#include "device_exceptions.hpp"

namespace hubbridge::device {

/**
 * @brief Result type for bridge operations
 *
 * Uses std::expected to represent either a successful value or an error.
 */
template <typename T>
using DeviceResult = std::expected<T, DeviceError>;

/**
 * @brief Result type for operations with no return value
 */
using DeviceVoidResult = DeviceResult<void>;

/**
 * @brief Create a successful result
 */
template <typename T>
[[nodiscard]] inline auto success(T&& value) -> DeviceResult<std::decay_t<T>> {
    return DeviceResult<std::decay_t<T>>(std::forward<T>(value));
}

/**
 * @brief Create a successful void result
 */
[[nodiscard]] inline auto success() -> DeviceVoidResult {
    return DeviceVoidResult();
}

/**
 * @brief Create a failure result
 */
template <typename T>
[[nodiscard]] inline auto failure(const DeviceError& error) -> DeviceResult<T> {
    return std::unexpected(error);
}

/**
 * @brief Create a failure void result
 */
[[nodiscard]] inline auto failure(const DeviceError& error) -> DeviceVoidResult {
    return std::unexpected(error);
}

/**
 * @brief Create a failure void result with error code and message
 */
[[nodiscard]] inline auto failure(DeviceErrorCode code,
                                  const std::string& message)
    -> DeviceVoidResult {
    return std::unexpected(DeviceError(code, message));
}

/**
 * @brief Convert an in-flight exception into a DeviceError
 *
 * Must be called from inside a catch block.
 */
[[nodiscard]] inline auto currentExceptionToError() -> DeviceError {
    try {
        throw;
    } catch (const DeviceException& e) {
        return e.error();
    } catch (const std::exception& e) {
        return DeviceError(DeviceErrorCode::InternalError, e.what());
    } catch (...) {
        return DeviceError(DeviceErrorCode::Unknown, "Unknown exception");
    }
}

/**
 * @brief Try to execute a function and convert exceptions to DeviceResult
 */
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) {
    using ReturnType = std::invoke_result_t<F>;
    if constexpr (std::is_void_v<ReturnType>) {
        try {
            std::invoke(std::forward<F>(func));
            return success();
        } catch (...) {
            return DeviceVoidResult(std::unexpected(currentExceptionToError()));
        }
    } else {
        using Result = DeviceResult<ReturnType>;
        try {
            return Result(std::invoke(std::forward<F>(func)));
        } catch (...) {
            return Result(std::unexpected(currentExceptionToError()));
        }
    }
}

}  // namespace hubbridge::device

#endif  // HUBBRIDGE_DEVICE_COMMON_DEVICE_RESULT_HPP
