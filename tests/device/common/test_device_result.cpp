/*
 * test_device_result.cpp - Tests for bridge error and result types
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "device/common/common.hpp"

using namespace hubbridge::device;

// ==================== DeviceError Tests ====================

TEST(DeviceErrorTest, FactoriesCarryCodesAndMessages) {
    EXPECT_EQ(error::notConnected().code, DeviceErrorCode::NotConnected);
    EXPECT_EQ(error::notConnected().message, "Hubspace not connected");

    auto unknown = error::unknownDevice("garage");
    EXPECT_EQ(unknown.code, DeviceErrorCode::UnknownDevice);
    EXPECT_EQ(unknown.message, "Unknown device: garage");
    EXPECT_EQ(unknown.deviceId, "garage");

    auto timeout = error::timeout("turnOn");
    EXPECT_EQ(timeout.code, DeviceErrorCode::Timeout);
    EXPECT_EQ(timeout.operationName, "turnOn");
}

TEST(DeviceErrorTest, JsonIsUniformErrorObject) {
    EXPECT_EQ(error::unknownDevice("x").toJson(),
              nlohmann::json({{"error", "Unknown device: x"}}));
}

TEST(DeviceErrorTest, ToStringNamesCodeAndDevice) {
    auto text = error::unknownDevice("garage").toString();

    EXPECT_NE(text.find("garage"), std::string::npos);
    EXPECT_EQ(text.front(), '[');
}

TEST(DeviceErrorTest, RecoverableCodes) {
    EXPECT_TRUE(isRecoverable(DeviceErrorCode::Timeout));
    EXPECT_TRUE(isRecoverable(DeviceErrorCode::TransientBackendFailure));
    EXPECT_FALSE(isRecoverable(DeviceErrorCode::UnknownDevice));
    EXPECT_FALSE(isRecoverable(DeviceErrorCode::InvalidArgument));
}

// ==================== Exception Tests ====================

TEST(DeviceExceptionTest, BackendExceptionKeepsHttpStatus) {
    BackendException e("API call failed", 503L);

    EXPECT_EQ(e.httpStatus(), 503);
    EXPECT_EQ(e.code(), DeviceErrorCode::TransientBackendFailure);
    EXPECT_STREQ(e.what(), "API call failed (HTTP 503)");
}

TEST(DeviceExceptionTest, TimeoutExceptionNamesOperation) {
    DeviceTimeoutException e("Authentication", 250);

    EXPECT_EQ(e.code(), DeviceErrorCode::Timeout);
    EXPECT_EQ(e.error().operationName, "Authentication");
    EXPECT_EQ(e.timeoutMs(), 250);
}

// ==================== Result Helper Tests ====================

TEST(DeviceResultTest, TryExecuteWrapsValue) {
    auto result = tryExecute([] { return 42; });

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
}

TEST(DeviceResultTest, TryExecuteConvertsDeviceException) {
    auto result = tryExecute(
        [] { throw AuthenticationException("token rejected"); });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::AuthenticationFailed);
    EXPECT_EQ(result.error().message, "token rejected");
}

TEST(DeviceResultTest, TryExecuteConvertsStdException) {
    auto result = tryExecute([]() -> int {
        throw std::out_of_range("index");
    });

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, DeviceErrorCode::InternalError);
    EXPECT_EQ(result.error().message, "index");
}

TEST(DeviceResultTest, FailureHelpers) {
    auto voidFailure = failure(error::notConnected());
    auto typedFailure = failure<int>(error::invalidArgument("bad"));

    EXPECT_FALSE(voidFailure.has_value());
    EXPECT_EQ(typedFailure.error().code, DeviceErrorCode::InvalidArgument);
    EXPECT_TRUE(success().has_value());
    EXPECT_EQ(success(std::string("ok")).value(), "ok");
}
