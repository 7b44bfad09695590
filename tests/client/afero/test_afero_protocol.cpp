/*
 * test_afero_protocol.cpp - Tests for the platform wire helpers
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "client/afero/afero_protocol.hpp"
#include "device/common/device_exceptions.hpp"

using namespace hubbridge::afero;
using hubbridge::device::AuthenticationException;
using hubbridge::device::ProtocolException;
using hubbridge::device::RgbColor;

// ==================== URL Tests ====================

TEST(AferoUrlTest, BuildsAccountScopedUrls) {
    EXPECT_EQ(metadevices_url("https://data", "acct"),
              "https://data/v1/accounts/acct/metadevices");
    EXPECT_EQ(metadevice_url("https://data", "acct", "dev"),
              "https://data/v1/accounts/acct/metadevices/dev");
    EXPECT_EQ(state_url("https://data", "acct", "dev"),
              "https://data/v1/accounts/acct/metadevices/dev/state");
}

// ==================== State Payload Tests ====================

TEST(StatePayloadTest, CarriesDeviceAndValues) {
    auto payload = build_state_payload(
        "dev", {StateValue{"power", "light-power", "on"},
                StateValue{"brightness", std::nullopt, 50}},
        1700000000000);

    EXPECT_EQ(payload["metadeviceId"], "dev");
    ASSERT_EQ(payload["values"].size(), 2U);
    EXPECT_EQ(payload["values"][0]["functionClass"], "power");
    EXPECT_EQ(payload["values"][0]["functionInstance"], "light-power");
    EXPECT_EQ(payload["values"][0]["value"], "on");
    EXPECT_EQ(payload["values"][0]["lastUpdateTime"], 1700000000000);
    EXPECT_TRUE(payload["values"][1]["functionInstance"].is_null());
}

TEST(StatePayloadTest, ParseSkipsMalformedEntries) {
    auto metadevice = json::parse(R"({
        "state": {"values": [
            {"functionClass": "power", "functionInstance": "p", "value": "on"},
            {"value": 3},
            "junk",
            {"functionClass": "brightness", "value": 42}
        ]}
    })");

    auto values = parse_state_values(metadevice);

    ASSERT_EQ(values.size(), 2U);
    EXPECT_EQ(values[0].function_instance, "p");
    EXPECT_EQ(values[1].function_class, "brightness");
    EXPECT_FALSE(values[1].function_instance.has_value());
}

TEST(StatePayloadTest, MissingStateYieldsNoValues) {
    EXPECT_TRUE(parse_state_values(json::object()).empty());
    EXPECT_TRUE(parse_state_values(json{{"state", 1}}).empty());
}

// ==================== Metadevice Tests ====================

TEST(MetadeviceTest, ParsesDescriptionAndState) {
    auto object = json::parse(R"({
        "id": "abc",
        "friendlyName": "Kitchen Light",
        "typeId": "metadevice.device",
        "description": {"device": {"deviceClass": "light"}},
        "state": {"values": [{"functionClass": "power", "value": "off"}]}
    })");

    auto device = parse_metadevice(object);

    EXPECT_EQ(device.id, "abc");
    EXPECT_EQ(device.friendly_name, "Kitchen Light");
    EXPECT_EQ(device.type_id, kDeviceTypeId);
    EXPECT_EQ(device.device_class, "light");
    EXPECT_TRUE(has_function_class(device.values, function_class::kPower));
    EXPECT_FALSE(
        has_function_class(device.values, function_class::kBrightness));
}

TEST(MetadeviceTest, MissingIdThrows) {
    EXPECT_THROW(parse_metadevice(json{{"friendlyName", "x"}}),
                 ProtocolException);
}

TEST(MetadeviceTest, ListingDropsEntriesWithoutId) {
    auto listing = json::array({json{{"id", "a"}}, json{{"name", "b"}}});

    auto devices = parse_metadevices(listing);

    ASSERT_EQ(devices.size(), 1U);
    EXPECT_EQ(devices[0].friendly_name, "unnamed");
    EXPECT_THROW(parse_metadevices(json::object()), ProtocolException);
}

TEST(MetadeviceTest, ListingKeepsGoodEntriesBesideMistypedOnes) {
    auto listing = json::parse(R"([
        {"id": "abc", "friendlyName": "Kitchen", "typeId": "metadevice.device",
         "description": {"device": {"deviceClass": "light"}}},
        {"id": "def", "friendlyName": null, "typeId": 7,
         "description": {"device": {"deviceClass": ["light"]}}},
        {"id": "ghi", "friendlyName": "Porch", "state": {"values": 5}}
    ])");

    auto devices = parse_metadevices(listing);

    ASSERT_EQ(devices.size(), 3U);
    EXPECT_EQ(devices[0].friendly_name, "Kitchen");
    EXPECT_EQ(devices[0].device_class, "light");
    EXPECT_EQ(devices[1].id, "def");
    EXPECT_EQ(devices[1].friendly_name, "unnamed");
    EXPECT_TRUE(devices[1].type_id.empty());
    EXPECT_TRUE(devices[1].device_class.empty());
    EXPECT_EQ(devices[2].friendly_name, "Porch");
    EXPECT_TRUE(devices[2].values.empty());
}

// ==================== Snapshot Tests ====================

TEST(SnapshotTest, ApplyingValueKeepsOtherFields) {
    auto snapshot = snapshot_from_state(
        {{"power", std::nullopt, "on"}, {"brightness", std::nullopt, 30}});

    apply_state_value(snapshot, {"brightness", std::nullopt, 80});
    apply_state_value(snapshot, {"color-sequence", std::nullopt, "fade"});
    apply_state_value(snapshot, {"fan-speed", std::nullopt, 3});

    EXPECT_TRUE(snapshot.on);
    EXPECT_EQ(snapshot.brightnessPercent, 80);
    EXPECT_EQ(snapshot.effect, "fade");
    EXPECT_FALSE(snapshot.colorRgb.has_value());
}

TEST(SnapshotTest, ReadsEveryKnownFunctionClass) {
    std::vector<StateValue> values = {
        {"power", std::nullopt, "on"},
        {"brightness", std::nullopt, 64},
        {"color-rgb", std::nullopt,
         json{{"color-rgb", {{"r", 1}, {"g", 2}, {"b", 3}}}}},
        {"color-mode", std::nullopt, "color"},
        {"color-temperature", std::nullopt, "3000"},
        {"color-sequence", std::nullopt, "rainbow"},
    };

    auto snapshot = snapshot_from_state(values);

    EXPECT_TRUE(snapshot.on);
    EXPECT_EQ(snapshot.brightnessPercent, 64);
    EXPECT_EQ(snapshot.colorRgb, (RgbColor{1, 2, 3}));
    EXPECT_EQ(snapshot.mode, "color");
    EXPECT_EQ(snapshot.colorTemperatureKelvin, 3000);
    EXPECT_EQ(snapshot.effect, "rainbow");
    EXPECT_FALSE(snapshot.error.has_value());
}

TEST(SnapshotTest, BareRgbObjectAndClamping) {
    std::vector<StateValue> values = {
        {"brightness", std::nullopt, 150},
        {"color-rgb", std::nullopt, json{{"r", 300}, {"g", -5}, {"b", 7}}},
    };

    auto snapshot = snapshot_from_state(values);

    EXPECT_FALSE(snapshot.on);
    EXPECT_EQ(snapshot.brightnessPercent, 100);
    EXPECT_EQ(snapshot.colorRgb, (RgbColor{255, 0, 7}));
}

TEST(SnapshotTest, LaterValueOfSameClassWins) {
    std::vector<StateValue> values = {
        {"power", "a", "on"},
        {"power", "b", "off"},
    };

    EXPECT_FALSE(snapshot_from_state(values).on);
}

// ==================== Account Tests ====================

TEST(AccountIdTest, TakesFirstListedAccount) {
    auto usersMe = json::parse(R"({
        "accountAccess": [
            {"account": {}},
            {"account": {"accountId": "acct-9"}}
        ]
    })");

    EXPECT_EQ(parse_account_id(usersMe), "acct-9");
}

TEST(AccountIdTest, NoAccountThrows) {
    EXPECT_THROW(parse_account_id(json::object()), AuthenticationException);
}
