/*
 * test_config_loader.cpp - Tests for configuration sections and loading
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

#include "config/components/yaml_parser.hpp"
#include "config/config_loader.hpp"

using namespace hubbridge::config;
using hubbridge::device::ConfigurationException;
using hubbridge::device::RgbColor;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

auto envFrom(std::map<std::string, std::string> values)
    -> ConfigLoader::EnvLookup {
    return [values = std::move(values)](
               const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

auto noEnv() -> ConfigLoader::EnvLookup { return envFrom({}); }

}  // namespace

// ============================================================================
// Section Tests
// ============================================================================

TEST(BridgeConfigTest, DefaultsMatchPlatform) {
    BridgeConfig config;

    EXPECT_EQ(config.apiHost, "https://api2.afero.net");
    EXPECT_EQ(config.dataHost, "https://semantics2.afero.net");
    EXPECT_EQ(config.authTimeout, 20000ms);
    EXPECT_EQ(config.startupWait, 25000ms);
    EXPECT_EQ(config.commandTimeout, 10000ms);
    EXPECT_EQ(config.cacheTtl, 10000ms);
}

TEST(BridgeConfigTest, MissingSectionYieldsDefaults) {
    auto config = BridgeConfig::fromDocument(json::object());

    EXPECT_EQ(config, BridgeConfig::defaults());
}

TEST(BridgeConfigTest, DurationsReadFromMilliseconds) {
    auto config = BridgeConfig::fromJson(
        json{{"commandTimeoutMs", 2500}, {"cacheTtlMs", 500}});

    EXPECT_EQ(config.commandTimeout, 2500ms);
    EXPECT_EQ(config.cacheTtl, 500ms);
    EXPECT_EQ(config.toJson()["commandTimeoutMs"], 2500);
}

TEST(BridgeConfigTest, NonPositiveDurationIsRejected) {
    EXPECT_THROW(BridgeConfig::fromJson(json{{"authTimeoutMs", 0}}),
                 ConfigurationException);
    EXPECT_FALSE(
        BridgeConfig::tryFromJson(json{{"httpTimeoutMs", -1}}).has_value());
}

TEST(BridgeConfigTest, WrongTypeIsConfigurationError) {
    EXPECT_THROW(BridgeConfig::fromJson(json{{"apiHost", 12}}),
                 ConfigurationException);
}

TEST(LoggingConfigTest, ParsesLevelNames) {
    EXPECT_EQ(logLevelFromString("warning"), LogLevel::Warn);
    EXPECT_FALSE(logLevelFromString("loud").has_value());
    EXPECT_THROW(LoggingConfig::fromJson(json{{"level", "loud"}}),
                 ConfigurationException);
    EXPECT_EQ(LoggingConfig::fromJson(json{{"level", "debug"}}).level,
              LogLevel::Debug);
}

TEST(CredentialsConfigTest, PresenceAndRedaction) {
    CredentialsConfig credentials;
    EXPECT_FALSE(credentials.present());

    credentials.email = "user@example.com";
    EXPECT_FALSE(credentials.present());
    credentials.password = "secret";
    EXPECT_TRUE(credentials.present());

    EXPECT_EQ(credentials.redacted()["password"], "***");
    EXPECT_EQ(credentials.toJson()["password"], "secret");
}

TEST(PresetConfigTest, ParsesLightsAndColors) {
    auto presets = PresetConfig::fromJson(json::parse(R"({
        "movie": {
            "name": "Movie Night",
            "lights": {
                "kitchen light": {"brightness": 15, "color": [255, 147, 41]},
                "porch": {"brightness": 0}
            }
        },
        "bright": {"lights": {"abc": {"brightness": 100}}}
    })"));

    const auto* movie = presets.find("movie");
    ASSERT_NE(movie, nullptr);
    EXPECT_EQ(movie->name, "Movie Night");
    ASSERT_EQ(movie->entries.size(), 2U);
    EXPECT_EQ(movie->entries[0].device, "kitchen light");
    EXPECT_EQ(movie->entries[0].color, (RgbColor{255, 147, 41}));
    EXPECT_FALSE(movie->entries[1].color.has_value());
    EXPECT_EQ(presets.find("bright")->name, "bright");
    EXPECT_EQ(presets.find("none"), nullptr);
}

TEST(PresetConfigTest, InvalidEntriesAreRejected) {
    EXPECT_THROW(PresetConfig::fromJson(json::parse(
                     R"({"p": {"lights": {"a": {"brightness": 101}}}})")),
                 ConfigurationException);
    EXPECT_THROW(PresetConfig::fromJson(json::parse(
                     R"({"p": {"lights": {"a": {"color": [1, 2]}}}})")),
                 ConfigurationException);
    EXPECT_THROW(PresetConfig::fromJson(json::parse(
                     R"({"p": {"lights": {"a": {"color": [1, 2, 256]}}}})")),
                 ConfigurationException);
    EXPECT_THROW(PresetConfig::fromJson(json::parse(
                     R"({"p": {"lights": {"": {"brightness": 5}}}})")),
                 ConfigurationException);
    EXPECT_THROW(PresetConfig::fromJson(json::array()), ConfigurationException);
}

// ============================================================================
// Dotenv Tests
// ============================================================================

TEST(DotenvTest, ParsesAssignmentsCommentsAndQuotes) {
    auto values = ConfigLoader::parseDotenv(
        "# credentials\n"
        "HUBSPACE_EMAIL=user@example.com\n"
        "\n"
        "export HUBSPACE_PASSWORD=\"p=ss word\"\n"
        "  HUBSPACE_REFRESH_TOKEN = 'tok'  \n"
        "not an assignment\n");

    EXPECT_EQ(values.size(), 3U);
    EXPECT_EQ(values["HUBSPACE_EMAIL"], "user@example.com");
    EXPECT_EQ(values["HUBSPACE_PASSWORD"], "p=ss word");
    EXPECT_EQ(values["HUBSPACE_REFRESH_TOKEN"], "tok");
}

TEST(DotenvTest, EnvironmentWinsOverDotenv) {
    CredentialsConfig credentials;
    credentials.email = "file@example.com";

    ConfigLoader::applyCredentialOverrides(
        credentials,
        {{"HUBSPACE_EMAIL", "dotenv@example.com"},
         {"HUBSPACE_PASSWORD", "dotenv-secret"}},
        envFrom({{"HUBSPACE_EMAIL", "env@example.com"}}));

    EXPECT_EQ(credentials.email, "env@example.com");
    EXPECT_EQ(credentials.password, "dotenv-secret");
    EXPECT_TRUE(credentials.refreshToken.empty());
}

// ============================================================================
// File Loading Tests
// ============================================================================

class ConfigLoaderFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ = fs::temp_directory_path() / "hubbridge_config_test";
        fs::create_directories(testDir_);
    }

    void TearDown() override {
        if (fs::exists(testDir_)) {
            fs::remove_all(testDir_);
        }
    }

    auto write(const std::string& name, const std::string& content)
        -> fs::path {
        auto path = testDir_ / name;
        std::ofstream file(path);
        file << content;
        return path;
    }

    fs::path testDir_;
};

TEST_F(ConfigLoaderFileTest, LoadsYaml) {
    auto path = write("config.yaml", R"(
bridge:
  dataHost: https://data.test
  commandTimeoutMs: 3000
logging:
  level: debug
presets:
  evening:
    name: Evening
    lights:
      Porch: {brightness: 30, color: [10, 20, 30]}
)");

    auto config = ConfigLoader::loadFile(path);

    EXPECT_EQ(config.bridge.dataHost, "https://data.test");
    EXPECT_EQ(config.bridge.commandTimeout, 3000ms);
    EXPECT_EQ(config.bridge.apiHost, "https://api2.afero.net");
    EXPECT_EQ(config.logging.level, LogLevel::Debug);
    ASSERT_NE(config.presets.find("evening"), nullptr);
    EXPECT_EQ(config.presets.find("evening")->entries[0].brightness, 30);
}

TEST_F(ConfigLoaderFileTest, LoadsJson) {
    auto path = write("config.json",
                      R"({"credentials": {"email": "a@b.c", "password": "x"},
                          "bridge": {"cacheTtlMs": 1000}})");

    auto config = ConfigLoader::loadFile(path);

    EXPECT_TRUE(config.credentials.present());
    EXPECT_EQ(config.bridge.cacheTtl, 1000ms);
    EXPECT_EQ(config.toJson()["credentials"]["password"], "***");
}

TEST_F(ConfigLoaderFileTest, QuotedYamlScalarsStayStrings) {
    auto path = write("quoted.yml", "credentials:\n  password: \"0123\"\n");

    auto config = ConfigLoader::loadFile(path);

    EXPECT_EQ(config.credentials.password, "0123");
}

TEST_F(ConfigLoaderFileTest, MissingOrUnsupportedFilesFail) {
    EXPECT_THROW(ConfigLoader::loadFile(testDir_ / "absent.yaml"),
                 ConfigurationException);
    EXPECT_THROW(ConfigLoader::loadFile(write("config.toml", "a = 1")),
                 ConfigurationException);
    EXPECT_THROW(ConfigLoader::loadFile(write("broken.json", "{")),
                 ConfigurationException);
}

TEST_F(ConfigLoaderFileTest, InvalidPresetFailsLoad) {
    auto path = write("bad.yaml", R"(
presets:
  p:
    lights:
      a: {brightness: 500}
)");

    EXPECT_THROW(ConfigLoader::loadFile(path), ConfigurationException);
}

TEST_F(ConfigLoaderFileTest, FullLoadLayersDotenvAndEnvironment) {
    auto configPath = write("config.yaml",
                            "credentials:\n  email: file@example.com\n");
    auto envPath = write(".env",
                         "HUBSPACE_PASSWORD=from-dotenv\n"
                         "HUBSPACE_REFRESH_TOKEN=dotenv-token\n");

    auto config = ConfigLoader::load(
        configPath, envPath,
        envFrom({{"HUBSPACE_REFRESH_TOKEN", "env-token"}}));

    EXPECT_EQ(config.credentials.email, "file@example.com");
    EXPECT_EQ(config.credentials.password, "from-dotenv");
    EXPECT_EQ(config.credentials.refreshToken, "env-token");
}

TEST_F(ConfigLoaderFileTest, MissingDotenvIsEmpty) {
    EXPECT_TRUE(ConfigLoader::loadDotenv(testDir_ / "nope.env").empty());

    auto config = ConfigLoader::load(std::nullopt, testDir_ / "nope.env",
                                     noEnv());
    EXPECT_FALSE(config.credentials.present());
}

// ============================================================================
// YAML Parser Tests
// ============================================================================

TEST(YamlParserTest, ConvertsScalarsAndCollections) {
    auto parsed = YamlParser::parse(
        "count: 3\nratio: 0.5\nenabled: true\nname: lamp\nlist: [1, two]\n");

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ((*parsed)["count"], 3);
    EXPECT_DOUBLE_EQ((*parsed)["ratio"].get<double>(), 0.5);
    EXPECT_EQ((*parsed)["enabled"], true);
    EXPECT_EQ((*parsed)["name"], "lamp");
    EXPECT_EQ((*parsed)["list"], json({1, "two"}));
}

TEST(YamlParserTest, SyntaxErrorIsReported) {
    auto parsed = YamlParser::parse("a: [1, 2\n");

    EXPECT_FALSE(parsed.has_value());
    EXPECT_FALSE(YamlParser::getLastError().empty());
}
