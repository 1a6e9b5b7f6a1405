#include <gtest/gtest.h>
#include "core/Config.hpp"
#include "core/Logger.hpp"

using namespace homescout;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::InitializeConsoleOnly(LogLevel::OFF);
    }

    AppConfig config;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(config.scan.mode, ScanMode::STANDARD);
    EXPECT_EQ(config.scan.GetDurationMs(), 15000u);
    EXPECT_EQ(config.scan.registry.max_devices, 500u);
    EXPECT_EQ(config.scan.rate_limit.threshold, 100u);
    EXPECT_EQ(config.scan.rate_limit.window_ms, 60000u);
    EXPECT_EQ(config.scan.scoring.high_threshold, 70u);
    EXPECT_EQ(config.scan.pause_policy, PausePolicy::DROP);
}

TEST_F(ConfigTest, ModeDurations) {
    ScanConfig scan;
    scan.mode = ScanMode::QUICK;
    EXPECT_EQ(scan.GetDurationMs(), 5000u);
    scan.mode = ScanMode::FULL;
    EXPECT_EQ(scan.GetDurationMs(), 30000u);
    scan.mode = ScanMode::CUSTOM;
    scan.custom_duration_ms = 1234;
    EXPECT_EQ(scan.GetDurationMs(), 1234u);
}

TEST_F(ConfigTest, ParsesModesAndPolicies) {
    ScanMode mode = ScanMode::QUICK;
    EXPECT_TRUE(ParseScanMode("Full", mode));
    EXPECT_EQ(mode, ScanMode::FULL);
    EXPECT_TRUE(ParseScanMode("deep", mode));
    EXPECT_EQ(mode, ScanMode::FULL);
    EXPECT_FALSE(ParseScanMode("turbo", mode));
    EXPECT_EQ(mode, ScanMode::FULL);

    PausePolicy policy = PausePolicy::DROP;
    EXPECT_TRUE(ParsePausePolicy("buffer", policy));
    EXPECT_EQ(policy, PausePolicy::BUFFER);
    EXPECT_EQ(PausePolicyToString(policy), "buffer");
}

TEST_F(ConfigTest, YamlOverridesOnlyGivenKeys) {
    const char* yaml = R"YAML(
logging:
  level: debug
scan:
  mode: quick
  network_range: 192.168.1.0/24
  pause_policy: buffer
rate_limit:
  threshold: 5
registry:
  max_devices: 42
scoring:
  known_vendor_patterns: [acme]
  accessory_ports: [1234, 70000]
  weights:
    unpaired: 50
  thresholds:
    high: 80
)YAML";

    ASSERT_TRUE(LoadConfigString(yaml, config));

    EXPECT_EQ(config.log_level, "debug");
    EXPECT_EQ(config.log_file, "logs/homescout.log");
    EXPECT_EQ(config.scan.mode, ScanMode::QUICK);
    EXPECT_EQ(config.scan.network_range, "192.168.1.0/24");
    EXPECT_EQ(config.scan.pause_policy, PausePolicy::BUFFER);
    EXPECT_EQ(config.scan.rate_limit.threshold, 5u);
    EXPECT_EQ(config.scan.rate_limit.window_ms, 60000u);
    EXPECT_EQ(config.scan.registry.max_devices, 42u);
    EXPECT_EQ(config.scan.scoring.known_vendor_patterns, std::vector<std::string>{"acme"});
    EXPECT_EQ(config.scan.scoring.accessory_ports, std::vector<uint16_t>{1234});
    EXPECT_EQ(config.scan.scoring.unpaired_weight, 50);
    EXPECT_EQ(config.scan.scoring.service_type_weight, 40);
    EXPECT_EQ(config.scan.scoring.high_threshold, 80u);
    EXPECT_EQ(config.scan.scoring.low_threshold, 40u);
}

TEST_F(ConfigTest, UnknownModeKeepsDefault) {
    ASSERT_TRUE(LoadConfigString("scan:\n  mode: warp\n", config));
    EXPECT_EQ(config.scan.mode, ScanMode::STANDARD);
}

TEST_F(ConfigTest, MalformedYamlFails) {
    EXPECT_FALSE(LoadConfigString("scan: [unclosed", config));
    EXPECT_FALSE(LoadConfigString("registry:\n  max_devices: lots\n", config));
    EXPECT_EQ(config.scan.registry.max_devices, 500u);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    EXPECT_FALSE(LoadConfigFile("/nonexistent/homescout.yaml", config));
    EXPECT_EQ(config.scan.registry.max_devices, 500u);
}
