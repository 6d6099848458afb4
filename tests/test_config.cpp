#include "loopcast/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

namespace loopcast {
namespace {

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* name : {"LOOPCAST_HOST", "LOOPCAST_PORT", "LOOPCAST_DEVICE",
                                 "LOOPCAST_GAIN", "LOOPCAST_LOG_LEVEL"}) {
            ::unsetenv(name);
        }
    }

    static StreamerConfig parse(const char* yaml) {
        StreamerConfig config;
        parse_config(YAML::Load(yaml), config);
        return config;
    }
};

TEST_F(ConfigTest, DefaultsAreValid) {
    const StreamerConfig config;

    EXPECT_FALSE(config.network.fixed_host.has_value());
    EXPECT_EQ(config.network.port, 12345);
    EXPECT_EQ(config.backend, "auto");
    EXPECT_FALSE(config.device_index.has_value());
    EXPECT_EQ(config.preferred_channels, 2);
    EXPECT_FLOAT_EQ(config.gain, 2.5f);
    EXPECT_EQ(config.read_timeout.count(), 500);
    EXPECT_NO_THROW(validate(config));
}

TEST_F(ConfigTest, ParsesAllSections) {
    const auto config = parse(R"(
network:
  host: 172.28.51.71
  port: 5005
  peer_query_command: ""
  scan_private_ranges: false
audio:
  backend: loopback
  device: 3
  channels: 1
  gain: 3.0
  read_timeout_ms: 250
logging:
  level: debug
  file: streamer.log
ui:
  status_view: true
)");

    EXPECT_EQ(config.network.fixed_host, "172.28.51.71");
    EXPECT_EQ(config.network.port, 5005);
    EXPECT_TRUE(config.network.peer_query_command.empty());
    EXPECT_FALSE(config.network.scan_private_ranges);
    EXPECT_EQ(config.backend, "loopback");
    EXPECT_EQ(config.device_index, 3);
    EXPECT_EQ(config.preferred_channels, 1);
    EXPECT_FLOAT_EQ(config.gain, 3.0f);
    EXPECT_EQ(config.read_timeout.count(), 250);
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "streamer.log");
    EXPECT_TRUE(config.status_view);
    EXPECT_NO_THROW(validate(config));
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    const auto config = parse("audio:\n  gain: 2.0\n");

    EXPECT_FLOAT_EQ(config.gain, 2.0f);
    EXPECT_EQ(config.network.port, kDefaultPort);
    EXPECT_EQ(config.network.peer_query_command, "wsl hostname -I");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
    EXPECT_EQ(parse("").network.port, kDefaultPort);
}

TEST_F(ConfigTest, WrongTypesAreRejected) {
    EXPECT_THROW(parse("network:\n  port: twelve\n"), ConfigError);
    EXPECT_THROW(parse("audio:\n  device: [1, 2]\n"), ConfigError);
    EXPECT_THROW(parse("ui:\n  status_view: maybe\n"), ConfigError);
    EXPECT_THROW(parse("network: 5\n"), ConfigError);
    EXPECT_THROW(parse("- a\n- b\n"), ConfigError);
}

TEST_F(ConfigTest, OutOfRangePortIsRejected) {
    EXPECT_THROW(parse("network:\n  port: 70000\n"), ConfigError);
    EXPECT_THROW(parse("network:\n  port: 0\n"), ConfigError);
}

TEST_F(ConfigTest, ValidateChecksRanges) {
    StreamerConfig config;

    config.gain = 1.5f;
    EXPECT_THROW(validate(config), ConfigError);
    config.gain = 3.5f;
    EXPECT_THROW(validate(config), ConfigError);
    config.gain = kMaxGain;
    EXPECT_NO_THROW(validate(config));

    config.preferred_channels = 0;
    EXPECT_THROW(validate(config), ConfigError);
    config.preferred_channels = 2;

    config.read_timeout = std::chrono::milliseconds(0);
    EXPECT_THROW(validate(config), ConfigError);
    config.read_timeout = std::chrono::milliseconds(500);

    config.device_index = -1;
    EXPECT_THROW(validate(config), ConfigError);
    config.device_index.reset();

    config.backend = "wasapi";
    EXPECT_THROW(validate(config), ConfigError);
    config.backend = "standard";

    config.logging.level = "verbose";
    EXPECT_THROW(validate(config), ConfigError);
}

TEST_F(ConfigTest, ValidateRequiresIpv4FixedHost) {
    StreamerConfig config;

    config.network.fixed_host = "visualizer.local";
    try {
        validate(config);
        FAIL() << "Host name accepted";
    } catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("visualizer.local"), std::string::npos);
    }

    config.network.fixed_host = "172.028.51.71";
    EXPECT_NO_THROW(validate(config));
}

TEST_F(ConfigTest, EnvironmentOverridesFileValues) {
    auto config = parse("network:\n  host: 10.0.0.1\n  port: 5005\naudio:\n  gain: 2.0\n");

    ::setenv("LOOPCAST_HOST", "10.0.0.2", 1);
    ::setenv("LOOPCAST_PORT", "6006", 1);
    ::setenv("LOOPCAST_DEVICE", "7", 1);
    ::setenv("LOOPCAST_GAIN", "2.75", 1);
    ::setenv("LOOPCAST_LOG_LEVEL", "warning", 1);
    apply_env_overrides(config);

    EXPECT_EQ(config.network.fixed_host, "10.0.0.2");
    EXPECT_EQ(config.network.port, 6006);
    EXPECT_EQ(config.device_index, 7);
    EXPECT_FLOAT_EQ(config.gain, 2.75f);
    EXPECT_EQ(config.logging.level, "warning");
}

TEST_F(ConfigTest, UnsetOrEmptyEnvironmentChangesNothing) {
    StreamerConfig config;
    ::setenv("LOOPCAST_HOST", "", 1);
    apply_env_overrides(config);

    EXPECT_FALSE(config.network.fixed_host.has_value());
    EXPECT_EQ(config.network.port, kDefaultPort);
}

TEST_F(ConfigTest, MalformedEnvironmentNumbersAreRejected) {
    StreamerConfig config;

    ::setenv("LOOPCAST_PORT", "12a", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
    ::unsetenv("LOOPCAST_PORT");

    ::setenv("LOOPCAST_GAIN", "loud", 1);
    EXPECT_THROW(apply_env_overrides(config), ConfigError);
}

TEST_F(ConfigTest, MissingFileIsAConfigError) {
    EXPECT_THROW(static_cast<void>(load_config("/nonexistent/loopcast.yaml")), ConfigError);
}

TEST_F(ConfigTest, LoopConfigCarriesGainAndTimeout) {
    StreamerConfig config;
    config.gain = 3.0f;
    config.read_timeout = std::chrono::milliseconds(100);

    const auto loop = config.loop_config();
    EXPECT_FLOAT_EQ(loop.gain, 3.0f);
    EXPECT_EQ(loop.read_timeout.count(), 100);
}

}  // namespace
}  // namespace loopcast
