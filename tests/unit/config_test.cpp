#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace tether::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        // Create temporary test directory
        temp_dir = fs::temp_directory_path() / "tether_config_test";
        fs::create_directories(temp_dir);
        ::unsetenv("TETHER_BACKEND_PORT");
    }

    void TearDown() override {
        // Clean up temporary files
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
        ::unsetenv("TETHER_BACKEND_PORT");
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, ValidMinimalConfig) {
    std::string config_content = R"(
backend:
  command: ./burrito_out/sidecar_backend
)";

    std::string config_path = create_config_file("minimal.yaml", config_content);
    LauncherConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.backend.command, "./burrito_out/sidecar_backend");
    EXPECT_EQ(config.backend.host, "127.0.0.1");
    EXPECT_EQ(config.backend.port, 4000);
    EXPECT_EQ(config.readiness.max_attempts, 60);
    EXPECT_EQ(config.readiness.interval_ms, 1000);
    EXPECT_EQ(config.shutdown.request_timeout_ms, 2000);
    EXPECT_EQ(config.shutdown.grace_period_ms, 1000);
    EXPECT_EQ(config.ui.width, 1200);
    EXPECT_EQ(config.ui.height, 800);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
backend:
  command: /opt/app/backend
  args: [start, --foreground]
  host: localhost
  port: 4100
  env:
    MIX_ENV: prod
    BURRITO: "1"

readiness:
  max_attempts: 20
  interval_ms: 250
  probe_timeout_ms: 500
  initializing_after: 4
  almost_ready_after: 12

shutdown:
  request_timeout_ms: 1500
  grace_period_ms: 500

ui:
  title: Recipes
  width: 1400
  height: 900
  min_width: 1000
  min_height: 700
  splash: assets/splash.html
  failure_display_ms: 2000

logging:
  level: debug
  file: /tmp/tether.log
)";

    LauncherConfig config;
    std::string error;

    ASSERT_TRUE(load_config(create_config_file("full.yaml", config_content), config, error)) << error;
    EXPECT_EQ(config.backend.args, (std::vector<std::string>{"start", "--foreground"}));
    EXPECT_EQ(config.backend.host, "localhost");
    EXPECT_EQ(config.backend.port, 4100);
    EXPECT_EQ(config.backend.env.size(), 2u);
    EXPECT_EQ(config.backend.env.at("MIX_ENV"), "prod");
    EXPECT_EQ(config.backend.env.at("BURRITO"), "1");

    EXPECT_EQ(config.readiness.max_attempts, 20);
    EXPECT_EQ(config.readiness.interval_ms, 250);
    EXPECT_EQ(config.readiness.probe_timeout_ms, 500);
    EXPECT_EQ(config.readiness.initializing_after, 4);
    EXPECT_EQ(config.readiness.almost_ready_after, 12);

    EXPECT_EQ(config.shutdown.request_timeout_ms, 1500);
    EXPECT_EQ(config.shutdown.grace_period_ms, 500);

    EXPECT_EQ(config.ui.title, "Recipes");
    EXPECT_EQ(config.ui.min_width, 1000);
    EXPECT_EQ(config.ui.splash, "assets/splash.html");
    EXPECT_EQ(config.ui.failure_display_ms, 2000);

    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.file, "/tmp/tether.log");
}

TEST_F(ConfigTest, MissingFileFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "nope.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend: [unterminated", config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}

TEST_F(ConfigTest, RootMustBeMapping) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("- just\n- a list\n", config, error));
    EXPECT_EQ(error, "Config root must be a mapping");
}

TEST_F(ConfigTest, MissingCommandFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  port: 4000\n", config, error));
    EXPECT_EQ(error, "backend.command must be set");
}

TEST_F(ConfigTest, PortOutOfRangeFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\n  port: 70000\n", config, error));
    EXPECT_EQ(error, "backend.port must be between 1 and 65535");

    config = LauncherConfig{};
    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\n  port: 0\n", config, error));
}

TEST_F(ConfigTest, EnvMustBeMapping) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\n  env: [MIX_ENV=prod]\n", config, error));
    EXPECT_NE(error.find("backend.env must be a mapping"), std::string::npos);
}

TEST_F(ConfigTest, EnvRejectsInvalidName) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\n  env:\n    \"A=B\": x\n", config, error));
    EXPECT_NE(error.find("backend.env has invalid variable name"), std::string::npos);
}

TEST_F(ConfigTest, ZeroMaxAttemptsFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\nreadiness:\n  max_attempts: 0\n", config, error));
    EXPECT_EQ(error, "readiness.max_attempts must be >= 1");
}

TEST_F(ConfigTest, TooShortIntervalFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\nreadiness:\n  interval_ms: 5\n", config, error));
    EXPECT_EQ(error, "readiness.interval_ms must be >= 10ms");
}

TEST_F(ConfigTest, PhaseThresholdsMustBeOrdered) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string(
        "backend:\n  command: app\nreadiness:\n  initializing_after: 20\n  almost_ready_after: 10\n", config, error));
    EXPECT_NE(error.find("readiness phase thresholds"), std::string::npos);
}

TEST_F(ConfigTest, ShortShutdownTimeoutFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(
        load_config_from_string("backend:\n  command: app\nshutdown:\n  request_timeout_ms: 50\n", config, error));
    EXPECT_EQ(error, "shutdown.request_timeout_ms must be >= 100ms");
}

TEST_F(ConfigTest, MinimumSizeLargerThanWindowFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\nui:\n  width: 640\n  min_width: 800\n", config,
                                         error));
    EXPECT_EQ(error, "ui minimum size must not exceed the initial size");
}

TEST_F(ConfigTest, InvalidLogLevelFails) {
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\nlogging:\n  level: verbose\n", config, error));
    EXPECT_EQ(error, "Invalid log level: verbose");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    LauncherConfig config;
    std::string error;

    EXPECT_TRUE(load_config_from_string("backend:\n  command: app\n  colour: blue\nextras:\n  a: 1\n", config, error))
        << error;
    EXPECT_EQ(config.backend.command, "app");
}

TEST_F(ConfigTest, PortEnvironmentOverride) {
    ::setenv("TETHER_BACKEND_PORT", "4555", 1);
    LauncherConfig config;
    std::string error;

    ASSERT_TRUE(load_config_from_string("backend:\n  command: app\n  port: 4000\n", config, error)) << error;
    EXPECT_EQ(config.backend.port, 4555);
}

TEST_F(ConfigTest, NonNumericPortOverrideFails) {
    ::setenv("TETHER_BACKEND_PORT", "abc", 1);
    LauncherConfig config;
    std::string error;

    EXPECT_FALSE(load_config_from_string("backend:\n  command: app\n", config, error));
    EXPECT_NE(error.find("TETHER_BACKEND_PORT"), std::string::npos);
}

TEST_F(ConfigTest, ValidateDefaultsWithCommand) {
    LauncherConfig config;
    config.backend.command = "app";
    std::string error;

    EXPECT_TRUE(validate_config(config, error)) << error;
}
