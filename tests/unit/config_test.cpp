#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "logging/logger.hpp"

namespace fs = std::filesystem;
using namespace guidelink::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "guidelink_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    bool load(const std::string& content, RuntimeConfig& config, std::string& error) {
        return load_config(create_config_file("config.yaml", content), config, error);
    }
};

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load("{}\n", config, error)) << "Error: " << error;
    EXPECT_EQ(config.guider.host, "localhost");
    EXPECT_EQ(config.guider.port, 4400);
    EXPECT_EQ(config.guider.connection_timeout_ms, 10000);
    EXPECT_EQ(config.guider.command_timeout_ms, 30000);
    EXPECT_FALSE(config.guider.executable_path.has_value());
    EXPECT_FALSE(config.guider.auto_start);
    EXPECT_TRUE(config.guider.reconnect.enabled);
    EXPECT_EQ(config.guider.reconnect.interval_ms, 5000);
    EXPECT_FALSE(config.guider.reconnect.max_retries.has_value());
    EXPECT_EQ(config.events.queue_size, 100u);
    EXPECT_EQ(config.events.max_subscribers, 0u);
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, FullConfig) {
    std::string config_content = R"(
guider:
  host: observatory.local
  port: 4401
  connection_timeout_ms: 2500
  command_timeout_ms: 15000
  executable_path: /opt/phd2/bin/phd2
  auto_start: true
  shutdown_timeout_ms: 4000
  spawn_env:
    DISPLAY: ":0"
    INDIDEV: "CCD Simulator"
  reconnect:
    enabled: true
    interval_ms: 1000
    max_retries: 5

events:
  queue_size: 250
  max_subscribers: 8

logging:
  level: debug
)";

    RuntimeConfig config;
    std::string error;
    ASSERT_TRUE(load(config_content, config, error)) << "Error: " << error;

    EXPECT_EQ(config.guider.host, "observatory.local");
    EXPECT_EQ(config.guider.port, 4401);
    EXPECT_EQ(config.guider.connection_timeout_ms, 2500);
    EXPECT_EQ(config.guider.command_timeout_ms, 15000);
    EXPECT_EQ(config.guider.executable_path, "/opt/phd2/bin/phd2");
    EXPECT_TRUE(config.guider.auto_start);
    EXPECT_EQ(config.guider.shutdown_timeout_ms, 4000);
    ASSERT_EQ(config.guider.spawn_env.size(), 2u);
    EXPECT_EQ(config.guider.spawn_env["DISPLAY"], ":0");
    EXPECT_EQ(config.guider.spawn_env["INDIDEV"], "CCD Simulator");
    EXPECT_EQ(config.guider.reconnect.interval_ms, 1000);
    EXPECT_EQ(config.guider.reconnect.max_retries, 5);
    EXPECT_EQ(config.events.queue_size, 250u);
    EXPECT_EQ(config.events.max_subscribers, 8u);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, UnknownKeysWarnButDoNotFailLoad) {
    std::string config_content = R"(
guider:
  port: 4400
  colour: red
telescope:
  mount: eq6
)";

    using guidelink::logging::Logger;
    std::ostringstream log;
    auto saved_level = Logger::level();
    Logger::set_level(guidelink::logging::Level::LVL_WARN);
    Logger::set_sink(&log);
    RuntimeConfig config;
    std::string error;
    bool loaded = load(config_content, config, error);
    Logger::set_sink(nullptr);
    Logger::set_level(saved_level);

    ASSERT_TRUE(loaded) << "Error: " << error;
    EXPECT_NE(log.str().find("Unknown key: 'guider.colour'"), std::string::npos);
    EXPECT_NE(log.str().find("Unknown key: 'telescope'"), std::string::npos);
}

TEST_F(ConfigTest, NullMaxRetriesMeansUnlimited) {
    RuntimeConfig config;
    config.guider.reconnect.max_retries = 3;
    std::string error;

    ASSERT_TRUE(load("guider:\n  reconnect:\n    max_retries: ~\n", config, error)) << "Error: " << error;
    EXPECT_FALSE(config.guider.reconnect.max_retries.has_value());
}

TEST_F(ConfigTest, InvalidPort) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("guider:\n  port: 70000\n", config, error));
    EXPECT_EQ(error, "guider.port must be between 1 and 65535");
}

TEST_F(ConfigTest, InvalidLogLevel) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load("logging:\n  level: verbose\n", config, error));
    EXPECT_EQ(error, "Invalid log level: verbose");
}

TEST_F(ConfigTest, ValidLogLevels) {
    for (const std::string level : {"debug", "info", "warn", "error"}) {
        RuntimeConfig config;
        std::string error;
        EXPECT_TRUE(load("logging:\n  level: " + level + "\n", config, error)) << level << ": " << error;
        EXPECT_EQ(config.logging.level, level);
    }
}

TEST_F(ConfigTest, InvalidReconnectSettings) {
    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load("guider:\n  reconnect:\n    max_retries: 0\n", config, error));
    EXPECT_EQ(error, "guider.reconnect.max_retries must be >= 1");

    RuntimeConfig config2;
    EXPECT_FALSE(load("guider:\n  reconnect:\n    interval_ms: 5\n", config2, error));
    EXPECT_EQ(error, "guider.reconnect.interval_ms must be >= 10ms");
}

TEST_F(ConfigTest, InvalidTimeoutsAndQueue) {
    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load("guider:\n  command_timeout_ms: 50\n", config, error));
    EXPECT_EQ(error, "guider.command_timeout_ms must be >= 100ms");

    RuntimeConfig config2;
    EXPECT_FALSE(load("events:\n  queue_size: 0\n", config2, error));
    EXPECT_EQ(error, "events.queue_size must be at least 1");

    RuntimeConfig config3;
    EXPECT_FALSE(load("events:\n  max_subscribers: -1\n", config3, error));
    EXPECT_EQ(error, "events.max_subscribers must be >= 0");
}

TEST_F(ConfigTest, EmptyHostRejected) {
    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load("guider:\n  host: \"\"\n", config, error));
    EXPECT_EQ(error, "guider.host must not be empty");
}

TEST_F(ConfigTest, WrongValueTypeIsLoadError) {
    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load("guider:\n  port: not-a-number\n", config, error));
    EXPECT_NE(error.find("Config load error"), std::string::npos) << error;
}

TEST_F(ConfigTest, MalformedYaml) {
    RuntimeConfig config;
    std::string error;
    EXPECT_FALSE(load("guider: [unterminated\n", config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos) << error;
}

TEST_F(ConfigTest, MissingFile) {
    RuntimeConfig config;
    std::string error;
    std::string path = (temp_dir / "missing.yaml").string();

    EXPECT_FALSE(load_config(path, config, error));
    EXPECT_EQ(error, "Cannot open config file: " + path);
}

TEST_F(ConfigTest, ClientOptionsFromConfig) {
    RuntimeConfig config;
    config.guider.host = "rig";
    config.guider.port = 4402;
    config.guider.connection_timeout_ms = 3000;
    config.guider.command_timeout_ms = 7000;
    config.guider.reconnect.enabled = false;
    config.guider.reconnect.interval_ms = 250;
    config.guider.reconnect.max_retries = 4;
    config.events.queue_size = 32;
    config.events.max_subscribers = 2;

    auto options = make_client_options(config);
    EXPECT_EQ(options.session.host, "rig");
    EXPECT_EQ(options.session.port, 4402);
    EXPECT_EQ(options.session.connection_timeout_ms, 3000);
    EXPECT_FALSE(options.session.reconnect.enabled);
    EXPECT_EQ(options.session.reconnect.interval_ms, 250);
    EXPECT_EQ(options.session.reconnect.max_retries, 4);
    EXPECT_EQ(options.command_timeout_ms, 7000);
    EXPECT_EQ(options.event_queue_size, 32u);
    EXPECT_EQ(options.max_subscribers, 2u);
}

TEST_F(ConfigTest, ProcessOptionsFromConfig) {
    RuntimeConfig config;
    config.guider.host = "127.0.0.1";
    config.guider.port = 4410;
    config.guider.connection_timeout_ms = 20000;
    config.guider.shutdown_timeout_ms = 5000;
    config.guider.executable_path = "/usr/local/bin/phd2";
    config.guider.spawn_env["DISPLAY"] = ":1";

    auto options = make_process_options(config);
    EXPECT_EQ(options.host, "127.0.0.1");
    EXPECT_EQ(options.port, 4410);
    EXPECT_EQ(options.startup_timeout_ms, 20000);
    EXPECT_EQ(options.shutdown_timeout_ms, 5000);
    EXPECT_EQ(options.executable_path, "/usr/local/bin/phd2");
    EXPECT_EQ(options.spawn_env.at("DISPLAY"), ":1");
}
