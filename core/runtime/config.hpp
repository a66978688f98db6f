#pragma once

#include <map>
#include <optional>
#include <string>

#include "client/guider_client.hpp"
#include "process/process_supervisor.hpp"

namespace guidelink {
namespace runtime {

struct ReconnectConfig {
    bool enabled = true;
    int interval_ms = 5000;
    std::optional<int> max_retries;  // Unset = retry forever
};

// guider: section
struct GuiderConfig {
    std::string host = "localhost";
    int port = 4400;
    int connection_timeout_ms = 10000;  // TCP connect + greeting, also process readiness wait
    int command_timeout_ms = 30000;     // Default RPC timeout
    std::optional<std::string> executable_path;
    bool auto_start = false;          // CLI starts PHD2 before connecting
    int shutdown_timeout_ms = 10000;  // Wait for exit after a shutdown request
    std::map<std::string, std::string> spawn_env;
    ReconnectConfig reconnect;
};

struct EventsConfig {
    size_t queue_size = 100;
    size_t max_subscribers = 0;  // 0 = unlimited
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    GuiderConfig guider;
    EventsConfig events;
    LoggingConfig logging;
};

// Loads configuration from a YAML file. Keys that are absent keep their defaults.
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

client::GuiderClientOptions make_client_options(const RuntimeConfig &config);

process::ProcessOptions make_process_options(const RuntimeConfig &config);

}  // namespace runtime
}  // namespace guidelink
