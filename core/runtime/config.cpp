#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace guidelink {
namespace runtime {

namespace {

void warn_unknown_keys(const YAML::Node &node, const std::vector<std::string> &valid_keys,
                       const std::string &section) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown key: '" << section << key << "' (will be ignored)");
        }
    }
}

void load_guider(const YAML::Node &node, GuiderConfig &guider) {
    warn_unknown_keys(node,
                      {"host", "port", "connection_timeout_ms", "command_timeout_ms", "executable_path", "auto_start",
                       "shutdown_timeout_ms", "spawn_env", "reconnect"},
                      "guider.");

    if (node["host"]) {
        guider.host = node["host"].as<std::string>();
    }
    if (node["port"]) {
        guider.port = node["port"].as<int>();
    }
    if (node["connection_timeout_ms"]) {
        guider.connection_timeout_ms = node["connection_timeout_ms"].as<int>();
    }
    if (node["command_timeout_ms"]) {
        guider.command_timeout_ms = node["command_timeout_ms"].as<int>();
    }
    if (node["executable_path"] && !node["executable_path"].IsNull()) {
        guider.executable_path = node["executable_path"].as<std::string>();
    }
    if (node["auto_start"]) {
        guider.auto_start = node["auto_start"].as<bool>();
    }
    if (node["shutdown_timeout_ms"]) {
        guider.shutdown_timeout_ms = node["shutdown_timeout_ms"].as<int>();
    }

    if (node["spawn_env"]) {
        guider.spawn_env.clear();  // Ensure idempotent parsing
        for (const auto &kv : node["spawn_env"]) {
            guider.spawn_env[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }

    if (node["reconnect"]) {
        const auto &rc = node["reconnect"];
        if (rc["enabled"]) {
            guider.reconnect.enabled = rc["enabled"].as<bool>();
        }
        if (rc["interval_ms"]) {
            guider.reconnect.interval_ms = rc["interval_ms"].as<int>();
        }
        if (rc["max_retries"]) {
            if (rc["max_retries"].IsNull()) {
                guider.reconnect.max_retries.reset();
            } else {
                guider.reconnect.max_retries = rc["max_retries"].as<int>();
            }
        }
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    const auto &guider = config.guider;

    if (guider.host.empty()) {
        error = "guider.host must not be empty";
        return false;
    }
    if (guider.port < 1 || guider.port > 65535) {
        error = "guider.port must be between 1 and 65535";
        return false;
    }
    if (guider.connection_timeout_ms < 100) {
        error = "guider.connection_timeout_ms must be >= 100ms";
        return false;
    }
    if (guider.command_timeout_ms < 100) {
        error = "guider.command_timeout_ms must be >= 100ms";
        return false;
    }
    if (guider.shutdown_timeout_ms < 100) {
        error = "guider.shutdown_timeout_ms must be >= 100ms";
        return false;
    }
    if (guider.executable_path && guider.executable_path->empty()) {
        error = "guider.executable_path must not be empty when set";
        return false;
    }

    if (guider.reconnect.interval_ms < 10) {
        error = "guider.reconnect.interval_ms must be >= 10ms";
        return false;
    }
    if (guider.reconnect.max_retries && *guider.reconnect.max_retries < 1) {
        error = "guider.reconnect.max_retries must be >= 1";
        return false;
    }

    if (config.events.queue_size < 1) {
        error = "events.queue_size must be at least 1";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, {"guider", "events", "logging"}, "");

        if (yaml["guider"]) {
            load_guider(yaml["guider"], config.guider);
        }

        if (yaml["events"]) {
            if (yaml["events"]["queue_size"]) {
                int queue_size = yaml["events"]["queue_size"].as<int>();
                if (queue_size < 1) {
                    error = "events.queue_size must be at least 1";
                    return false;
                }
                config.events.queue_size = static_cast<size_t>(queue_size);
            }
            if (yaml["events"]["max_subscribers"]) {
                int max_subscribers = yaml["events"]["max_subscribers"].as<int>();
                if (max_subscribers < 0) {
                    error = "events.max_subscribers must be >= 0";
                    return false;
                }
                config.events.max_subscribers = static_cast<size_t>(max_subscribers);
            }
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Guider: " << config.guider.host << ":" << config.guider.port);

        std::stringstream reconnect_msg;
        reconnect_msg << "[Config] Reconnect: " << (config.guider.reconnect.enabled ? "enabled" : "disabled");
        if (config.guider.reconnect.enabled) {
            const auto &max_retries = config.guider.reconnect.max_retries;
            reconnect_msg << " (every " << config.guider.reconnect.interval_ms << "ms, max retries: "
                          << (max_retries ? std::to_string(*max_retries) : std::string("unlimited")) << ")";
        }
        LOG_INFO(reconnect_msg.str());

        if (config.guider.executable_path) {
            LOG_INFO("[Config] PHD2 executable: " << *config.guider.executable_path);
        }
        LOG_INFO("[Config] Event queue size: " << config.events.queue_size);
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

client::GuiderClientOptions make_client_options(const RuntimeConfig &config) {
    client::GuiderClientOptions options;
    options.session.host = config.guider.host;
    options.session.port = config.guider.port;
    options.session.connection_timeout_ms = config.guider.connection_timeout_ms;
    options.session.reconnect.enabled = config.guider.reconnect.enabled;
    options.session.reconnect.interval_ms = config.guider.reconnect.interval_ms;
    options.session.reconnect.max_retries = config.guider.reconnect.max_retries;
    options.command_timeout_ms = config.guider.command_timeout_ms;
    options.event_queue_size = config.events.queue_size;
    options.max_subscribers = config.events.max_subscribers;
    return options;
}

process::ProcessOptions make_process_options(const RuntimeConfig &config) {
    process::ProcessOptions options;
    options.host = config.guider.host;
    options.port = config.guider.port;
    options.startup_timeout_ms = config.guider.connection_timeout_ms;
    options.shutdown_timeout_ms = config.guider.shutdown_timeout_ms;
    options.executable_path = config.guider.executable_path;
    options.spawn_env = config.guider.spawn_env;
    return options;
}

}  // namespace runtime
}  // namespace guidelink
