// guidelink
// Command line client for a PHD2 guider

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "client/guider_client.hpp"
#include "events/event_parser.hpp"
#include "logging/logger.hpp"
#include "process/process_supervisor.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"

using guidelink::ErrorCode;
using guidelink::Status;
using guidelink::client::GuiderClient;
using nlohmann::json;

namespace {

const char *kDefaultConfigPath = "guidelink.yaml";

void print_usage() {
    std::cerr << "Usage: guidelink [OPTIONS] COMMAND [ARGS]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  status                  Show PHD2 version, connection and guiding state\n";
    std::cerr << "  monitor                 Print every PHD2 event as a JSON line until interrupted\n";
    std::cerr << "  call METHOD [PARAMS]    Invoke one RPC method; PARAMS is a JSON array or object\n";
    std::cerr << "  start                   Start PHD2 and wait until it accepts connections\n";
    std::cerr << "  stop                    Ask PHD2 to exit\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH      Path to config file (default: " << kDefaultConfigPath << " if present)\n";
    std::cerr << "  --host=HOST        PHD2 host (overrides config)\n";
    std::cerr << "  --port=PORT        PHD2 RPC port (overrides config)\n";
    std::cerr << "  --log-level=LEVEL  debug, info, warn or error (overrides config)\n";
    std::cerr << "  --help, -h         Show this help\n";
}

void print_status_error(const std::string &what, const Status &status) {
    std::cerr << what << ": " << status.message << " (" << guidelink::error_code_to_string(status.code) << ")\n";
}

bool ensure_started(const guidelink::runtime::RuntimeConfig &config) {
    if (!config.guider.auto_start) {
        return true;
    }
    guidelink::process::ProcessSupervisor supervisor(guidelink::runtime::make_process_options(config));
    Status status = supervisor.start();
    if (!status.ok()) {
        print_status_error("Failed to start PHD2", status);
        return false;
    }
    return true;
}

int run_status(GuiderClient &client) {
    Status status = client.connect();
    if (!status.ok()) {
        print_status_error("Failed to connect", status);
        return 1;
    }

    std::cout << "PHD2 version: " << client.phd2_version().value_or("unknown") << "\n";
    std::cout << "Connection:   " << guidelink::session::connection_state_to_string(client.state()) << "\n";

    auto app_state = client.get_app_state();
    if (!app_state.status.ok()) {
        print_status_error("get_app_state failed", app_state.status);
        client.disconnect();
        return 1;
    }
    std::cout << "App state:    " << guidelink::events::app_state_to_string(app_state.state) << "\n";

    client.disconnect();
    return 0;
}

int run_monitor(GuiderClient &client) {
    guidelink::runtime::SignalHandler::install();

    // Subscribe before connecting so the greeting is not missed
    auto subscription = client.subscribe(guidelink::events::EventFilter::all(), 0, "cli-monitor");
    if (!subscription) {
        std::cerr << "Failed to subscribe to events\n";
        return 1;
    }

    Status status = client.connect();
    if (!status.ok()) {
        print_status_error("Failed to connect", status);
        return 1;
    }

    LOG_INFO("[Monitor] Streaming events, press Ctrl+C to stop");
    while (!guidelink::runtime::SignalHandler::is_shutdown_requested()) {
        auto event = subscription->pop(200);
        if (!event) {
            continue;
        }
        std::cout << guidelink::events::event_to_json(*event).dump() << std::endl;

        if (std::holds_alternative<guidelink::events::ReconnectFailedEvent>(*event)) {
            std::cerr << "Connection to PHD2 could not be re-established\n";
            return 1;
        }
    }

    LOG_INFO("[Monitor] Signal received, disconnecting");
    client.disconnect();
    return 0;
}

int run_call(GuiderClient &client, const std::vector<std::string> &args) {
    if (args.empty()) {
        std::cerr << "call: missing METHOD\n";
        return 1;
    }

    json params = nullptr;
    if (args.size() > 1) {
        try {
            params = json::parse(args[1]);
        } catch (const json::parse_error &e) {
            std::cerr << "call: invalid JSON params: " << e.what() << "\n";
            return 1;
        }
        if (!params.is_array() && !params.is_object()) {
            std::cerr << "call: params must be a JSON array or object\n";
            return 1;
        }
    }

    Status status = client.connect();
    if (!status.ok()) {
        print_status_error("Failed to connect", status);
        return 1;
    }

    auto result = client.call(args[0], params);
    client.disconnect();

    if (!result.ok()) {
        std::cerr << args[0] << " failed: " << result.message << " (" << guidelink::error_code_to_string(result.code);
        if (result.code == ErrorCode::RPC_FAILURE) {
            std::cerr << " " << result.rpc_code;
        }
        std::cerr << ")\n";
        return 1;
    }

    std::cout << result.result.dump(2) << "\n";
    return 0;
}

int run_start(const guidelink::runtime::RuntimeConfig &config) {
    guidelink::process::ProcessSupervisor supervisor(guidelink::runtime::make_process_options(config));
    Status status = supervisor.start();
    if (!status.ok()) {
        print_status_error("Failed to start PHD2", status);
        return 1;
    }
    std::cout << "PHD2 is running on " << config.guider.host << ":" << config.guider.port << "\n";
    return 0;
}

int run_stop(GuiderClient &client, const guidelink::runtime::RuntimeConfig &config) {
    Status status = client.connect();
    if (!status.ok()) {
        std::cout << "PHD2 is not running on " << config.guider.host << ":" << config.guider.port << "\n";
        return 0;
    }

    guidelink::process::ProcessSupervisor supervisor(guidelink::runtime::make_process_options(config));
    status = supervisor.stop(&client);
    client.disconnect();
    if (!status.ok()) {
        print_status_error("Failed to stop PHD2", status);
        return 1;
    }
    std::cout << "PHD2 stopped\n";
    return 0;
}

}  // namespace

int main(int argc, char **argv) {
    std::optional<std::string> config_path;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<std::string> log_level;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.rfind("--host=", 0) == 0) {
            host = arg.substr(7);
        } else if (arg.rfind("--port=", 0) == 0) {
            try {
                port = std::stoi(arg.substr(7));
            } catch (const std::exception &) {
                std::cerr << "Invalid port: " << arg.substr(7) << "\n";
                return 1;
            }
        } else if (arg.rfind("--log-level=", 0) == 0) {
            log_level = arg.substr(12);
        } else if (arg.rfind("--", 0) == 0 && positional.empty()) {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    guidelink::runtime::RuntimeConfig config;
    std::string error;

    if (config_path || std::filesystem::exists(kDefaultConfigPath)) {
        std::string path = config_path.value_or(kDefaultConfigPath);
        if (!std::filesystem::exists(path)) {
            // Using cerr here as logger might not be configured yet
            std::cerr << "ERROR: Config file not found: " << path << "\n";
            return 1;
        }
        LOG_INFO("Loading config: " << path);
        if (!guidelink::runtime::load_config(path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    if (host) config.guider.host = *host;
    if (port) config.guider.port = *port;
    if (log_level) config.logging.level = *log_level;

    if (!guidelink::runtime::validate_config(config, error)) {
        std::cerr << "Invalid configuration: " << error << "\n";
        return 1;
    }

    guidelink::logging::Logger::set_level(guidelink::logging::string_to_level(config.logging.level));

    const std::string command = positional[0];
    const std::vector<std::string> args(positional.begin() + 1, positional.end());

    if (command == "start") {
        return run_start(config);
    }

    if (command != "status" && command != "monitor" && command != "call" && command != "stop") {
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    }

    if (command != "stop" && !ensure_started(config)) {
        return 1;
    }

    auto options = guidelink::runtime::make_client_options(config);
    // Only monitor keeps reconnecting
    if (command != "monitor") {
        options.session.reconnect.enabled = false;
    }
    GuiderClient client(options);

    if (command == "status") {
        return run_status(client);
    }
    if (command == "monitor") {
        return run_monitor(client);
    }
    if (command == "call") {
        return run_call(client, args);
    }
    return run_stop(client, config);
}
