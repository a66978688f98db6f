#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/status.hpp"
#include "transport/i_connection.hpp"

#ifndef _WIN32
#include <sys/types.h>
#endif

namespace guidelink {

namespace client {
class IGuiderClient;
}

namespace process {

struct ProcessOptions {
    std::string host = "localhost";
    int port = 4400;
    int startup_timeout_ms = 10000;   // How long start() waits for the port to accept
    int shutdown_timeout_ms = 10000;  // How long stop() waits after a graceful shutdown request
    int poll_interval_ms = 500;       // Reachability / liveness probe cadence
    std::optional<std::string> executable_path;
    std::vector<std::string> args;
    std::map<std::string, std::string> spawn_env;  // Added to the inherited environment
};

// ProcessSupervisor manages the lifecycle of a locally launched PHD2 instance
// Responsibilities:
// - Locate and spawn the executable
// - Wait until the RPC port accepts connections
// - Graceful (RPC shutdown) or forced stop
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(const ProcessOptions &options,
                               std::shared_ptr<transport::IConnectionFactory> factory = nullptr);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Start PHD2 unless something already answers on the configured port
    Status start(const std::optional<std::string> &executable_override = std::nullopt);

    // Stop the managed process. With a connected client a shutdown RPC is tried first.
    Status stop(client::IGuiderClient *client = nullptr);

    // Managed process is alive (reaps it if it has exited)
    bool is_running();

    // A process was spawned by us and not yet reaped
    bool has_managed_process() const;

    // Probe the RPC port until it accepts or the timeout elapses
    Status wait_until_reachable(int timeout_ms);

    bool is_reachable();

    // Exit status of the last reaped process, if any
    std::optional<int> last_exit_status() const;

    const ProcessOptions &options() const { return options_; }

private:
    ProcessOptions options_;
    std::shared_ptr<transport::IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::optional<int> last_exit_status_;

#ifdef _WIN32
    void *process_handle_;  // HANDLE
#else
    pid_t pid_;
#endif

    bool spawn(const std::string &path, std::string &error);
#ifdef _WIN32
    bool spawn_windows(const std::string &path, std::string &error);
#else
    bool spawn_linux(const std::string &path, std::string &error);
#endif
    bool poll_running_locked();
    bool wait_for_exit(int timeout_ms);
    void force_terminate();
    void release_locked();
};

}  // namespace process
}  // namespace guidelink
