#pragma once

#include <optional>
#include <string>

namespace guidelink {
namespace session {

// Automatic reconnection after an unexpected connection loss.
// Only `enabled` may change after construction (set_auto_reconnect_enabled).
struct ReconnectPolicy {
    bool enabled = true;
    int interval_ms = 5000;          // Delay before each attempt
    std::optional<int> max_retries;  // nullopt = retry forever
};

inline std::string describe_max_retries(const ReconnectPolicy &policy) {
    return policy.max_retries ? std::to_string(*policy.max_retries) : std::string("unlimited");
}

// Connection parameters handed to the supervisor
struct SessionOptions {
    std::string host = "localhost";
    int port = 4400;
    int connection_timeout_ms = 10000;  // TCP connect and greeting, each
    ReconnectPolicy reconnect;
};

}  // namespace session
}  // namespace guidelink
