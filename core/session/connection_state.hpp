#pragma once

namespace guidelink {
namespace session {

// Lifecycle of the guider session. Written only by ConnectionSupervisor's worker.
enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING
};

inline const char *connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        case ConnectionState::RECONNECTING: return "RECONNECTING";
        default: return "DISCONNECTED";
    }
}

}  // namespace session
}  // namespace guidelink
