#pragma once

#include <string>

namespace guidelink {

// Error taxonomy shared by the session, correlator and process layers
enum class ErrorCode {
    OK,
    NOT_CONNECTED,            // No live session and no reconnect in progress
    CONNECTION_FAILED,        // TCP connect or greeting failed
    CONNECTION_LOST,          // Transport went away while the call was outstanding
    TIMEOUT,                  // Local deadline exceeded
    RPC_FAILURE,              // Remote side returned an "error" object
    PROCESS_START_FAILED,
    EXECUTABLE_NOT_FOUND,
    PROCESS_ALREADY_RUNNING,
    INVALID_RESPONSE          // Result had an unexpected shape
};

inline const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NOT_CONNECTED: return "NOT_CONNECTED";
        case ErrorCode::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ErrorCode::CONNECTION_LOST: return "CONNECTION_LOST";
        case ErrorCode::TIMEOUT: return "TIMEOUT";
        case ErrorCode::RPC_FAILURE: return "RPC_FAILURE";
        case ErrorCode::PROCESS_START_FAILED: return "PROCESS_START_FAILED";
        case ErrorCode::EXECUTABLE_NOT_FOUND: return "EXECUTABLE_NOT_FOUND";
        case ErrorCode::PROCESS_ALREADY_RUNNING: return "PROCESS_ALREADY_RUNNING";
        case ErrorCode::INVALID_RESPONSE: return "INVALID_RESPONSE";
    }
    return "UNKNOWN";
}

struct Status {
    ErrorCode code = ErrorCode::OK;
    std::string message;

    bool ok() const { return code == ErrorCode::OK; }

    static Status success() { return Status{}; }
    static Status error(ErrorCode code, const std::string &message) { return Status{code, message}; }
};

}  // namespace guidelink
