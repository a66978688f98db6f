#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

#include "common/status.hpp"

namespace guidelink {
namespace rpc {

// Outcome of one RPC call. Exactly one is produced per call.
struct CallResult {
    ErrorCode code = ErrorCode::OK;
    nlohmann::json result;  // Valid when code == OK
    int rpc_code = 0;       // Remote error code when code == RPC_FAILURE
    std::string message;    // Human-readable error

    bool ok() const { return code == ErrorCode::OK; }

    static CallResult success(nlohmann::json value) {
        CallResult r;
        r.result = std::move(value);
        return r;
    }

    static CallResult failure(ErrorCode code, const std::string &message) {
        CallResult r;
        r.code = code;
        r.message = message;
        return r;
    }

    static CallResult rpc_failure(int remote_code, const std::string &message) {
        CallResult r;
        r.code = ErrorCode::RPC_FAILURE;
        r.rpc_code = remote_code;
        r.message = message;
        return r;
    }
};

}  // namespace rpc
}  // namespace guidelink
