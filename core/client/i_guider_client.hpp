#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

#include "common/status.hpp"
#include "events/event_emitter.hpp"
#include "rpc/call_result.hpp"
#include "session/connection_state.hpp"

namespace guidelink {
namespace client {

// Interface for GuiderClient to enable mocking
class IGuiderClient {
public:
    virtual ~IGuiderClient() = default;

    // Session control
    virtual Status connect() = 0;
    virtual void disconnect() = 0;
    virtual bool is_connected() const = 0;
    virtual session::ConnectionState state() const = 0;

    // Reconnect control
    virtual void set_auto_reconnect_enabled(bool enabled) = 0;
    virtual bool is_auto_reconnect_enabled() const = 0;
    virtual bool is_reconnecting() const = 0;
    virtual void stop_reconnection() = 0;

    // Raw RPC; every PHD2 method goes through here
    virtual rpc::CallResult call(const std::string &method, const nlohmann::json &params, int timeout_ms) = 0;

    // Event stream
    virtual std::unique_ptr<events::Subscription> subscribe(
        const events::EventFilter &filter = events::EventFilter::all(), size_t queue_size = 0,
        const std::string &name = "") = 0;

    // Asks PHD2 to exit
    virtual Status shutdown_application() = 0;
};

}  // namespace client
}  // namespace guidelink
