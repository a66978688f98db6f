#pragma once

#include <memory>
#include <optional>
#include <string>

#include "events/event_emitter.hpp"
#include "i_guider_client.hpp"
#include "rpc/request_correlator.hpp"
#include "session/connection_supervisor.hpp"
#include "transport/i_connection.hpp"

namespace guidelink {
namespace client {

struct GuiderClientOptions {
    session::SessionOptions session;
    int command_timeout_ms = 30000;  // Default per-call timeout
    size_t event_queue_size = 100;   // Per-subscriber queue bound
    size_t max_subscribers = 0;      // 0 = unlimited
};

// Result of get_app_state()
struct AppStateResult {
    Status status;
    events::AppState state = events::AppState::UNKNOWN;
};

// GuiderClient is the entry point for talking to one PHD2 instance.
// It owns the event emitter, the request correlator and the connection
// supervisor, in that construction order.
class GuiderClient : public IGuiderClient {
public:
    explicit GuiderClient(const GuiderClientOptions &options,
                          std::shared_ptr<transport::IConnectionFactory> factory = nullptr);
    ~GuiderClient() override;

    GuiderClient(const GuiderClient &) = delete;
    GuiderClient &operator=(const GuiderClient &) = delete;

    Status connect() override;
    void disconnect() override;
    bool is_connected() const override;
    session::ConnectionState state() const override;

    void set_auto_reconnect_enabled(bool enabled) override;
    bool is_auto_reconnect_enabled() const override;
    bool is_reconnecting() const override;
    void stop_reconnection() override;

    rpc::CallResult call(const std::string &method, const nlohmann::json &params, int timeout_ms) override;

    // Same as call() with the configured command timeout
    rpc::CallResult call(const std::string &method, const nlohmann::json &params = nullptr);

    std::unique_ptr<events::Subscription> subscribe(const events::EventFilter &filter = events::EventFilter::all(),
                                                    size_t queue_size = 0, const std::string &name = "") override;

    Status shutdown_application() override;

    // Current PHD2 state via get_app_state
    AppStateResult get_app_state();

    std::optional<std::string> phd2_version() const;
    std::optional<events::AppState> cached_app_state() const;

    const GuiderClientOptions &options() const { return options_; }

private:
    GuiderClientOptions options_;
    events::EventEmitter emitter_;
    rpc::RequestCorrelator correlator_;
    session::ConnectionSupervisor supervisor_;
};

}  // namespace client
}  // namespace guidelink
