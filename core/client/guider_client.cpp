#include "guider_client.hpp"

#include <utility>

#include "logging/logger.hpp"
#include "transport/tcp_connection.hpp"

namespace guidelink {
namespace client {

GuiderClient::GuiderClient(const GuiderClientOptions &options, std::shared_ptr<transport::IConnectionFactory> factory)
    : options_(options),
      emitter_(options.event_queue_size, options.max_subscribers),
      correlator_(),
      supervisor_(options.session,
                  factory ? std::move(factory) : std::make_shared<transport::TcpConnectionFactory>(), correlator_,
                  emitter_) {}

GuiderClient::~GuiderClient() = default;

Status GuiderClient::connect() { return supervisor_.connect(); }

void GuiderClient::disconnect() { supervisor_.disconnect(); }

bool GuiderClient::is_connected() const { return supervisor_.is_connected(); }

session::ConnectionState GuiderClient::state() const { return supervisor_.state(); }

void GuiderClient::set_auto_reconnect_enabled(bool enabled) { supervisor_.set_auto_reconnect_enabled(enabled); }

bool GuiderClient::is_auto_reconnect_enabled() const { return supervisor_.is_auto_reconnect_enabled(); }

bool GuiderClient::is_reconnecting() const { return supervisor_.is_reconnecting(); }

void GuiderClient::stop_reconnection() { supervisor_.stop_reconnection(); }

rpc::CallResult GuiderClient::call(const std::string &method, const nlohmann::json &params, int timeout_ms) {
    // A reconnect in progress means the session was lost, not that it never existed
    if (supervisor_.is_reconnecting()) {
        return rpc::CallResult::failure(ErrorCode::CONNECTION_LOST,
                                        "Connection lost, reconnection in progress");
    }
    return correlator_.call(method, params, timeout_ms);
}

rpc::CallResult GuiderClient::call(const std::string &method, const nlohmann::json &params) {
    return call(method, params, options_.command_timeout_ms);
}

std::unique_ptr<events::Subscription> GuiderClient::subscribe(const events::EventFilter &filter, size_t queue_size,
                                                              const std::string &name) {
    return emitter_.subscribe(filter, queue_size, name);
}

Status GuiderClient::shutdown_application() {
    auto result = call("shutdown", nullptr, options_.command_timeout_ms);
    if (result.ok()) {
        return Status::success();
    }

    // PHD2 may drop the socket before answering
    if (result.code == ErrorCode::CONNECTION_LOST) {
        LOG_DEBUG("[Client] Connection closed while PHD2 was shutting down");
        return Status::success();
    }
    return Status::error(result.code, result.message);
}

AppStateResult GuiderClient::get_app_state() {
    AppStateResult out;

    auto result = call("get_app_state", nullptr, options_.command_timeout_ms);
    if (!result.ok()) {
        out.status = Status::error(result.code, result.message);
        return out;
    }

    if (!result.result.is_string()) {
        out.status = Status::error(ErrorCode::INVALID_RESPONSE, "get_app_state returned " + result.result.dump());
        return out;
    }

    auto state = events::app_state_from_string(result.result.get<std::string>());
    if (!state) {
        out.status =
            Status::error(ErrorCode::INVALID_RESPONSE, "Unknown app state: " + result.result.get<std::string>());
        return out;
    }

    out.state = *state;
    return out;
}

std::optional<std::string> GuiderClient::phd2_version() const { return supervisor_.phd2_version(); }

std::optional<events::AppState> GuiderClient::cached_app_state() const { return supervisor_.app_state(); }

}  // namespace client
}  // namespace guidelink
