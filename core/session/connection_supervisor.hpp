#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "common/status.hpp"
#include "connection_state.hpp"
#include "events/event_emitter.hpp"
#include "reconnect_policy.hpp"
#include "rpc/message_classifier.hpp"
#include "rpc/request_correlator.hpp"
#include "transport/i_connection.hpp"

namespace guidelink {
namespace session {

/**
 * @brief Owns the guider connection and its lifecycle state
 *
 * All state transitions run on one worker thread that drains a command
 * queue. Public methods post a command and wait for the worker to finish
 * it, so connect(), disconnect() and the reconnect loop never overlap.
 *
 * Threads:
 * - worker: owns ConnectionState, the open connection and the reconnect timer
 * - reader (one per connection): reads lines, classifies and dispatches them,
 *   and posts a failure command when the stream ends; it never waits on the worker
 *
 * The reconnect loop is the worker's timed wait on its own queue, so
 * disconnect() and stop_reconnection() interrupt it immediately.
 */
class ConnectionSupervisor {
public:
    ConnectionSupervisor(const SessionOptions &options, std::shared_ptr<transport::IConnectionFactory> factory,
                         rpc::RequestCorrelator &correlator, events::EventEmitter &emitter);
    ~ConnectionSupervisor();

    ConnectionSupervisor(const ConnectionSupervisor &) = delete;
    ConnectionSupervisor &operator=(const ConnectionSupervisor &) = delete;

    // No-op when already connected; cancels a running reconnect loop without publishing
    Status connect();

    // Idempotent; callable from any state
    void disconnect();

    // Ends a running reconnect loop, leaves auto-reconnect enabled
    void stop_reconnection();

    void set_auto_reconnect_enabled(bool enabled);
    bool is_auto_reconnect_enabled() const { return reconnect_enabled_.load(); }

    ConnectionState state() const { return state_.load(); }
    bool is_connected() const { return state() == ConnectionState::CONNECTED; }
    bool is_reconnecting() const { return state() == ConnectionState::RECONNECTING; }

    // From the last Version greeting; cleared on disconnect
    std::optional<std::string> phd2_version() const;

    // From the last AppState event; cleared on disconnect
    std::optional<events::AppState> app_state() const;

    const SessionOptions &options() const { return options_; }

private:
    enum class CommandType { CONNECT, DISCONNECT, STOP_RECONNECTION, SET_AUTO_RECONNECT, TRANSPORT_FAILED, SHUTDOWN };

    struct Command {
        CommandType type = CommandType::CONNECT;
        bool flag = false;
        uint64_t generation = 0;
        std::string reason;
        std::shared_ptr<std::promise<Status>> done;
    };

    Status submit(Command command);
    void post(Command command);

    void run();
    Status handle(const Command &command);

    Status handle_connect();
    void handle_disconnect();
    void handle_transport_failed(uint64_t generation, const std::string &reason);
    void handle_shutdown();

    Status open_session(bool reconnecting);
    void close_session();
    void reconnect_tick();
    void end_reconnect(const std::string &reason);

    void reader_loop(std::shared_ptr<transport::IConnection> connection, uint64_t generation);
    void dispatch(const std::string &line);

    void set_state(ConnectionState state);
    void clear_session_info();

    SessionOptions options_;
    std::shared_ptr<transport::IConnectionFactory> factory_;
    rpc::RequestCorrelator &correlator_;
    events::EventEmitter &emitter_;
    rpc::MessageClassifier classifier_;

    std::atomic<ConnectionState> state_;
    std::atomic<bool> reconnect_enabled_;

    // Command queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Command> commands_;
    bool stopping_ = false;
    std::thread worker_;

    // Worker-owned
    std::shared_ptr<transport::IConnection> connection_;
    std::thread reader_;
    uint64_t generation_ = 0;
    int reconnect_attempt_ = 0;
    std::optional<std::chrono::steady_clock::time_point> next_attempt_at_;

    mutable std::mutex info_mutex_;
    std::optional<std::string> phd2_version_;
    std::optional<events::AppState> app_state_;
};

}  // namespace session
}  // namespace guidelink
