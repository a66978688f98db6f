#include "connection_supervisor.hpp"

#include <nlohmann/json.hpp>

#include <utility>

#include "events/event_parser.hpp"
#include "logging/logger.hpp"
#include "rpc/json_rpc.hpp"

namespace guidelink {
namespace session {

namespace {
constexpr int kReaderPollMs = 500;
}  // namespace

ConnectionSupervisor::ConnectionSupervisor(const SessionOptions &options,
                                           std::shared_ptr<transport::IConnectionFactory> factory,
                                           rpc::RequestCorrelator &correlator, events::EventEmitter &emitter)
    : options_(options),
      factory_(std::move(factory)),
      correlator_(correlator),
      emitter_(emitter),
      classifier_([&correlator](uint64_t id) { return correlator.is_outstanding(id); }),
      state_(ConnectionState::DISCONNECTED),
      reconnect_enabled_(options.reconnect.enabled) {
    worker_ = std::thread(&ConnectionSupervisor::run, this);
}

ConnectionSupervisor::~ConnectionSupervisor() {
    Command command;
    command.type = CommandType::SHUTDOWN;
    static_cast<void>(submit(std::move(command)));

    if (worker_.joinable()) {
        worker_.join();
    }
}

Status ConnectionSupervisor::connect() {
    Command command;
    command.type = CommandType::CONNECT;
    return submit(std::move(command));
}

void ConnectionSupervisor::disconnect() {
    Command command;
    command.type = CommandType::DISCONNECT;
    static_cast<void>(submit(std::move(command)));
}

void ConnectionSupervisor::stop_reconnection() {
    Command command;
    command.type = CommandType::STOP_RECONNECTION;
    static_cast<void>(submit(std::move(command)));
}

void ConnectionSupervisor::set_auto_reconnect_enabled(bool enabled) {
    Command command;
    command.type = CommandType::SET_AUTO_RECONNECT;
    command.flag = enabled;
    static_cast<void>(submit(std::move(command)));
}

std::optional<std::string> ConnectionSupervisor::phd2_version() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return phd2_version_;
}

std::optional<events::AppState> ConnectionSupervisor::app_state() const {
    std::lock_guard<std::mutex> lock(info_mutex_);
    return app_state_;
}

Status ConnectionSupervisor::submit(Command command) {
    auto done = std::make_shared<std::promise<Status>>();
    auto result = done->get_future();
    command.done = done;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return Status::error(ErrorCode::NOT_CONNECTED, "Session supervisor is shut down");
        }
        commands_.push_back(std::move(command));
    }
    queue_cv_.notify_one();

    return result.get();
}

void ConnectionSupervisor::post(Command command) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        commands_.push_back(std::move(command));
    }
    queue_cv_.notify_one();
}

void ConnectionSupervisor::run() {
    while (true) {
        Command command;
        bool have_command = false;
        bool attempt_due = false;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            auto has_command = [this] { return !commands_.empty(); };

            if (next_attempt_at_) {
                queue_cv_.wait_until(lock, *next_attempt_at_, has_command);
            } else {
                queue_cv_.wait(lock, has_command);
            }

            if (!commands_.empty()) {
                command = std::move(commands_.front());
                commands_.pop_front();
                have_command = true;
            } else if (next_attempt_at_ && std::chrono::steady_clock::now() >= *next_attempt_at_) {
                attempt_due = true;
            }
        }

        if (have_command) {
            Status status = handle(command);
            if (command.done) {
                command.done->set_value(status);
            }

            if (command.type == CommandType::SHUTDOWN) {
                std::deque<Command> leftover;
                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    stopping_ = true;
                    leftover.swap(commands_);
                }
                for (auto &pending : leftover) {
                    if (pending.done) {
                        pending.done->set_value(
                            Status::error(ErrorCode::NOT_CONNECTED, "Session supervisor is shut down"));
                    }
                }
                return;
            }
        } else if (attempt_due) {
            reconnect_tick();
        }
    }
}

Status ConnectionSupervisor::handle(const Command &command) {
    switch (command.type) {
        case CommandType::CONNECT:
            return handle_connect();
        case CommandType::DISCONNECT:
            handle_disconnect();
            return Status::success();
        case CommandType::STOP_RECONNECTION:
            if (state_.load() == ConnectionState::RECONNECTING) {
                end_reconnect("Reconnection cancelled");
            }
            return Status::success();
        case CommandType::SET_AUTO_RECONNECT:
            reconnect_enabled_.store(command.flag);
            LOG_INFO("[Session] Auto-reconnect " << (command.flag ? "enabled" : "disabled"));
            if (!command.flag && state_.load() == ConnectionState::RECONNECTING) {
                end_reconnect("Auto-reconnect disabled");
            }
            return Status::success();
        case CommandType::TRANSPORT_FAILED:
            handle_transport_failed(command.generation, command.reason);
            return Status::success();
        case CommandType::SHUTDOWN:
            handle_shutdown();
            return Status::success();
    }
    return Status::success();
}

Status ConnectionSupervisor::handle_connect() {
    const auto current = state_.load();
    if (current == ConnectionState::CONNECTED) {
        LOG_DEBUG("[Session] Already connected");
        return Status::success();
    }

    const bool superseded = current == ConnectionState::RECONNECTING;
    if (superseded) {
        LOG_INFO("[Session] Manual connect supersedes reconnection attempt " << reconnect_attempt_);
        next_attempt_at_.reset();
        reconnect_attempt_ = 0;
    }

    set_state(ConnectionState::CONNECTING);
    LOG_INFO("[Session] Connecting to PHD2 at " << options_.host << ":" << options_.port);

    Status status = open_session(false);
    if (!status.ok()) {
        LOG_ERROR("[Session] Connection failed: " << status.message);
        if (superseded) {
            // Subscribers last saw ConnectionLost; the loop they were told about is over
            end_reconnect("Manual connect failed: " + status.message);
        } else {
            set_state(ConnectionState::DISCONNECTED);
        }
    }
    return status;
}

void ConnectionSupervisor::handle_disconnect() {
    switch (state_.load()) {
        case ConnectionState::RECONNECTING:
            end_reconnect("Reconnection cancelled");
            break;
        case ConnectionState::CONNECTED: {
            LOG_INFO("[Session] Disconnecting from PHD2");
            correlator_.fail_all("Disconnected by client");
            close_session();
            set_state(ConnectionState::DISCONNECTED);
            clear_session_info();

            events::ConnectionLostEvent lost;
            lost.reason = "Disconnected by client";
            lost.timestamp_ms = events::now_epoch_ms();
            emitter_.publish(lost);
            break;
        }
        default:
            LOG_DEBUG("[Session] Disconnect requested while already disconnected");
            break;
    }
}

void ConnectionSupervisor::handle_transport_failed(uint64_t generation, const std::string &reason) {
    if (generation != generation_ || state_.load() != ConnectionState::CONNECTED) {
        LOG_DEBUG("[Session] Ignoring stale failure from generation " << generation << ": " << reason);
        return;
    }

    LOG_WARN("[Session] Connection lost: " << reason);

    correlator_.fail_all("Connection lost: " + reason);
    close_session();

    if (reconnect_enabled_.load()) {
        set_state(ConnectionState::RECONNECTING);
        reconnect_attempt_ = 0;
        next_attempt_at_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.reconnect.interval_ms);
        LOG_INFO("[Session] Reconnecting every " << options_.reconnect.interval_ms
                                                 << "ms (max retries: " << describe_max_retries(options_.reconnect)
                                                 << ")");
    } else {
        set_state(ConnectionState::DISCONNECTED);
        clear_session_info();
    }

    events::ConnectionLostEvent lost;
    lost.reason = reason;
    lost.timestamp_ms = events::now_epoch_ms();
    emitter_.publish(lost);
}

void ConnectionSupervisor::handle_shutdown() {
    next_attempt_at_.reset();
    reconnect_attempt_ = 0;
    correlator_.fail_all("Client shutting down");
    close_session();
    set_state(ConnectionState::DISCONNECTED);
}

Status ConnectionSupervisor::open_session(bool reconnecting) {
    close_session();

    std::string error;
    auto connection = factory_->connect(options_.host, options_.port, options_.connection_timeout_ms, error);
    if (!connection) {
        return Status::error(ErrorCode::CONNECTION_FAILED, error.empty() ? "Connection refused" : error);
    }

    // PHD2 greets every client with a Version event
    std::string greeting;
    auto read_status = connection->read_line(greeting, options_.connection_timeout_ms, error);
    if (read_status != transport::ReadStatus::LINE) {
        connection->close();
        switch (read_status) {
            case transport::ReadStatus::TIMEOUT:
                return Status::error(ErrorCode::CONNECTION_FAILED,
                                     "No greeting from PHD2 within " +
                                         std::to_string(options_.connection_timeout_ms) + "ms");
            case transport::ReadStatus::CLOSED:
                return Status::error(ErrorCode::CONNECTION_FAILED, "Connection closed before greeting");
            default:
                return Status::error(ErrorCode::CONNECTION_FAILED, "Failed to read greeting: " + error);
        }
    }

    nlohmann::json message;
    if (!rpc::decode_message(greeting, message, error)) {
        connection->close();
        return Status::error(ErrorCode::CONNECTION_FAILED, "Invalid greeting: " + error);
    }

    auto tag = rpc::event_name(message);
    if (!tag || *tag != events::VersionEvent::kName) {
        LOG_WARN("[Session] Expected a Version greeting, got: " << greeting);
    }

    generation_ = correlator_.open(
        [connection](const std::string &line, int timeout_ms, std::string &write_error) {
            return connection->write_line(line, timeout_ms, write_error);
        },
        [this](uint64_t generation, const std::string &write_error) {
            Command command;
            command.type = CommandType::TRANSPORT_FAILED;
            command.generation = generation;
            command.reason = "Write failed: " + write_error;
            post(std::move(command));
        });
    connection_ = connection;

    set_state(ConnectionState::CONNECTED);
    LOG_INFO("[Session] Connected to PHD2 at " << connection->describe() << " (generation " << generation_ << ")");

    if (reconnecting) {
        events::ReconnectedEvent reconnected;
        reconnected.timestamp_ms = events::now_epoch_ms();
        emitter_.publish(reconnected);
    }

    // Greeting goes out before anything the reader sees
    dispatch(greeting);
    reader_ = std::thread(&ConnectionSupervisor::reader_loop, this, connection, generation_);

    return Status::success();
}

void ConnectionSupervisor::close_session() {
    if (connection_) {
        connection_->close();
    }
    if (reader_.joinable()) {
        reader_.join();
    }
    connection_.reset();
}

void ConnectionSupervisor::reconnect_tick() {
    next_attempt_at_.reset();

    if (state_.load() != ConnectionState::RECONNECTING) {
        return;
    }
    if (!reconnect_enabled_.load()) {
        end_reconnect("Auto-reconnect disabled");
        return;
    }

    reconnect_attempt_++;
    const auto &policy = options_.reconnect;
    LOG_INFO("[Session] Reconnection attempt " << reconnect_attempt_ << "/" << describe_max_retries(policy));

    events::ReconnectingEvent reconnecting;
    reconnecting.attempt = reconnect_attempt_;
    reconnecting.max_attempts = policy.max_retries;
    reconnecting.timestamp_ms = events::now_epoch_ms();
    emitter_.publish(reconnecting);

    Status status = open_session(true);
    if (status.ok()) {
        LOG_INFO("[Session] Reconnected after " << reconnect_attempt_ << " attempt(s)");
        reconnect_attempt_ = 0;
        return;
    }

    LOG_WARN("[Session] Reconnection attempt " << reconnect_attempt_ << " failed: " << status.message);

    if (policy.max_retries && reconnect_attempt_ >= *policy.max_retries) {
        end_reconnect("Max retries (" + std::to_string(*policy.max_retries) + ") exceeded");
        return;
    }

    next_attempt_at_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(policy.interval_ms);
}

void ConnectionSupervisor::end_reconnect(const std::string &reason) {
    next_attempt_at_.reset();
    reconnect_attempt_ = 0;
    set_state(ConnectionState::DISCONNECTED);
    clear_session_info();
    LOG_WARN("[Session] Reconnection stopped: " << reason);

    events::ReconnectFailedEvent failed;
    failed.reason = reason;
    failed.timestamp_ms = events::now_epoch_ms();
    emitter_.publish(failed);
}

void ConnectionSupervisor::reader_loop(std::shared_ptr<transport::IConnection> connection, uint64_t generation) {
    std::string line;
    std::string error;
    std::string reason;

    while (true) {
        auto status = connection->read_line(line, kReaderPollMs, error);
        if (status == transport::ReadStatus::LINE) {
            dispatch(line);
            continue;
        }
        if (status == transport::ReadStatus::TIMEOUT) {
            continue;
        }
        reason = status == transport::ReadStatus::CLOSED ? "Connection closed by remote" : "Read error: " + error;
        break;
    }

    if (!connection->is_open()) {
        // Closed by us; the worker already knows
        LOG_DEBUG("[Session] Reader for generation " << generation << " stopped");
        return;
    }

    Command command;
    command.type = CommandType::TRANSPORT_FAILED;
    command.generation = generation;
    command.reason = reason;
    post(std::move(command));
}

void ConnectionSupervisor::dispatch(const std::string &line) {
    nlohmann::json message;
    std::string error;
    if (!rpc::decode_message(line, message, error)) {
        LOG_WARN("[Session] Skipping malformed message: " << error);
        return;
    }

    const auto classification = classifier_.classify(message);
    switch (classification.kind) {
        case rpc::MessageKind::RESPONSE:
            if (!correlator_.resolve(*classification.id, message)) {
                LOG_WARN("[Session] Protocol anomaly: response id " << *classification.id
                                                                    << " resolved elsewhere before it arrived");
            }
            return;

        case rpc::MessageKind::EVENT: {
            if (classification.unknown_id) {
                LOG_WARN("[Session] Protocol anomaly: '" << classification.event << "' event carried unknown id "
                                                         << *classification.id);
            }

            events::Event event = events::parse_event(message);
            if (auto *version = std::get_if<events::VersionEvent>(&event)) {
                std::lock_guard<std::mutex> lock(info_mutex_);
                phd2_version_ = version->phd_version;
            } else if (auto *app_state = std::get_if<events::AppStateEvent>(&event)) {
                std::lock_guard<std::mutex> lock(info_mutex_);
                app_state_ = app_state->state;
            }

            LOG_DEBUG("[Session] Event: " << classification.event);
            emitter_.publish(std::move(event));
            return;
        }

        case rpc::MessageKind::ANOMALY:
            if (classification.id) {
                LOG_WARN("[Session] Protocol anomaly: dropping response for unknown id " << *classification.id
                                                                                         << " (late or foreign)");
            } else {
                LOG_WARN("[Session] Protocol anomaly: dropping untagged message: " << line);
            }
            return;
    }
}

void ConnectionSupervisor::set_state(ConnectionState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        LOG_DEBUG("[Session] State " << connection_state_to_string(previous) << " -> "
                                     << connection_state_to_string(state));
    }
}

void ConnectionSupervisor::clear_session_info() {
    std::lock_guard<std::mutex> lock(info_mutex_);
    phd2_version_.reset();
    app_state_.reset();
}

}  // namespace session
}  // namespace guidelink
