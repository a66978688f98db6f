#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "transport/i_connection.hpp"

namespace guidelink::tests {

using nlohmann::json;

inline std::string version_greeting(const std::string &version = "2.6.11") {
    json greeting = {{"Event", "Version"}, {"Timestamp", 1700000000.0}, {"Host", "fake"},  {"Inst", 1},
                     {"PHDVersion", version}, {"PHDSubver", ""},          {"MsgVersion", 1}, {"OverlapSupport", true}};
    return greeting.dump();
}

inline std::string result_reply(uint64_t id, const json &result) {
    return json{{"jsonrpc", "2.0"}, {"result", result}, {"id", id}}.dump();
}

inline std::string error_reply(uint64_t id, int code, const std::string &message) {
    return json{{"jsonrpc", "2.0"}, {"error", {{"code", code}, {"message", message}}}, {"id", id}}.dump();
}

/**
 * In-memory IConnection. Tests push inbound lines and inspect what was written.
 * An optional responder sees every written request and may push replies.
 */
class FakeConnection : public transport::IConnection {
public:
    using Responder = std::function<void(FakeConnection &, const json &request)>;

    bool write_line(const std::string &line, int timeout_ms, std::string &error) override {
        Responder responder;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            last_write_timeout_ms_ = timeout_ms;
            if (stall_writes_ && open_) {
                // Peer stopped reading: block like a full send buffer until the deadline or close
                ++stalled_writes_;
                auto unstalled = [this] { return !stall_writes_ || !open_; };
                bool released = true;
                if (timeout_ms < 0) {
                    cv_.wait(lock, unstalled);
                } else {
                    released = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), unstalled);
                }
                if (!released) {
                    error = "Write timed out";
                    return false;
                }
            }
            if (!open_) {
                error = "Connection closed";
                return false;
            }
            if (fail_writes_) {
                error = "Broken pipe";
                return false;
            }
            written_.push_back(line);
            responder = responder_;
        }
        cv_.notify_all();

        if (responder) {
            responder(*this, json::parse(line));
        }
        return true;
    }

    transport::ReadStatus read_line(std::string &line, int timeout_ms, std::string &error) override {
        std::unique_lock<std::mutex> lock(mutex_);
        auto ready = [this] { return !open_ || !inbound_.empty() || remote_closed_ || !read_error_.empty(); };
        if (timeout_ms < 0) {
            cv_.wait(lock, ready);
        } else {
            cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready);
        }

        if (!open_) {
            return transport::ReadStatus::CLOSED;
        }
        if (!inbound_.empty()) {
            line = inbound_.front();
            inbound_.pop_front();
            return transport::ReadStatus::LINE;
        }
        if (!read_error_.empty()) {
            error = read_error_;
            return transport::ReadStatus::FAILED;
        }
        if (remote_closed_) {
            return transport::ReadStatus::CLOSED;
        }
        return transport::ReadStatus::TIMEOUT;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
        }
        cv_.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    std::string describe() const override { return "fake:4400"; }

    // ---- test controls ----

    void push_line(const std::string &line) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.push_back(line);
        }
        cv_.notify_all();
    }

    // Peer hangs up: pending reads drain, then CLOSED
    void close_remote() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            remote_closed_ = true;
        }
        cv_.notify_all();
    }

    void fail_reads(const std::string &error) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            read_error_ = error;
        }
        cv_.notify_all();
    }

    void set_fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_writes_ = fail;
    }

    void set_stall_writes(bool stall) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stall_writes_ = stall;
        }
        cv_.notify_all();
    }

    int stalled_writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stalled_writes_;
    }

    int last_write_timeout_ms() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_write_timeout_ms_;
    }

    void set_responder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    std::vector<std::string> written() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_;
    }

    // Wait until at least `count` lines were written
    bool wait_for_writes(size_t count, int timeout_ms = 1000) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] { return written_.size() >= count; });
    }

    // Last written request, parsed
    json last_request() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return written_.empty() ? json() : json::parse(written_.back());
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbound_;
    std::vector<std::string> written_;
    Responder responder_;
    bool open_ = true;
    bool remote_closed_ = false;
    bool fail_writes_ = false;
    bool stall_writes_ = false;
    int stalled_writes_ = 0;
    int last_write_timeout_ms_ = -1;
    std::string read_error_;
};

/**
 * Hands out FakeConnections that greet like PHD2. Connection attempts can be
 * refused to drive the reconnect loop.
 */
class FakeConnectionFactory : public transport::IConnectionFactory {
public:
    std::shared_ptr<transport::IConnection> connect(const std::string &host, int port, int timeout_ms,
                                                    std::string &error) override {
        (void)host;
        (void)port;
        (void)timeout_ms;

        std::lock_guard<std::mutex> lock(mutex_);
        attempts_++;
        if (refuse_) {
            error = "Connection refused";
            return nullptr;
        }

        auto connection = std::make_shared<FakeConnection>();
        if (send_greeting_) {
            connection->push_line(greeting_);
        }
        if (responder_) {
            connection->set_responder(responder_);
        }
        connections_.push_back(connection);
        return connection;
    }

    bool can_connect(const std::string &host, int port, int timeout_ms) override {
        (void)host;
        (void)port;
        (void)timeout_ms;
        return reachable_.load();
    }

    void set_refuse(bool refuse) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_ = refuse;
    }

    void set_greeting(const std::string &greeting, bool send = true) {
        std::lock_guard<std::mutex> lock(mutex_);
        greeting_ = greeting;
        send_greeting_ = send;
    }

    void set_responder(FakeConnection::Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void set_reachable(bool reachable) { reachable_.store(reachable); }

    std::shared_ptr<FakeConnection> last_connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.empty() ? nullptr : connections_.back();
    }

    size_t connection_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_.size();
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }


private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<FakeConnection>> connections_;
    FakeConnection::Responder responder_;
    std::string greeting_ = version_greeting();
    bool send_greeting_ = true;
    bool refuse_ = false;
    int attempts_ = 0;
    std::atomic<bool> reachable_{false};
};

}  // namespace guidelink::tests
