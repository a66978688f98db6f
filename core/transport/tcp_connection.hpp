#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "i_connection.hpp"
#include "line_framer.hpp"

namespace guidelink {
namespace transport {

// TcpConnection wraps a connected, non-blocking stream socket.
// Reads poll in short slices so close() from another thread is observed promptly.
class TcpConnection : public IConnection {
public:
#ifdef _WIN32
    using SocketHandle = uintptr_t;  // SOCKET
#else
    using SocketHandle = int;
#endif

    static constexpr int kPollSliceMs = 100;

    TcpConnection(SocketHandle socket, const std::string &peer);
    ~TcpConnection() override;

    TcpConnection(const TcpConnection &) = delete;
    TcpConnection &operator=(const TcpConnection &) = delete;

    bool write_line(const std::string &line, int timeout_ms, std::string &error) override;
    ReadStatus read_line(std::string &line, int timeout_ms, std::string &error) override;
    void close() override;
    bool is_open() const override { return open_.load(); }
    std::string describe() const override { return peer_; }

private:
    bool write_exact(const char *data, size_t len, std::optional<std::chrono::steady_clock::time_point> deadline,
                     std::string &error);

    SocketHandle socket_;
    std::string peer_;
    std::atomic<bool> open_;

    std::timed_mutex write_mutex_;
    LineFramer framer_;  // Reader thread only
};

class TcpConnectionFactory : public IConnectionFactory {
public:
    TcpConnectionFactory();
    ~TcpConnectionFactory() override;

    std::shared_ptr<IConnection> connect(const std::string &host, int port, int timeout_ms,
                                         std::string &error) override;
    bool can_connect(const std::string &host, int port, int timeout_ms) override;
};

}  // namespace transport
}  // namespace guidelink
