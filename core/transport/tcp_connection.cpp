#include "tcp_connection.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace guidelink {
namespace transport {

namespace {

#ifdef _WIN32
constexpr TcpConnection::SocketHandle kInvalidSocket = static_cast<TcpConnection::SocketHandle>(INVALID_SOCKET);

int last_socket_error() { return WSAGetLastError(); }
bool is_interrupted(int err) { return err == WSAEINTR; }
bool would_block(int err) { return err == WSAEWOULDBLOCK; }
bool in_progress(int err) { return err == WSAEWOULDBLOCK || err == WSAEINPROGRESS; }
int poll_sockets(WSAPOLLFD *fds, ULONG n, int timeout_ms) { return WSAPoll(fds, n, timeout_ms); }
using PollFd = WSAPOLLFD;
void close_socket(TcpConnection::SocketHandle s) { closesocket(static_cast<SOCKET>(s)); }
std::string socket_error_string(int err) { return "WSA error " + std::to_string(err); }
#else
constexpr TcpConnection::SocketHandle kInvalidSocket = -1;

int last_socket_error() { return errno; }
bool is_interrupted(int err) { return err == EINTR; }
bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
bool in_progress(int err) { return err == EINPROGRESS; }
int poll_sockets(struct pollfd *fds, nfds_t n, int timeout_ms) { return poll(fds, n, timeout_ms); }
using PollFd = struct pollfd;
void close_socket(TcpConnection::SocketHandle s) { ::close(s); }
std::string socket_error_string(int err) { return std::string(strerror(err)); }
#endif

#ifdef MSG_NOSIGNAL
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

bool set_non_blocking(TcpConnection::SocketHandle s) {
#ifdef _WIN32
    u_long mode = 1;
    return ioctlsocket(static_cast<SOCKET>(s), FIONBIO, &mode) == 0;
#else
    int flags = fcntl(s, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(s, F_SETFL, flags | O_NONBLOCK) == 0;
#endif
}

int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// Connect one resolved address, honoring the deadline. Returns kInvalidSocket on failure.
TcpConnection::SocketHandle connect_address(const struct addrinfo *ai, std::chrono::steady_clock::time_point deadline,
                                            std::string &error) {
    auto s = static_cast<TcpConnection::SocketHandle>(socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (s == kInvalidSocket) {
        error = "socket() failed: " + socket_error_string(last_socket_error());
        return kInvalidSocket;
    }

#ifdef SO_NOSIGPIPE
    int one = 1;
    setsockopt(s, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif

    if (!set_non_blocking(s)) {
        error = "Failed to make socket non-blocking";
        close_socket(s);
        return kInvalidSocket;
    }

    int rc = ::connect(s, ai->ai_addr, static_cast<int>(ai->ai_addrlen));
    if (rc != 0) {
        int err = last_socket_error();
        if (!in_progress(err)) {
            error = "connect() failed: " + socket_error_string(err);
            close_socket(s);
            return kInvalidSocket;
        }

        while (true) {
            PollFd pfd{};
            pfd.fd = s;
            pfd.events = POLLOUT;
            int left = remaining_ms(deadline);
            if (left <= 0) {
                error = "Connection timed out";
                close_socket(s);
                return kInvalidSocket;
            }

            int result = poll_sockets(&pfd, 1, left);
            if (result < 0) {
                if (is_interrupted(last_socket_error())) {
                    continue;
                }
                error = "poll failed during connect: " + socket_error_string(last_socket_error());
                close_socket(s);
                return kInvalidSocket;
            }
            if (result == 0) {
                continue;
            }
            break;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(s, SOL_SOCKET, SO_ERROR, reinterpret_cast<char *>(&so_error), &len) != 0 || so_error != 0) {
            error = "connect() failed: " + socket_error_string(so_error);
            close_socket(s);
            return kInvalidSocket;
        }
    }

    int nodelay = 1;
    setsockopt(s, IPPROTO_TCP, TCP_NODELAY, reinterpret_cast<const char *>(&nodelay), sizeof(nodelay));
    return s;
}

}  // namespace

TcpConnection::TcpConnection(SocketHandle socket, const std::string &peer)
    : socket_(socket), peer_(peer), open_(socket != kInvalidSocket) {}

TcpConnection::~TcpConnection() {
    close();
    if (socket_ != kInvalidSocket) {
        close_socket(socket_);
        socket_ = kInvalidSocket;
    }
}

void TcpConnection::close() {
    bool was_open = open_.exchange(false);
    if (was_open && socket_ != kInvalidSocket) {
        // shutdown() wakes a reader blocked in poll; the descriptor is released in the destructor
#ifdef _WIN32
        shutdown(static_cast<SOCKET>(socket_), SD_BOTH);
#else
        shutdown(socket_, SHUT_RDWR);
#endif
        LOG_DEBUG("[Transport] Closed connection to " << peer_);
    }
}

bool TcpConnection::write_line(const std::string &line, int timeout_ms, std::string &error) {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    std::unique_lock<std::timed_mutex> lock(write_mutex_, std::defer_lock);
    if (timeout_ms < 0) {
        lock.lock();
    } else {
        deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        if (!lock.try_lock_until(*deadline)) {
            error = "Write timed out waiting for another writer";
            return false;
        }
    }

    if (!open_.load()) {
        error = "Connection is closed";
        return false;
    }

    std::string payload;
    payload.reserve(line.size() + 2);
    payload.append(line);
    payload.append("\r\n");

    if (!write_exact(payload.data(), payload.size(), deadline, error)) {
        return false;
    }
    return true;
}

bool TcpConnection::write_exact(const char *data, size_t len,
                                std::optional<std::chrono::steady_clock::time_point> deadline, std::string &error) {
    size_t total = 0;

    while (total < len) {
        if (!open_.load()) {
            error = "Connection is closed";
            return false;
        }

#ifdef _WIN32
        int w = send(static_cast<SOCKET>(socket_), data + total, static_cast<int>(len - total), kSendFlags);
#else
        ssize_t w = send(socket_, data + total, len - total, kSendFlags);
#endif
        if (w < 0) {
            int err = last_socket_error();
            if (is_interrupted(err)) {
                continue;
            }
            if (would_block(err)) {
                int slice = kPollSliceMs;
                if (deadline) {
                    int left = remaining_ms(*deadline);
                    if (left <= 0) {
                        error = "Write timed out after " + std::to_string(total) + " of " + std::to_string(len) +
                                " bytes";
                        return false;
                    }
                    slice = std::min(slice, left);
                }
                PollFd pfd{};
                pfd.fd = socket_;
                pfd.events = POLLOUT;
                poll_sockets(&pfd, 1, slice);
                continue;
            }
            error = "Write failed: " + socket_error_string(err);
            return false;
        }
        if (w == 0) {
            error = "Write returned 0 bytes";
            return false;
        }
        total += static_cast<size_t>(w);
    }

    return true;
}

ReadStatus TcpConnection::read_line(std::string &line, int timeout_ms, std::string &error) {
    if (framer_.next(line)) {
        return ReadStatus::LINE;
    }

    const bool unbounded = timeout_ms < 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(unbounded ? 0 : timeout_ms);
    char buf[4096];

    while (true) {
        if (!open_.load()) {
            return ReadStatus::CLOSED;
        }

        int slice = kPollSliceMs;
        if (!unbounded) {
            int left = remaining_ms(deadline);
            if (left <= 0) {
                return ReadStatus::TIMEOUT;
            }
            slice = std::min(slice, left);
        }

        PollFd pfd{};
        pfd.fd = socket_;
        pfd.events = POLLIN;
        int result = poll_sockets(&pfd, 1, slice);
        if (result < 0) {
            int err = last_socket_error();
            if (is_interrupted(err)) {
                continue;
            }
            if (!open_.load()) {
                return ReadStatus::CLOSED;
            }
            error = "poll failed: " + socket_error_string(err);
            return ReadStatus::FAILED;
        }
        if (result == 0) {
            continue;
        }

        if ((pfd.revents & POLLNVAL) != 0) {
            if (!open_.load()) {
                return ReadStatus::CLOSED;
            }
            error = "Invalid socket";
            return ReadStatus::FAILED;
        }

#ifdef _WIN32
        int n = recv(static_cast<SOCKET>(socket_), buf, static_cast<int>(sizeof(buf)), 0);
#else
        ssize_t n = recv(socket_, buf, sizeof(buf), 0);
#endif
        if (n > 0) {
            framer_.append(buf, static_cast<size_t>(n));
            if (framer_.next(line)) {
                return ReadStatus::LINE;
            }
            continue;
        }
        if (n == 0) {
            return ReadStatus::CLOSED;
        }

        int err = last_socket_error();
        if (is_interrupted(err) || would_block(err)) {
            continue;
        }
        if (!open_.load()) {
            return ReadStatus::CLOSED;
        }
        error = "Read error: " + socket_error_string(err);
        return ReadStatus::FAILED;
    }
}

TcpConnectionFactory::TcpConnectionFactory() {
#ifdef _WIN32
    WSADATA wsa_data;
    WSAStartup(MAKEWORD(2, 2), &wsa_data);
#endif
}

TcpConnectionFactory::~TcpConnectionFactory() {
#ifdef _WIN32
    WSACleanup();
#endif
}

std::shared_ptr<IConnection> TcpConnectionFactory::connect(const std::string &host, int port, int timeout_ms,
                                                           std::string &error) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    const std::string peer = host + ":" + std::to_string(port);

    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    struct addrinfo *results = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &results);
    if (rc != 0 || results == nullptr) {
        error = "Cannot resolve " + host + ": " + std::string(gai_strerror(rc));
        return nullptr;
    }

    TcpConnection::SocketHandle s = kInvalidSocket;
    for (struct addrinfo *ai = results; ai != nullptr; ai = ai->ai_next) {
        s = connect_address(ai, deadline, error);
        if (s != kInvalidSocket) {
            break;
        }
        if (remaining_ms(deadline) <= 0) {
            break;
        }
    }
    freeaddrinfo(results);

    if (s == kInvalidSocket) {
        error = "Failed to connect to " + peer + ": " + error;
        return nullptr;
    }

    LOG_DEBUG("[Transport] Connected to " << peer);
    return std::make_shared<TcpConnection>(s, peer);
}

bool TcpConnectionFactory::can_connect(const std::string &host, int port, int timeout_ms) {
    std::string error;
    auto connection = connect(host, port, timeout_ms, error);
    if (!connection) {
        return false;
    }
    connection->close();
    return true;
}

}  // namespace transport
}  // namespace guidelink
