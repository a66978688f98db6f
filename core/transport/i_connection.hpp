#pragma once

#include <memory>
#include <string>

namespace guidelink {
namespace transport {

enum class ReadStatus {
    LINE,     // One complete message was returned
    TIMEOUT,  // Nothing complete arrived within the timeout
    CLOSED,   // Remote closed the stream or close() was called
    FAILED    // Unrecoverable I/O failure
};

// A line-oriented, full-duplex stream to the guider application.
// One thread reads; any number of threads may write.
class IConnection {
public:
    virtual ~IConnection() = default;

    // Write one message followed by the line terminator. Concurrent writers never interleave.
    // Gives up after timeout_ms (negative = no limit); a timed-out write may have sent part
    // of the line, so the stream must be treated as broken.
    virtual bool write_line(const std::string &line, int timeout_ms, std::string &error) = 0;

    // Read the next complete line (terminator stripped, empty lines skipped).
    virtual ReadStatus read_line(std::string &line, int timeout_ms, std::string &error) = 0;

    // Close both directions. A blocked read_line returns CLOSED within one poll slice.
    virtual void close() = 0;

    virtual bool is_open() const = 0;

    virtual std::string describe() const = 0;
};

// Opens connections. Swapped for an in-memory fake in tests.
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    virtual std::shared_ptr<IConnection> connect(const std::string &host, int port, int timeout_ms,
                                                 std::string &error) = 0;

    // Probe whether something accepts connections on host:port
    virtual bool can_connect(const std::string &host, int port, int timeout_ms) = 0;
};

}  // namespace transport
}  // namespace guidelink
