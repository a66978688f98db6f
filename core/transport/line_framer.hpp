#pragma once

#include <cstddef>
#include <string>

namespace guidelink {
namespace transport {

// LineFramer splits a raw byte stream into newline-terminated messages.
// Accepts both "\r\n" and "\n", skips empty lines, and discards any line
// longer than max_line_size up to its terminator.
class LineFramer {
public:
    static constexpr size_t kMaxLineSize = 1024 * 1024;  // 1 MiB

    explicit LineFramer(size_t max_line_size = kMaxLineSize);

    // Feed bytes as they arrive from the socket
    void append(const char *data, size_t len);

    // Extract the next complete line; false if none is buffered yet
    bool next(std::string &line);

    // Bytes buffered towards an incomplete line
    size_t buffered() const { return buffer_.size(); }

    // Number of oversized lines discarded so far
    size_t discarded_count() const { return discarded_; }

    void reset();

private:
    size_t max_line_size_;
    std::string buffer_;
    size_t scan_pos_ = 0;
    bool discarding_ = false;
    size_t discarded_ = 0;
};

}  // namespace transport
}  // namespace guidelink
