#include "line_framer.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace guidelink {
namespace transport {

LineFramer::LineFramer(size_t max_line_size) : max_line_size_(max_line_size) {}

void LineFramer::append(const char *data, size_t len) {
    if (len == 0) {
        return;
    }
    buffer_.append(data, len);
}

bool LineFramer::next(std::string &line) {
    while (true) {
        const size_t pos = buffer_.find('\n', scan_pos_);

        if (pos == std::string::npos) {
            scan_pos_ = buffer_.size();

            if (!discarding_ && buffer_.size() > max_line_size_) {
                discarding_ = true;
                discarded_++;
                LOG_WARN("[Framer] Line exceeds " << max_line_size_ << " bytes, discarding until next terminator");
            }
            if (discarding_) {
                buffer_.clear();
                scan_pos_ = 0;
            }
            return false;
        }

        std::string raw = buffer_.substr(0, pos);
        buffer_.erase(0, pos + 1);
        scan_pos_ = 0;

        if (discarding_) {
            // Tail of an oversized line
            discarding_ = false;
            continue;
        }

        if (raw.size() > max_line_size_) {
            discarded_++;
            LOG_WARN("[Framer] Discarded oversized line (" << raw.size() << " bytes)");
            continue;
        }

        if (!raw.empty() && raw.back() == '\r') {
            raw.pop_back();
        }
        if (raw.empty()) {
            continue;
        }

        line = std::move(raw);
        return true;
    }
}

void LineFramer::reset() {
    buffer_.clear();
    scan_pos_ = 0;
    discarding_ = false;
}

}  // namespace transport
}  // namespace guidelink
