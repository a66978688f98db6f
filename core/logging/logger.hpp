#pragma once

#include <atomic>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace guidelink {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    static void init(Level threshold);
    static void log(Level level, const char* file, int line, const std::string& message);
    static void set_level(Level level);
    static Level level();

    // Redirect output (nullptr restores stderr). The stream must outlive its use.
    static void set_sink(std::ostream* sink);

private:
    static std::atomic<Level> threshold_;
    static std::ostream* sink_;
    static std::mutex mutex_;
};

// Parse "debug"/"info"/"warn"/"error"/"none" (case-insensitive), INFO for anything else
Level string_to_level(const std::string& level_str);
const char* level_to_string(Level level);

} // namespace logging
} // namespace guidelink

#define GUIDELINK_LOG(lvl_, msg) \
    do { \
        if ((lvl_) >= guidelink::logging::Logger::level()) { \
            std::stringstream log_ss_; \
            log_ss_ << msg; \
            guidelink::logging::Logger::log(lvl_, __FILE__, __LINE__, log_ss_.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg) GUIDELINK_LOG(guidelink::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg)  GUIDELINK_LOG(guidelink::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg)  GUIDELINK_LOG(guidelink::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) GUIDELINK_LOG(guidelink::logging::Level::LVL_ERROR, msg)
