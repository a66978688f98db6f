#pragma once

#include <atomic>

namespace guidelink {
namespace runtime {

// Records SIGINT/SIGTERM so long-running commands (monitor) can exit cleanly
class SignalHandler {
public:
    static void install();

    static bool is_shutdown_requested();

    // Test hook
    static void reset();

private:
    static void handle_signal(int signal);
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace runtime
}  // namespace guidelink
