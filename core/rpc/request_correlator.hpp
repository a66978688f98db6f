#pragma once

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "call_result.hpp"

namespace guidelink {
namespace rpc {

/**
 * @brief Tracks outstanding calls and resolves each exactly once
 *
 * Every call owns a single-use promise held in the pending table. Whoever
 * removes the entry from the table (response, timeout, write failure or
 * fail_all) is the only party allowed to fulfil it.
 *
 * Lifecycle:
 * - open() starts a connection generation and installs the writer
 * - call() registers, writes outside the table lock, and waits
 * - fail_all() closes the generation and resolves every entry with CONNECTION_LOST
 *
 * Correlation ids increase for the lifetime of the correlator and are never
 * reused, so a response from an earlier generation cannot match a newer call.
 */
class RequestCorrelator {
public:
    // timeout_ms bounds the write; a write that misses it counts as a transport failure
    using WriteFn = std::function<bool(const std::string &line, int timeout_ms, std::string &error)>;
    using WriteFailureFn = std::function<void(uint64_t generation, const std::string &error)>;

    RequestCorrelator();
    ~RequestCorrelator();

    RequestCorrelator(const RequestCorrelator &) = delete;
    RequestCorrelator &operator=(const RequestCorrelator &) = delete;

    /**
     * @brief Start accepting calls for a new connection generation
     *
     * @param writer Writes one serialized call to the transport
     * @param on_write_failure Invoked (outside any lock) when a write fails
     * @return Generation number
     */
    uint64_t open(WriteFn writer, WriteFailureFn on_write_failure = nullptr);

    /**
     * @brief Stop accepting calls and fail every outstanding one
     *
     * @return Number of calls resolved with CONNECTION_LOST
     */
    size_t fail_all(const std::string &reason);

    /**
     * @brief Issue a call and block until it resolves or timeout_ms elapses
     *
     * timeout_ms covers sending as well as waiting: a write that is still
     * blocked at the deadline resolves the call with TIMEOUT.
     *
     * Returns NOT_CONNECTED without writing when no generation is open.
     */
    CallResult call(const std::string &method, const nlohmann::json &params, int timeout_ms);

    /**
     * @brief Resolve the call that owns id with the given response message
     *
     * @return false if no outstanding call owns id (late or foreign response)
     */
    bool resolve(uint64_t id, const nlohmann::json &message);

    bool is_outstanding(uint64_t id) const;
    size_t pending_count() const;
    bool is_accepting() const;
    uint64_t generation() const;

    // Next id that call() will allocate
    uint64_t peek_next_id() const { return next_id_.load(); }

private:
    struct PendingCall {
        std::string method;
        std::promise<CallResult> slot;
        uint64_t generation = 0;
    };

    std::optional<PendingCall> take(uint64_t id);

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, PendingCall> pending_;
    bool accepting_ = false;
    uint64_t generation_ = 0;
    WriteFn writer_;
    WriteFailureFn on_write_failure_;

    std::atomic<uint64_t> next_id_;
};

}  // namespace rpc
}  // namespace guidelink
