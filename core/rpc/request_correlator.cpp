#include "request_correlator.hpp"

#include <chrono>
#include <utility>

#include "json_rpc.hpp"
#include "logging/logger.hpp"

namespace guidelink {
namespace rpc {

namespace {

CallResult result_from_response(const nlohmann::json &message) {
    auto error_it = message.find("error");
    if (error_it != message.end() && !error_it->is_null()) {
        int code = 0;
        std::string text;
        if (error_it->is_object()) {
            auto code_it = error_it->find("code");
            if (code_it != error_it->end() && code_it->is_number_integer()) {
                code = code_it->get<int>();
            }
            auto msg_it = error_it->find("message");
            if (msg_it != error_it->end() && msg_it->is_string()) {
                text = msg_it->get<std::string>();
            }
        } else if (error_it->is_string()) {
            text = error_it->get<std::string>();
        } else {
            text = error_it->dump();
        }
        return CallResult::rpc_failure(code, text);
    }

    auto result_it = message.find("result");
    if (result_it == message.end()) {
        return CallResult::success(nullptr);
    }
    return CallResult::success(*result_it);
}

// Rounded up, so a writer that uses the whole budget returns at or after the deadline
int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::ceil<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

}  // namespace

RequestCorrelator::RequestCorrelator() : next_id_(1) {}

RequestCorrelator::~RequestCorrelator() { fail_all("Client shutting down"); }

uint64_t RequestCorrelator::open(WriteFn writer, WriteFailureFn on_write_failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    generation_++;
    accepting_ = true;
    writer_ = std::move(writer);
    on_write_failure_ = std::move(on_write_failure);
    return generation_;
}

size_t RequestCorrelator::fail_all(const std::string &reason) {
    std::unordered_map<uint64_t, PendingCall> drained;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
        writer_ = nullptr;
        on_write_failure_ = nullptr;
        drained.swap(pending_);
    }

    for (auto &[id, pending] : drained) {
        LOG_DEBUG("[Correlator] Failing '" << pending.method << "' (id=" << id << "): " << reason);
        pending.slot.set_value(CallResult::failure(ErrorCode::CONNECTION_LOST, reason));
    }

    if (!drained.empty()) {
        LOG_INFO("[Correlator] Resolved " << drained.size() << " pending call(s) with connection lost");
    }
    return drained.size();
}

CallResult RequestCorrelator::call(const std::string &method, const nlohmann::json &params, int timeout_ms) {
    const uint64_t id = next_id_.fetch_add(1, std::memory_order_relaxed);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    std::future<CallResult> future;
    WriteFn writer;
    WriteFailureFn on_write_failure;
    uint64_t generation = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_ || !writer_) {
            return CallResult::failure(ErrorCode::NOT_CONNECTED, "Not connected to guider");
        }

        PendingCall pending;
        pending.method = method;
        pending.generation = generation_;
        future = pending.slot.get_future();
        pending_.emplace(id, std::move(pending));

        writer = writer_;
        on_write_failure = on_write_failure_;
        generation = generation_;
    }

    const std::string line = encode_call(id, method, params);
    LOG_DEBUG("[Correlator] -> " << line);

    std::string write_error;
    if (!writer(line, remaining_ms(deadline), write_error)) {
        LOG_WARN("[Correlator] Write failed for '" << method << "' (id=" << id << "): " << write_error);

        auto pending = take(id);
        if (pending) {
            if (std::chrono::steady_clock::now() >= deadline) {
                pending->slot.set_value(CallResult::failure(
                    ErrorCode::TIMEOUT, "Request '" + method + "' timed out while sending: " + write_error));
            } else {
                pending->slot.set_value(
                    CallResult::failure(ErrorCode::CONNECTION_LOST, "Failed to send request: " + write_error));
            }
        }
        if (on_write_failure) {
            on_write_failure(generation, write_error);
        }
        return future.get();
    }

    if (future.wait_until(deadline) == std::future_status::ready) {
        return future.get();
    }

    auto pending = take(id);
    if (pending) {
        LOG_WARN("[Correlator] Request '" << method << "' (id=" << id << ") timed out after " << timeout_ms << "ms");
        pending->slot.set_value(CallResult::failure(ErrorCode::TIMEOUT, "Request '" + method + "' timed out"));
    }

    // Either our timeout result, or a resolution that won the race at the deadline
    return future.get();
}

bool RequestCorrelator::resolve(uint64_t id, const nlohmann::json &message) {
    auto pending = take(id);
    if (!pending) {
        return false;
    }

    pending->slot.set_value(result_from_response(message));
    return true;
}

std::optional<RequestCorrelator::PendingCall> RequestCorrelator::take(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return std::nullopt;
    }

    std::optional<PendingCall> pending(std::move(it->second));
    pending_.erase(it);
    return pending;
}

bool RequestCorrelator::is_outstanding(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RequestCorrelator::is_accepting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accepting_;
}

uint64_t RequestCorrelator::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

}  // namespace rpc
}  // namespace guidelink
