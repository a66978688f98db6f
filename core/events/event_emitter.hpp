#pragma once

/**
 * @file event_emitter.hpp
 * @brief Lossy fan-out of guider events to per-subscriber queues
 *
 * Architecture:
 * - The session reader and the session supervisor publish into one EventEmitter
 * - Each subscriber (CLI monitor, automation, UI bridge) owns a bounded queue
 * - Publishing never blocks: a full queue drops its oldest event and counts it
 *
 * Ordering:
 * - publish() calls are serialized, so every subscriber sees events in the
 *   order they were published
 * - No ordering is implied between different subscribers' consumption
 *
 * Subscriptions live across reconnects; there is no replay of past events.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "event_types.hpp"

namespace guidelink {
namespace events {

/**
 * @brief Bounded event queue owned by one subscriber
 */
class SubscriberQueue {
public:
    explicit SubscriberQueue(size_t max_size, const std::string &name = "");

    /**
     * @brief Append an event, dropping the oldest one if the queue is full
     *
     * @return false if an older event had to be dropped
     */
    bool push(const Event &event);

    /**
     * @brief Wait up to timeout_ms for the next event (0 = do not wait)
     */
    std::optional<Event> pop(int timeout_ms = 0);
    std::optional<Event> try_pop();

    size_t size() const;
    bool empty() const;
    size_t dropped_count() const;

    void close();
    bool is_closed() const;

private:
    const size_t max_size_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    size_t dropped_count_;
    bool closed_ = false;
};

/**
 * @brief Consumer handle; unsubscribes when destroyed
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                 std::function<void(SubscriptionId)> unsubscribe_fn);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    // Blocks the consumer only, never the publisher
    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop();

    SubscriptionId id() const;
    bool is_active() const;
    size_t queue_size() const;
    size_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
    std::function<void(SubscriptionId)> unsubscribe_fn_;
};

/**
 * @brief Restricts a subscription to named event types ("GuideStep", "ConnectionLost", ...)
 *
 * Empty filter = receive all events.
 */
struct EventFilter {
    std::vector<std::string> names;

    bool matches(const Event &event) const;

    static EventFilter all();
    static EventFilter only(std::vector<std::string> names);
};

/**
 * @brief Thread-safe publisher with fan-out to per-subscriber queues
 */
class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Default max events per subscriber queue
     * @param max_subscribers Maximum concurrent subscribers (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 0);

    // Closes every subscriber queue; outstanding Subscriptions stay safe to use and destroy
    ~EventEmitter();

    EventEmitter(const EventEmitter &) = delete;
    EventEmitter &operator=(const EventEmitter &) = delete;

    /**
     * @brief Subscribe to events published from now on
     *
     * @param filter Event filter (empty = all events)
     * @param queue_size Override default queue size (0 = use default)
     * @param name Debug name for logging
     * @return Subscription handle, or nullptr if max subscribers reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    /**
     * @brief Assign the next event_id and hand a copy to every matching subscriber
     */
    void publish(Event event);

    uint64_t next_event_id() const;
    size_t subscriber_count() const;
    size_t max_subscribers() const;
    bool at_capacity() const;

private:
    struct SubscriberInfo {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
        std::string name;
    };

    // Shared with Subscriptions through a weak_ptr so they may outlive the emitter
    struct Registry {
        mutable std::mutex mutex;
        std::unordered_map<SubscriptionId, SubscriberInfo> subscribers;
    };

    static void unsubscribe(Registry &registry, SubscriptionId id);

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    std::mutex publish_mutex_;  // Serializes publish() end to end
    std::shared_ptr<Registry> registry_;
    std::atomic<SubscriptionId> next_subscription_id_;
    std::atomic<uint64_t> next_event_id_;
};

}  // namespace events
}  // namespace guidelink
