#include "event_emitter.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "logging/logger.hpp"

namespace guidelink {
namespace events {

SubscriberQueue::SubscriberQueue(size_t max_size, const std::string &name)
    : max_size_(std::max<size_t>(max_size, 1)), name_(name), dropped_count_(0) {}

bool SubscriberQueue::push(const Event &event) {
    bool should_log = false;
    bool overflowed = false;
    size_t dropped_total = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return true;
        }

        if (queue_.size() >= max_size_) {
            queue_.pop_front();
            dropped_count_++;
            dropped_total = dropped_count_;
            overflowed = true;

            // First drop, then every 100th
            should_log = (dropped_count_ % 100 == 1);
        }

        queue_.push_back(event);
    }

    cv_.notify_one();

    if (should_log) {
        LOG_WARN("[EventEmitter] Subscriber '" << name_ << "' is not keeping up, dropped " << dropped_total
                                                << " event(s) so far");
    }

    return !overflowed;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (timeout_ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !queue_.empty() || closed_; });
    }

    if (queue_.empty()) {
        return std::nullopt;
    }

    std::optional<Event> event(std::move(queue_.front()));
    queue_.pop_front();
    return event;
}

std::optional<Event> SubscriberQueue::try_pop() { return pop(0); }

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool SubscriberQueue::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

size_t SubscriberQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
}

void SubscriberQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool SubscriberQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                           std::function<void(SubscriptionId)> unsubscribe_fn)
    : id_(id), queue_(std::move(queue)), unsubscribe_fn_(std::move(unsubscribe_fn)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : id_(other.id_), queue_(std::move(other.queue_)), unsubscribe_fn_(std::move(other.unsubscribe_fn_)) {
    other.id_ = 0;
}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this != &other) {
        unsubscribe();
        id_ = other.id_;
        queue_ = std::move(other.queue_);
        unsubscribe_fn_ = std::move(other.unsubscribe_fn_);
        other.id_ = 0;
    }
    return *this;
}

std::optional<Event> Subscription::pop(int timeout_ms) {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->pop(timeout_ms);
}

std::optional<Event> Subscription::try_pop() {
    if (!queue_) {
        return std::nullopt;
    }
    return queue_->try_pop();
}

Subscription::SubscriptionId Subscription::id() const { return id_; }

bool Subscription::is_active() const { return queue_ != nullptr && !queue_->is_closed(); }

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

size_t Subscription::dropped_count() const { return queue_ ? queue_->dropped_count() : 0; }

void Subscription::unsubscribe() {
    if (id_ != 0 && unsubscribe_fn_) {
        unsubscribe_fn_(id_);
        id_ = 0;
    }
    if (queue_) {
        queue_->close();
    }
}

bool EventFilter::matches(const Event &event) const {
    if (names.empty()) {
        return true;
    }
    const std::string name = event_type_name(event);
    return std::find(names.begin(), names.end(), name) != names.end();
}

EventFilter EventFilter::all() { return EventFilter{}; }

EventFilter EventFilter::only(std::vector<std::string> names) {
    EventFilter filter;
    filter.names = std::move(names);
    return filter;
}

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size),
      max_subscribers_(max_subscribers),
      registry_(std::make_shared<Registry>()),
      next_subscription_id_(1),
      next_event_id_(1) {}

EventEmitter::~EventEmitter() {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    for (auto &entry : registry_->subscribers) {
        entry.second.queue->close();
    }
    registry_->subscribers.clear();
}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    SubscriptionId id = 0;
    size_t subscriber_count = 0;
    std::shared_ptr<SubscriberQueue> queue;

    {
        std::lock_guard<std::mutex> lock(registry_->mutex);
        auto &subscribers = registry_->subscribers;

        if (max_subscribers_ > 0 && subscribers.size() >= max_subscribers_) {
            subscriber_count = subscribers.size();
        } else {
            id = next_subscription_id_++;
            const auto actual_queue_size = queue_size > 0 ? queue_size : default_queue_size_;
            queue = std::make_shared<SubscriberQueue>(actual_queue_size, name);
            subscribers[id] = SubscriberInfo{queue, filter, name};
            subscriber_count = subscribers.size();
        }
    }

    if (!queue) {
        LOG_WARN("[EventEmitter] Max subscribers (" << subscriber_count << ") reached, rejecting subscription");
        return nullptr;
    }

    LOG_DEBUG("[EventEmitter] Subscription " << id << " created" << (name.empty() ? "" : " (" + name + ")")
                                             << ", total subscribers: " << subscriber_count);

    std::weak_ptr<Registry> registry = registry_;
    auto unsubscribe_fn = [registry](SubscriptionId sub_id) {
        if (auto live = registry.lock()) {
            unsubscribe(*live, sub_id);
        }
    };
    return std::make_unique<Subscription>(id, std::move(queue), std::move(unsubscribe_fn));
}

void EventEmitter::publish(Event event) {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);

    std::vector<std::shared_ptr<SubscriberQueue>> targets;
    {
        std::lock_guard<std::mutex> lock(registry_->mutex);

        const uint64_t id = next_event_id_++;
        std::visit([id](auto &&e) { e.event_id = id; }, event);

        targets.reserve(registry_->subscribers.size());
        for (auto &entry : registry_->subscribers) {
            if (entry.second.filter.matches(event)) {
                targets.push_back(entry.second.queue);
            }
        }
    }

    for (auto &queue : targets) {
        queue->push(event);
    }
}

uint64_t EventEmitter::next_event_id() const { return next_event_id_.load(); }

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return registry_->subscribers.size();
}

size_t EventEmitter::max_subscribers() const { return max_subscribers_; }

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    return max_subscribers_ > 0 && registry_->subscribers.size() >= max_subscribers_;
}

void EventEmitter::unsubscribe(Registry &registry, SubscriptionId id) {
    bool found = false;
    size_t remaining = 0;

    {
        std::lock_guard<std::mutex> lock(registry.mutex);
        auto it = registry.subscribers.find(id);
        if (it != registry.subscribers.end()) {
            it->second.queue->close();
            registry.subscribers.erase(it);
            found = true;
            remaining = registry.subscribers.size();
        }
    }

    if (found) {
        LOG_DEBUG("[EventEmitter] Subscription " << id << " removed, remaining: " << remaining);
    }
}

}  // namespace events
}  // namespace guidelink
