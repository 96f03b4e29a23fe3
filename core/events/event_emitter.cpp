#include "event_emitter.hpp"

#include <chrono>
#include <exception>
#include <utility>

#include "logging/logger.hpp"

namespace kasa {
namespace events {

bool EventFilter::matches(const Event& event) const {
    if (!host.empty() && get_event_host(event) != host) {
        return false;
    }
    if (std::holds_alternative<DeviceDiscoveredEvent>(event)) {
        return discovered;
    }
    if (std::holds_alternative<DeviceUnsupportedEvent>(event)) {
        return unsupported;
    }
    return raw;
}

EventFilter EventFilter::all() { return EventFilter{}; }

EventFilter EventFilter::outcomes() {
    EventFilter filter;
    filter.raw = false;
    return filter;
}

// ============================================================================
// EventQueue
// ============================================================================

EventQueue::EventQueue(size_t capacity, std::string name) : capacity_(capacity), name_(std::move(name)) {}

bool EventQueue::push(const Event& event) {
    size_t dropped_total = 0;
    bool overflowed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return true;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            dropped_total = ++dropped_;
            overflowed = true;
        }
        events_.push_back(event);
    }
    cv_.notify_one();

    // First drop, then every 100th
    if (overflowed && dropped_total % 100 == 1) {
        LOG_WARN("[Events] Queue '" << name_ << "' full, " << dropped_total << " event(s) dropped so far");
    }
    return !overflowed;
}

std::optional<Event> EventQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !events_.empty() || closed_; });
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::vector<Event> EventQueue::drain(size_t max_events) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = events_.size();
    if (max_events > 0 && max_events < count) {
        count = max_events;
    }
    std::vector<Event> drained;
    drained.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        drained.push_back(std::move(events_.front()));
        events_.pop_front();
    }
    return drained;
}

size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

size_t EventQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ============================================================================
// Subscription
// ============================================================================

Subscription::Subscription(SubscriptionId id, std::shared_ptr<EventQueue> queue,
                           std::function<void(SubscriptionId)> release)
    : id_(id), queue_(std::move(queue)), release_(std::move(release)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription&& other) noexcept
    : id_(other.id_), queue_(std::move(other.queue_)), release_(std::move(other.release_)) {
    other.id_ = 0;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        unsubscribe();
        id_ = other.id_;
        queue_ = std::move(other.queue_);
        release_ = std::move(other.release_);
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

std::vector<Event> Subscription::drain(size_t max_events) {
    if (!queue_) {
        return {};
    }
    return queue_->drain(max_events);
}

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

size_t Subscription::dropped_count() const { return queue_ ? queue_->dropped_count() : 0; }

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    if (release_) {
        release_(id_);
    }
    id_ = 0;
    if (queue_) {
        queue_->close();
    }
}

// ============================================================================
// EventEmitter
// ============================================================================

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size), max_subscribers_(max_subscribers) {}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter& filter, size_t queue_size,
                                                      const std::string& name) {
    Consumer consumer;
    consumer.filter = filter;
    consumer.name = name;
    consumer.queue = std::make_shared<EventQueue>(queue_size > 0 ? queue_size : default_queue_size_, name);
    return add_consumer(std::move(consumer));
}

std::unique_ptr<Subscription> EventEmitter::listen(EventListener listener, const EventFilter& filter,
                                                   const std::string& name) {
    if (!listener) {
        LOG_WARN("[Events] Ignoring empty listener" << (name.empty() ? "" : " '" + name + "'"));
        return nullptr;
    }
    Consumer consumer;
    consumer.filter = filter;
    consumer.name = name;
    consumer.listener = std::make_shared<EventListener>(std::move(listener));
    return add_consumer(std::move(consumer));
}

std::unique_ptr<Subscription> EventEmitter::add_consumer(Consumer consumer) {
    SubscriptionId id = 0;
    size_t total = 0;
    std::shared_ptr<EventQueue> queue = consumer.queue;
    const std::string name = consumer.name;
    const char* kind = consumer.listener ? "listener" : "queue";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_subscribers_ > 0 && consumers_.size() >= max_subscribers_) {
            total = consumers_.size();
        } else {
            id = next_subscription_id_++;
            consumers_.emplace(id, std::move(consumer));
            total = consumers_.size();
        }
    }

    if (id == 0) {
        LOG_WARN("[Events] " << total << " consumers registered, rejecting " << kind
                             << (name.empty() ? "" : " '" + name + "'"));
        return nullptr;
    }

    LOG_DEBUG("[Events] " << kind << " " << id << (name.empty() ? "" : " (" + name + ")") << " registered, "
                          << total << " total");
    return std::make_unique<Subscription>(id, std::move(queue), [this](SubscriptionId sub_id) { release(sub_id); });
}

void EventEmitter::emit(Event event) {
    std::vector<std::shared_ptr<EventQueue>> queues;
    std::vector<std::pair<std::string, std::shared_ptr<EventListener>>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t id = next_event_id_++;
        std::visit([id](auto&& e) { e.event_id = id; }, event);

        for (const auto& entry : consumers_) {
            const Consumer& consumer = entry.second;
            if (!consumer.filter.matches(event)) {
                continue;
            }
            if (consumer.queue) {
                queues.push_back(consumer.queue);
            } else {
                listeners.emplace_back(consumer.name, consumer.listener);
            }
        }
    }

    for (const auto& queue : queues) {
        queue->push(event);
    }

    for (const auto& listener : listeners) {
        try {
            (*listener.second)(event);
        } catch (const std::exception& e) {
            ++listener_failures_;
            LOG_WARN("[Events] Listener" << (listener.first.empty() ? "" : " '" + listener.first + "'")
                                         << " failed on " << event_kind_name(event) << " event for "
                                         << get_event_host(event) << ": " << e.what());
        }
    }
}

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consumers_.size();
}

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_subscribers_ > 0 && consumers_.size() >= max_subscribers_;
}

void EventEmitter::release(SubscriptionId id) {
    size_t remaining = 0;
    bool found = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = consumers_.find(id);
        if (it != consumers_.end()) {
            if (it->second.queue) {
                it->second.queue->close();
            }
            consumers_.erase(it);
            found = true;
            remaining = consumers_.size();
        }
    }
    if (found) {
        LOG_DEBUG("[Events] Consumer " << id << " released, " << remaining << " remaining");
    }
}

}  // namespace events
}  // namespace kasa
