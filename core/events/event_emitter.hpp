#pragma once

/**
 * @file event_emitter.hpp
 * @brief Fan-out of discovery outcomes to queues and listeners
 *
 * Discovery workers call emit() from their own threads. A consumer either
 * drains a bounded queue (subscribe) or receives each event inline on the
 * emitting thread (listen). A full queue drops its oldest event; a listener
 * that throws is logged and skipped, the other consumers still get the event.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_types.hpp"

namespace kasa {
namespace events {

using EventListener = std::function<void(const Event&)>;

/**
 * @brief Which events reach a consumer
 *
 * An empty host matches every host.
 */
struct EventFilter {
    std::string host;
    bool discovered = true;
    bool unsupported = true;
    bool raw = true;

    bool matches(const Event& event) const;

    static EventFilter all();
    static EventFilter outcomes();  // discovered + unsupported, no raw replies
};

/**
 * @brief Bounded FIFO behind one queue subscription
 */
class EventQueue {
public:
    EventQueue(size_t capacity, std::string name);

    // Returns false when the oldest event was dropped to make room
    bool push(const Event& event);

    // Waits up to timeout_ms (0 = no wait)
    std::optional<Event> pop(int timeout_ms);

    // Removes up to max_events (0 = everything queued)
    std::vector<Event> drain(size_t max_events);

    size_t size() const;
    size_t dropped_count() const;

    void close();
    bool is_closed() const;

private:
    const size_t capacity_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> events_;
    size_t dropped_ = 0;
    bool closed_ = false;
};

/**
 * @brief Registration handle; unregisters on destruction
 *
 * Listener subscriptions have no queue: pop() and drain() return nothing.
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<EventQueue> queue, std::function<void(SubscriptionId)> release);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop() { return pop(0); }
    std::vector<Event> drain(size_t max_events = 0);

    SubscriptionId id() const { return id_; }
    bool is_active() const { return id_ != 0; }
    bool has_queue() const { return queue_ != nullptr; }
    size_t queue_size() const;
    size_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<EventQueue> queue_;
    std::function<void(SubscriptionId)> release_;
};

class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    // max_subscribers 0 = unlimited; queues and listeners share the limit
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);

    // nullptr when max subscribers is reached
    std::unique_ptr<Subscription> subscribe(const EventFilter& filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string& name = "");

    // Listener runs on the emitting thread; nullptr when full or listener is empty
    std::unique_ptr<Subscription> listen(EventListener listener, const EventFilter& filter = EventFilter::all(),
                                         const std::string& name = "");

    // Stamps event_id and delivers to every matching consumer
    void emit(Event event);

    uint64_t next_event_id() const { return next_event_id_.load(); }
    uint64_t emitted_count() const { return next_event_id_.load() - 1; }
    size_t listener_failures() const { return listener_failures_.load(); }
    size_t subscriber_count() const;
    size_t max_subscribers() const { return max_subscribers_; }
    bool at_capacity() const;

private:
    struct Consumer {
        EventFilter filter;
        std::string name;
        std::shared_ptr<EventQueue> queue;           // queue subscription
        std::shared_ptr<EventListener> listener;     // listener subscription
    };

    std::unique_ptr<Subscription> add_consumer(Consumer consumer);
    void release(SubscriptionId id);

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Consumer> consumers_;
    SubscriptionId next_subscription_id_ = 1;
    std::atomic<uint64_t> next_event_id_{1};
    std::atomic<size_t> listener_failures_{0};
};

}  // namespace events
}  // namespace kasa
