#pragma once

/**
 * @file event_emitter.hpp
 * @brief Fan-out of client events to independent subscriber queues
 *
 * The client manager emits from connection threads and its worker; each
 * subscriber (CLI loop, embedding application, tests) drains its own bounded
 * queue from its own thread. A full queue evicts its oldest event, so a
 * stalled consumer loses history but never stalls a connection.
 *
 * Events are numbered under the emitter lock and appended to every matching
 * queue before the lock is released: all queues agree on order.
 *
 * Subscriptions may outlive the emitter. Once the emitter is destroyed their
 * queues are closed and unsubscribe() becomes a no-op.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "event_types.hpp"

namespace tether {
namespace events {

// Bounded FIFO owned by one subscription
class EventQueue {
public:
    EventQueue(size_t capacity, std::string name);

    // Appends event, evicting the oldest entry when full. Never blocks.
    // Returns false if an entry was evicted.
    bool push(const Event &event);

    // Waits up to timeout_ms (0 = no wait). Returns nullopt on timeout, or
    // once the queue is closed and empty.
    std::optional<Event> pop(int timeout_ms);

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
 * @brief Selects which events reach a subscriber
 *
 * Default-constructed filter passes everything. method_prefix only applies
 * to events that carry a method (MessageEvent with a request or
 * notification, RequestSendingEvent); other events pass it.
 */
struct EventFilter {
    std::set<EventKind> kinds;  // Empty = all kinds
    std::string method_prefix;

    bool matches(const Event &event) const;

    static EventFilter all();
    static EventFilter only(std::set<EventKind> kinds);
};

struct SubscriberTable;

// Handle to one subscriber queue; unsubscribes on destruction
class Subscription {
public:
    using Id = uint64_t;

    Subscription(Id id, std::shared_ptr<EventQueue> queue, std::weak_ptr<SubscriberTable> table);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    // Blocks up to timeout_ms for the next event
    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop();

    Id id() const { return id_; }
    bool is_active() const;
    size_t queue_size() const;
    size_t dropped_count() const;

    // Detaches from the emitter and wakes a blocked pop(). Idempotent.
    void unsubscribe();

private:
    const Id id_;
    const std::shared_ptr<EventQueue> queue_;
    const std::weak_ptr<SubscriberTable> table_;
    std::atomic<bool> attached_{true};
};

class EventEmitter {
public:
    using SubscriptionId = Subscription::Id;

    /**
     * @param default_queue_size Capacity of queues created without an explicit size
     * @param max_subscribers Concurrent subscriber limit (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 256, size_t max_subscribers = 32);
    ~EventEmitter();

    EventEmitter(const EventEmitter &) = delete;
    EventEmitter &operator=(const EventEmitter &) = delete;

    /**
     * @brief Registers a subscriber
     *
     * @param queue_size Queue capacity (0 = default_queue_size)
     * @param name Label used in log lines
     * @return Subscription handle, or nullptr when the subscriber limit is reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    // Assigns event_id, stamps timestamp_ms when unset and queues the
    // event for every matching subscriber
    void emit(Event event);

    size_t subscriber_count() const;
    size_t max_subscribers() const { return max_subscribers_; }
    bool at_capacity() const;

private:
    const size_t default_queue_size_;
    const size_t max_subscribers_;
    const std::shared_ptr<SubscriberTable> table_;
};

}  // namespace events
}  // namespace tether
