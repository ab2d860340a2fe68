#include "event_emitter.hpp"

#include <chrono>
#include <map>
#include <type_traits>
#include <utility>

#include "logging/logger.hpp"

namespace tether {
namespace events {

// State shared by an emitter and the subscriptions it handed out
struct SubscriberTable {
    struct Entry {
        std::shared_ptr<EventQueue> queue;
        EventFilter filter;
        std::string name;
    };

    std::mutex mutex;
    std::map<Subscription::Id, Entry> entries;
    Subscription::Id next_subscription_id = 1;
    uint64_t next_event_id = 1;
};

namespace {

std::string label(Subscription::Id id, const std::string &name) {
    return name.empty() ? std::to_string(id) : std::to_string(id) + " (" + name + ")";
}

}  // namespace

// ----------------------------------------------------------------------------
// EventQueue
// ----------------------------------------------------------------------------

EventQueue::EventQueue(size_t capacity, std::string name) : capacity_(capacity), name_(std::move(name)) {}

bool EventQueue::push(const Event &event) {
    bool evicted = false;
    size_t dropped_total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return true;
        }
        if (events_.size() >= capacity_) {
            events_.pop_front();
            ++dropped_;
            dropped_total = dropped_;
            evicted = true;
        }
        events_.push_back(event);
    }
    cv_.notify_one();

    // First eviction, then every 100th
    if (evicted && dropped_total % 100 == 1) {
        LOG_WARN("[EventEmitter] Queue '" << name_ << "' full, dropped " << dropped_total << " events so far");
    }
    return !evicted;
}

std::optional<Event> EventQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (timeout_ms > 0) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return closed_ || !events_.empty(); });
    }
    if (events_.empty()) {
        return std::nullopt;
    }
    Event event = std::move(events_.front());
    events_.pop_front();
    return event;
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

// ----------------------------------------------------------------------------
// EventFilter
// ----------------------------------------------------------------------------

bool EventFilter::matches(const Event &event) const {
    if (!kinds.empty() && kinds.count(event_kind(event)) == 0) {
        return false;
    }
    if (method_prefix.empty()) {
        return true;
    }

    return std::visit(
        [this](auto &&e) -> bool {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, MessageEvent>) {
                return rpc::message_method(e.message).rfind(method_prefix, 0) == 0;
            } else if constexpr (std::is_same_v<T, RequestSendingEvent>) {
                return e.request.method.rfind(method_prefix, 0) == 0;
            } else {
                return true;
            }
        },
        event);
}

EventFilter EventFilter::all() { return EventFilter{}; }

EventFilter EventFilter::only(std::set<EventKind> kinds) {
    EventFilter filter;
    filter.kinds = std::move(kinds);
    return filter;
}

// ----------------------------------------------------------------------------
// Subscription
// ----------------------------------------------------------------------------

Subscription::Subscription(Id id, std::shared_ptr<EventQueue> queue, std::weak_ptr<SubscriberTable> table)
    : id_(id), queue_(std::move(queue)), table_(std::move(table)) {}

Subscription::~Subscription() { unsubscribe(); }

std::optional<Event> Subscription::pop(int timeout_ms) { return queue_->pop(timeout_ms); }

std::optional<Event> Subscription::try_pop() { return queue_->pop(0); }

bool Subscription::is_active() const { return attached_.load() && !queue_->is_closed(); }

size_t Subscription::queue_size() const { return queue_->size(); }

size_t Subscription::dropped_count() const { return queue_->dropped_count(); }

void Subscription::unsubscribe() {
    if (!attached_.exchange(false)) {
        return;
    }

    size_t remaining = 0;
    if (auto table = table_.lock()) {
        std::lock_guard<std::mutex> lock(table->mutex);
        table->entries.erase(id_);
        remaining = table->entries.size();
    }
    queue_->close();

    LOG_DEBUG("[EventEmitter] Subscription " << id_ << " removed, remaining: " << remaining);
}

// ----------------------------------------------------------------------------
// EventEmitter
// ----------------------------------------------------------------------------

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size),
      max_subscribers_(max_subscribers),
      table_(std::make_shared<SubscriberTable>()) {}

EventEmitter::~EventEmitter() {
    std::lock_guard<std::mutex> lock(table_->mutex);
    for (auto &entry : table_->entries) {
        entry.second.queue->close();
    }
    table_->entries.clear();
}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    SubscriptionId id = 0;
    size_t total = 0;
    auto queue = std::make_shared<EventQueue>(queue_size > 0 ? queue_size : default_queue_size_, name);
    {
        std::lock_guard<std::mutex> lock(table_->mutex);
        if (max_subscribers_ > 0 && table_->entries.size() >= max_subscribers_) {
            total = table_->entries.size();
        } else {
            id = table_->next_subscription_id++;
            table_->entries[id] = SubscriberTable::Entry{queue, filter, name};
            total = table_->entries.size();
        }
    }

    if (id == 0) {
        LOG_WARN("[EventEmitter] Subscriber limit (" << total << ") reached, rejecting '" << name << "'");
        return nullptr;
    }

    LOG_DEBUG("[EventEmitter] Subscription " << label(id, name) << " created, total: " << total);
    return std::make_unique<Subscription>(id, std::move(queue), table_);
}

void EventEmitter::emit(Event event) {
    std::lock_guard<std::mutex> lock(table_->mutex);

    const uint64_t event_id = table_->next_event_id++;
    const int64_t now_ms = now_epoch_ms();
    std::visit(
        [event_id, now_ms](auto &&e) {
            e.event_id = event_id;
            if (e.timestamp_ms == 0) {
                e.timestamp_ms = now_ms;
            }
        },
        event);

    for (auto &entry : table_->entries) {
        if (entry.second.filter.matches(event)) {
            entry.second.queue->push(event);
        }
    }
}

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(table_->mutex);
    return table_->entries.size();
}

bool EventEmitter::at_capacity() const {
    std::lock_guard<std::mutex> lock(table_->mutex);
    return max_subscribers_ > 0 && table_->entries.size() >= max_subscribers_;
}

}  // namespace events
}  // namespace tether
