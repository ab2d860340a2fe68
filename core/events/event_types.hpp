#pragma once

/**
 * @file event_types.hpp
 * @brief Events delivered by the client manager to its subscribers
 *
 * Every subscriber receives one ordered stream mixing state changes,
 * inbound messages, outbound-request notices, errors and network
 * availability, so no subscriber has to merge several callbacks.
 *
 * - Events are value types (cheap to copy, safe to hand across threads)
 * - event_id is assigned by the emitter and is monotonic per emitter
 * - Timestamps are epoch milliseconds
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

#include "rpc/errors.hpp"
#include "rpc/json_rpc.hpp"
#include "transport/connection_state.hpp"

namespace tether {
namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief Connection state changed
 *
 * Emitted on kind changes only; FAILED carries the error that caused it.
 */
struct StateChangedEvent {
    uint64_t event_id = 0;
    transport::ConnectionState state;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Server-initiated request or notification
 *
 * Responses to our own requests complete the request instead and are
 * never emitted.
 */
struct MessageEvent {
    uint64_t event_id = 0;
    rpc::Message message;
    int64_t timestamp_ms = 0;
};

// Outbound request about to be written
struct RequestSendingEvent {
    uint64_t event_id = 0;
    rpc::Request request;
    int64_t timestamp_ms = 0;
};

struct ErrorEvent {
    uint64_t event_id = 0;
    rpc::ClientError error;
    int64_t timestamp_ms = 0;
};

struct NetworkAvailabilityEvent {
    uint64_t event_id = 0;
    bool available = true;
    int64_t timestamp_ms = 0;
};

using Event = std::variant<StateChangedEvent, MessageEvent, RequestSendingEvent, ErrorEvent, NetworkAvailabilityEvent>;

enum class EventKind { STATE_CHANGED, MESSAGE, REQUEST_SENDING, CLIENT_ERROR, NETWORK_AVAILABILITY };

inline EventKind event_kind(const Event &event) { return static_cast<EventKind>(event.index()); }

inline const char *event_kind_to_string(EventKind kind) {
    switch (kind) {
        case EventKind::STATE_CHANGED:
            return "state";
        case EventKind::MESSAGE:
            return "message";
        case EventKind::REQUEST_SENDING:
            return "request_sending";
        case EventKind::CLIENT_ERROR:
            return "error";
        case EventKind::NETWORK_AVAILABILITY:
            return "network";
    }
    return "unknown";
}

/**
 * @brief Get event ID from any event type
 */
inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

/**
 * @brief Get timestamp from any event type
 */
inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

}  // namespace events
}  // namespace tether
