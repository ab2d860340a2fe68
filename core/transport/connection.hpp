#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "connection_config.hpp"
#include "connection_state.hpp"
#include "rpc/codec.hpp"
#include "rpc/errors.hpp"
#include "rpc/frame_extractor.hpp"
#include "rpc/json_rpc.hpp"
#include "websocket.hpp"

namespace tether {
namespace transport {

// Receives connection events. Calls arrive on the connection's receive or
// heartbeat thread (or the thread calling connect/disconnect), one at a time
// and in wire order.
class ConnectionListener {
public:
    virtual ~ConnectionListener() = default;

    virtual void on_state_changed(const ConnectionState &state) = 0;
    virtual void on_message(const rpc::Message &message) = 0;
    virtual void on_error(const rpc::ClientError &error) = 0;
};

// Connection owns one WebSocket and its background loops.
//
// States: DISCONNECTED -> CONNECTING -> CONNECTED. A socket error or failed
// heartbeat moves to FAILED; a close frame from the peer moves to
// DISCONNECTED. disconnect() always ends in DISCONNECTED.
//
// Threads: on entering CONNECTED a receive thread is started, plus a
// heartbeat thread when ping_interval_ms is set. Both are joined by
// disconnect() and by the destructor.
class Connection {
public:
    Connection(ConnectionConfig config, std::shared_ptr<IWebSocketFactory> factory);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Must be set before connect(); the listener must outlive the connection
    void set_listener(ConnectionListener *listener) { listener_ = listener; }

    // Opens the socket. No-op (returns true) unless DISCONNECTED.
    // Blocks until the handshake completes or fails.
    bool connect(rpc::ClientError &error);

    // Stops both loops, closes the socket and enters DISCONNECTED
    void disconnect();

    // Encodes and writes one message. Fails with DISCONNECTED without a socket.
    bool send(const rpc::Message &message, rpc::ClientError &error);

    // Transport-level ping bounded by timeout_ms
    bool ping(int timeout_ms, rpc::ClientError &error);

    ConnectionState state() const;
    const ConnectionConfig &config() const { return config_; }

private:
    Headers authorization_headers() const;

    void receive_loop(std::shared_ptr<IWebSocketConnection> socket, uint64_t generation);
    void heartbeat_loop(std::shared_ptr<IWebSocketConnection> socket, int interval_ms, uint64_t generation);
    void handle_incoming(const std::string &data);

    // Ends the current generation with the given terminal state; no-op if
    // the generation is already over
    void finish(uint64_t generation, ConnectionState state, bool report_error);

    bool is_current(uint64_t generation) const;
    void join_loops();

    // Notifies unless a later transition has already happened; listeners
    // never see an older state after a newer one
    bool notify_transition(uint64_t transition, const ConnectionState &state);
    void notify_state(const ConnectionState &state);
    void notify_message(const rpc::Message &message);
    void notify_error(const rpc::ClientError &error);

    const ConnectionConfig config_;
    const std::shared_ptr<IWebSocketFactory> factory_;
    const rpc::EncodeOptions encode_options_;
    ConnectionListener *listener_ = nullptr;

    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    ConnectionState state_;
    std::shared_ptr<IWebSocketConnection> socket_;
    uint64_t generation_ = 0;   // Bumped whenever the current socket is abandoned
    uint64_t transitions_ = 0;  // Bumped on every state_ change
    std::thread receive_thread_;
    std::thread heartbeat_thread_;
    std::vector<std::thread> self_joined_;  // Loops stopped from inside a callback; joined by the destructor

    // Only touched by the receive thread
    rpc::FrameExtractor extractor_;

    // Serializes listener callbacks across threads; recursive so a listener
    // may call back into send()/disconnect() paths that notify
    std::recursive_mutex listener_mutex_;
};

}  // namespace transport
}  // namespace tether
