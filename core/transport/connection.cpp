#include "connection.hpp"

#include <chrono>

#include "logging/logger.hpp"

namespace tether {
namespace transport {

namespace {

rpc::EncodeOptions make_encode_options(const ConnectionConfig &config) {
    rpc::EncodeOptions options;
    options.include_jsonrpc_header = config.include_jsonrpc_header;
    options.escape_forward_slashes = config.escape_forward_slashes;
    return options;
}

}  // namespace

Connection::Connection(ConnectionConfig config, std::shared_ptr<IWebSocketFactory> factory)
    : config_(std::move(config)), factory_(std::move(factory)), encode_options_(make_encode_options(config_)) {}

Connection::~Connection() {
    {
        std::lock_guard<std::recursive_mutex> callbacks(listener_mutex_);
        listener_ = nullptr;
    }
    disconnect();

    for (auto &thread : self_joined_) {
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else if (thread.joinable()) {
            thread.join();
        }
    }
}

bool Connection::connect(rpc::ClientError &error) {
    uint64_t connecting_transition = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.is(ConnectionState::Kind::DISCONNECTED)) {
            LOG_DEBUG("[Connection] connect() ignored in state " << state_to_string(state_.kind));
            return true;
        }
        state_ = ConnectionState::connecting();
        connecting_transition = ++transitions_;
    }

    // Loops of a socket the peer closed may still be winding down
    join_loops();
    notify_transition(connecting_transition, ConnectionState::connecting());

    Headers headers = authorization_headers();
    std::shared_ptr<IWebSocketConnection> socket = factory_ ? factory_->make_connection(config_.endpoint) : nullptr;

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.is(ConnectionState::Kind::CONNECTING)) {
            error = rpc::ClientError::disconnected("Connection cancelled");
            return false;
        }
        socket_ = socket;
        generation = generation_;
    }

    std::string socket_error;
    bool opened = false;
    if (socket) {
        opened = socket->connect(headers, socket_error);
    } else {
        socket_error = "No socket available for " + config_.endpoint;
    }

    std::lock_guard<std::recursive_mutex> callbacks(listener_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            // disconnect() ran while the handshake was in flight
            if (socket) {
                socket->close();
            }
            error = rpc::ClientError::disconnected("Connection cancelled");
            return false;
        }

        ++transitions_;
        if (opened) {
            state_ = ConnectionState::connected();
            extractor_.reset();
            receive_thread_ = std::thread(&Connection::receive_loop, this, socket, generation);
            if (config_.ping_interval_ms && *config_.ping_interval_ms > 0) {
                heartbeat_thread_ =
                    std::thread(&Connection::heartbeat_loop, this, socket, *config_.ping_interval_ms, generation);
            }
        } else {
            ++generation_;
            socket_.reset();
            error = rpc::ClientError::transport(socket_error);
            state_ = ConnectionState::failed(error);
        }
    }

    if (!opened) {
        if (socket) {
            socket->close();
        }
        LOG_ERROR("[Connection] Failed to connect to " << config_.endpoint << ": " << socket_error);
        notify_state(ConnectionState::failed(error));
        notify_error(error);
        return false;
    }

    LOG_INFO("[Connection] Connected to " << config_.endpoint);
    notify_state(ConnectionState::connected());
    return true;
}

void Connection::disconnect() {
    std::shared_ptr<IWebSocketConnection> socket;
    bool changed = false;
    uint64_t transition = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++generation_;
        socket = std::move(socket_);
        changed = !state_.is(ConnectionState::Kind::DISCONNECTED);
        if (changed) {
            state_ = ConnectionState::disconnected();
            transition = ++transitions_;
        }
    }
    stop_cv_.notify_all();

    if (socket) {
        socket->close();
    }
    join_loops();

    if (changed) {
        LOG_INFO("[Connection] Disconnected from " << config_.endpoint);
        notify_transition(transition, ConnectionState::disconnected());
    }
}

bool Connection::send(const rpc::Message &message, rpc::ClientError &error) {
    std::shared_ptr<IWebSocketConnection> socket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.is(ConnectionState::Kind::CONNECTED) || !socket_) {
            error = rpc::ClientError::disconnected();
            return false;
        }
        socket = socket_;
    }

    std::string text;
    std::string encode_error;
    if (!rpc::encode_message(message, encode_options_, text, encode_error)) {
        error = rpc::ClientError::encoding_failed(encode_error);
        LOG_ERROR("[Connection] " << encode_error);
        return false;
    }
    if (config_.append_newline) {
        text += "\n";
    }

    LOG_DEBUG("[Connection] Sending " << rpc::message_type_name(message) << ": " << text);

    std::string socket_error;
    if (!socket->send_text(text, socket_error)) {
        error = rpc::ClientError::transport(socket_error);
        LOG_WARN("[Connection] Send failed: " << socket_error);
        return false;
    }
    return true;
}

bool Connection::ping(int timeout_ms, rpc::ClientError &error) {
    std::shared_ptr<IWebSocketConnection> socket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!state_.is(ConnectionState::Kind::CONNECTED) || !socket_) {
            error = rpc::ClientError::disconnected();
            return false;
        }
        socket = socket_;
    }

    std::string socket_error;
    if (!socket->ping(timeout_ms, socket_error)) {
        if (socket_error == kPingTimedOut) {
            error = rpc::ClientError::timeout(socket_error);
        } else {
            error = rpc::ClientError::transport(socket_error);
        }
        return false;
    }
    return true;
}

ConnectionState Connection::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

Headers Connection::authorization_headers() const {
    Headers headers = config_.additional_headers;
    if (!config_.token_provider) {
        return headers;
    }

    std::string token;
    std::string error;
    bool ok = false;
    try {
        ok = config_.token_provider(token, error);
    } catch (const std::exception &e) {
        error = e.what();
    }

    if (!ok) {
        // Proceed with the static headers only
        LOG_ERROR("[Connection] Failed to load auth token: " << error);
        return headers;
    }

    headers["Authorization"] = "Bearer " + token;
    return headers;
}

void Connection::receive_loop(std::shared_ptr<IWebSocketConnection> socket, uint64_t generation) {
    while (true) {
        WebSocketEvent event;
        std::string error;
        if (!socket->receive(event, error)) {
            if (is_current(generation)) {
                LOG_ERROR("[Connection] Receive loop error: " << error);
                finish(generation, ConnectionState::failed(rpc::ClientError::transport(error)), true);
            }
            return;
        }

        if (!is_current(generation)) {
            return;
        }

        switch (event.type) {
            case WebSocketEventType::TEXT:
            case WebSocketEventType::BINARY:
                LOG_DEBUG("[Connection] Received " << event.data.size() << " bytes");
                handle_incoming(event.data);
                break;
            case WebSocketEventType::CLOSED:
                LOG_INFO("[Connection] Closed by peer (code=" << event.close_code << ", reason='" << event.close_reason
                                                              << "')");
                finish(generation, ConnectionState::disconnected(), false);
                return;
            case WebSocketEventType::CONNECTED:
                break;
        }
    }
}

void Connection::heartbeat_loop(std::shared_ptr<IWebSocketConnection> socket, int interval_ms,
                                uint64_t generation) {
    while (true) {
        std::string error;
        if (!socket->ping(interval_ms, error)) {
            if (is_current(generation)) {
                LOG_ERROR("[Connection] Ping failed: " << error);
                finish(generation, ConnectionState::failed(rpc::ClientError::transport("Ping failed: " + error)),
                       true);
            }
            return;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        if (stop_cv_.wait_for(lock, std::chrono::milliseconds(interval_ms),
                              [&] { return generation != generation_; })) {
            return;
        }
    }
}

void Connection::handle_incoming(const std::string &data) {
    for (auto &item : extractor_.feed(data)) {
        if (auto *message = std::get_if<rpc::Message>(&item)) {
            notify_message(*message);
        } else {
            const auto &failure = std::get<rpc::DecodeFailure>(item);
            notify_error(rpc::ClientError::decoding_failed(failure.error));
        }
    }
}

void Connection::finish(uint64_t generation, ConnectionState state, bool report_error) {
    std::shared_ptr<IWebSocketConnection> socket;
    uint64_t transition = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        ++generation_;
        socket = std::move(socket_);
        state_ = state;
        transition = ++transitions_;
    }
    stop_cv_.notify_all();

    if (socket) {
        socket->close();
    }

    std::lock_guard<std::recursive_mutex> callbacks(listener_mutex_);
    if (notify_transition(transition, state) && report_error && state.error) {
        notify_error(*state.error);
    }
}

bool Connection::is_current(uint64_t generation) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation == generation_;
}

void Connection::join_loops() {
    std::vector<std::thread> loops;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (receive_thread_.joinable()) {
            loops.push_back(std::move(receive_thread_));
        }
        if (heartbeat_thread_.joinable()) {
            loops.push_back(std::move(heartbeat_thread_));
        }
    }

    bool on_loop_thread = false;
    for (const auto &thread : loops) {
        on_loop_thread = on_loop_thread || thread.get_id() == std::this_thread::get_id();
    }

    if (on_loop_thread) {
        // Called from a listener callback, which holds listener_mutex_; the
        // other loop may be blocked on it, so neither is joined here
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &thread : loops) {
            self_joined_.push_back(std::move(thread));
        }
        return;
    }

    for (auto &thread : loops) {
        thread.join();
    }
}

bool Connection::notify_transition(uint64_t transition, const ConnectionState &state) {
    std::lock_guard<std::recursive_mutex> callbacks(listener_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (transition != transitions_) {
            LOG_DEBUG("[Connection] Dropping stale " << state_to_string(state.kind) << " notification");
            return false;
        }
    }
    notify_state(state);
    return true;
}

void Connection::notify_message(const rpc::Message &message) {
    std::lock_guard<std::recursive_mutex> callbacks(listener_mutex_);
    if (listener_) {
        listener_->on_message(message);
    }
}

void Connection::notify_error(const rpc::ClientError &error) {
    std::lock_guard<std::recursive_mutex> callbacks(listener_mutex_);
    if (listener_) {
        listener_->on_error(error);
    }
}

}  // namespace transport
}  // namespace tether
