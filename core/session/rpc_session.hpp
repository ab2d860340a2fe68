#pragma once

#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "pending_requests.hpp"
#include "rpc/errors.hpp"
#include "rpc/json_rpc.hpp"
#include "transport/connection.hpp"

namespace tether {
namespace session {

class RpcSession;

// Receives what an RpcSession does not consume itself. Matched responses
// never reach the listener; they complete their request instead.
class SessionListener {
public:
    virtual ~SessionListener() = default;

    virtual void on_session_state(RpcSession &session, const transport::ConnectionState &state) = 0;

    // Server-initiated requests and notifications
    virtual void on_session_message(RpcSession &session, const rpc::Message &message) = 0;

    // Decode failures, transport failures and unattributed error responses
    virtual void on_session_error(RpcSession &session, const rpc::ClientError &error) = 0;

    // Called just before an outbound request is written
    virtual void on_request_sending(RpcSession &session, const rpc::Request &request) {
        static_cast<void>(session);
        static_cast<void>(request);
    }
};

// RpcSession correlates outbound requests with inbound responses over one
// Connection. Every request completes exactly once: with its response, with
// the peer's error, or with DISCONNECTED when the connection goes away.
class RpcSession : public transport::ConnectionListener {
public:
    RpcSession(transport::ConnectionConfig config, std::shared_ptr<transport::IWebSocketFactory> factory,
               std::shared_ptr<RequestIdSequence> ids);
    ~RpcSession() override;

    RpcSession(const RpcSession &) = delete;
    RpcSession &operator=(const RpcSession &) = delete;

    // Must be set before connect(); the listener must outlive the session
    void set_listener(SessionListener *listener) { listener_.store(listener); }

    bool connect(rpc::ClientError &error);

    // Closes the connection and fails every pending request with DISCONNECTED
    void disconnect();

    // Completion runs on the receive thread for responses, on the calling
    // thread for immediate failures, and on whichever thread tears the
    // connection down for DISCONNECTED.
    void send_request(const std::string &method, std::optional<rpc::Json> params, Completion completion);
    std::future<RequestResult> send_request(const std::string &method, std::optional<rpc::Json> params = std::nullopt);

    bool send_notification(const std::string &method, std::optional<rpc::Json> params, rpc::ClientError &error);

    // Replies to a server-initiated request
    bool respond(const rpc::MessageId &id, std::optional<rpc::Json> result, rpc::ClientError &error);
    bool respond_error(std::optional<rpc::MessageId> id, rpc::ErrorObject error_object, rpc::ClientError &error);

    // Writes a message as-is, bypassing correlation
    bool send_message(const rpc::Message &message, rpc::ClientError &error);

    bool ping(int timeout_ms, rpc::ClientError &error);

    size_t pending_count() const { return pending_.size(); }
    transport::ConnectionState state() const { return connection_.state(); }

    // ConnectionListener
    void on_state_changed(const transport::ConnectionState &state) override;
    void on_message(const rpc::Message &message) override;
    void on_error(const rpc::ClientError &error) override;

private:
    void route_response(const rpc::Response &response);
    void route_error_response(const rpc::ErrorResponse &response);

    const std::shared_ptr<RequestIdSequence> ids_;
    std::atomic<SessionListener *> listener_{nullptr};

    // Guards accepting_ so that a request cannot be registered after the
    // terminal sweep has run
    mutable std::mutex mutex_;
    bool accepting_ = false;

    PendingRequestStore pending_;

    // Declared last: destroyed (and its threads joined) before the rest
    transport::Connection connection_;
};

}  // namespace session
}  // namespace tether
