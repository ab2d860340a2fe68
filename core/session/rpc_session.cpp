#include "rpc_session.hpp"

#include <utility>

#include "logging/logger.hpp"

namespace tether {
namespace session {

using transport::ConnectionState;

RpcSession::RpcSession(transport::ConnectionConfig config, std::shared_ptr<transport::IWebSocketFactory> factory,
                       std::shared_ptr<RequestIdSequence> ids)
    : ids_(ids ? std::move(ids) : std::make_shared<RequestIdSequence>()),
      connection_(std::move(config), std::move(factory)) {
    connection_.set_listener(this);
}

RpcSession::~RpcSession() {
    listener_.store(nullptr);
    disconnect();
}

bool RpcSession::connect(rpc::ClientError &error) { return connection_.connect(error); }

void RpcSession::disconnect() {
    connection_.disconnect();

    // A session that never reached CONNECTED reports no terminal state, so
    // sweep here as well
    {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = false;
    }
    pending_.fail_all(rpc::ClientError::disconnected());
}

void RpcSession::send_request(const std::string &method, std::optional<rpc::Json> params, Completion completion) {
    rpc::Request request{ids_->next(), method, std::move(params)};

    bool registered = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accepting_) {
            registered = pending_.add(request.id, std::move(completion));
        }
    }

    // completion is left intact when it was not registered
    if (!registered) {
        if (completion) {
            completion(RequestResult::failure(rpc::ClientError::disconnected()));
        }
        return;
    }

    if (auto *listener = listener_.load()) {
        listener->on_request_sending(*this, request);
    }

    rpc::ClientError error;
    if (!connection_.send(request, error)) {
        // The terminal sweep may already have completed it
        if (auto pending = pending_.remove(request.id)) {
            LOG_WARN("[Session] Request " << request.id.to_string() << " (" << method
                                          << ") not sent: " << error.describe());
            if (*pending) {
                (*pending)(RequestResult::failure(std::move(error)));
            }
        }
    }
}

std::future<RequestResult> RpcSession::send_request(const std::string &method, std::optional<rpc::Json> params) {
    auto promise = std::make_shared<std::promise<RequestResult>>();
    auto future = promise->get_future();
    send_request(method, std::move(params), [promise](RequestResult result) { promise->set_value(std::move(result)); });
    return future;
}

bool RpcSession::send_notification(const std::string &method, std::optional<rpc::Json> params,
                                   rpc::ClientError &error) {
    return send_message(rpc::Notification{method, std::move(params)}, error);
}

bool RpcSession::respond(const rpc::MessageId &id, std::optional<rpc::Json> result, rpc::ClientError &error) {
    return send_message(rpc::Response{id, std::move(result)}, error);
}

bool RpcSession::respond_error(std::optional<rpc::MessageId> id, rpc::ErrorObject error_object,
                               rpc::ClientError &error) {
    return send_message(rpc::ErrorResponse{std::move(id), std::move(error_object)}, error);
}

bool RpcSession::send_message(const rpc::Message &message, rpc::ClientError &error) {
    return connection_.send(message, error);
}

bool RpcSession::ping(int timeout_ms, rpc::ClientError &error) { return connection_.ping(timeout_ms, error); }

void RpcSession::on_state_changed(const ConnectionState &state) {
    if (state.is(ConnectionState::Kind::CONNECTED)) {
        std::lock_guard<std::mutex> lock(mutex_);
        accepting_ = true;
    } else if (state.is(ConnectionState::Kind::FAILED) || state.is(ConnectionState::Kind::DISCONNECTED)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            accepting_ = false;
        }
        size_t failed = pending_.fail_all(rpc::ClientError::disconnected());
        if (failed > 0) {
            LOG_INFO("[Session] Connection " << describe_state(state) << ", failed " << failed
                                             << " pending request(s)");
        }
    }

    if (auto *listener = listener_.load()) {
        listener->on_session_state(*this, state);
    }
}

void RpcSession::on_message(const rpc::Message &message) {
    if (const auto *response = std::get_if<rpc::Response>(&message)) {
        route_response(*response);
        return;
    }
    if (const auto *error_response = std::get_if<rpc::ErrorResponse>(&message)) {
        route_error_response(*error_response);
        return;
    }

    if (auto *listener = listener_.load()) {
        listener->on_session_message(*this, message);
    }
}

void RpcSession::on_error(const rpc::ClientError &error) {
    if (auto *listener = listener_.load()) {
        listener->on_session_error(*this, error);
    }
}

void RpcSession::route_response(const rpc::Response &response) {
    if (!pending_.resolve(response.id, RequestResult::success(response))) {
        LOG_WARN("[Session] Dropping response for unknown request " << response.id.to_string());
    }
}

void RpcSession::route_error_response(const rpc::ErrorResponse &response) {
    if (!response.id) {
        LOG_WARN("[Session] Error response without id: " << response.error.message << " (code "
                                                         << response.error.code << ")");
        if (auto *listener = listener_.load()) {
            listener->on_session_error(*this, rpc::ClientError::rpc_error(response.error));
        }
        return;
    }

    if (!pending_.resolve(*response.id, RequestResult::failure(rpc::ClientError::rpc_error(response.error)))) {
        LOG_WARN("[Session] Dropping error response for unknown request " << response.id->to_string() << ": "
                                                                          << response.error.message);
    }
}

}  // namespace session
}  // namespace tether
