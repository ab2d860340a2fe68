#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "client_config.hpp"
#include "events/event_emitter.hpp"
#include "identity_store.hpp"
#include "network_monitor.hpp"
#include "pending_requests.hpp"
#include "reconnect_scheduler.hpp"
#include "rpc_session.hpp"
#include "transport/websocket.hpp"

namespace tether {
namespace session {

using InitializePayloadProvider = std::function<std::optional<rpc::Json>()>;

/**
 * @brief Owns the live RpcSession and keeps it alive across failures
 *
 * Responsibilities:
 * - connect/disconnect with a stored configuration
 * - reconnect with exponential backoff after failures and unsolicited
 *   disconnects, until max attempts or an explicit disconnect()
 * - network availability gating (tear down when offline, resume when online)
 * - on-demand health probes
 * - the optional initialize handshake, once per connection
 * - caller-visible session bookkeeping, cleared on every (re)connect
 *
 * Threading: public methods may be called from any thread, including
 * request completions. The blocking *_and_wait() calls and
 * verify_connection_health() must not be made from a completion, since they
 * wait on the thread delivering it. Socket handshakes, reconnect timers and
 * the destruction of retired sessions run on an internal worker thread.
 * Events from a retired session are ignored: every session callback is
 * checked against the current session before it touches state.
 */
class ClientManager : public SessionListener {
public:
    ClientManager(ManagerOptions options, std::shared_ptr<IKeyValueStore> store,
                  std::shared_ptr<transport::IWebSocketFactory> factory,
                  std::shared_ptr<NetworkMonitor> network = nullptr);
    ~ClientManager() override;

    ClientManager(const ClientManager &) = delete;
    ClientManager &operator=(const ClientManager &) = delete;

    // Starts connecting with config, replacing any current session.
    // The future resolves true once CONNECTED, false on failure, when
    // offline, or when superseded by another connect()/disconnect().
    std::future<bool> connect(const ClientConfig &config);
    bool connect_and_wait(const ClientConfig &config);

    // Stops auto-reconnect and tears the session down before returning.
    // Pending requests fail with DISCONNECTED.
    void disconnect();

    // Reconnects with the stored configuration unless the caller
    // disconnected, the network is down or a connect is in progress
    void resume_connection_if_needed();

    // Pings the live session (bounded by health_check_timeout_ms), tearing
    // down and reconnecting when it does not answer. Blocks for the probe.
    // Returns true if the connection answered.
    bool verify_connection_health();

    // Entry point for the reachability signal
    void handle_network_change(bool available);

    // Sends the initialize request once per connection. Concurrent callers
    // share the in-flight attempt.
    std::future<bool> initialize(std::optional<rpc::Json> payload = std::nullopt);
    bool initialize_and_wait(std::optional<rpc::Json> payload = std::nullopt);
    void set_initialization_payload_provider(InitializePayloadProvider provider);

    void send_request(const std::string &method, std::optional<rpc::Json> params, Completion completion);
    std::future<RequestResult> send_request(const std::string &method, std::optional<rpc::Json> params = std::nullopt);
    bool send_notification(const std::string &method, std::optional<rpc::Json> params, rpc::ClientError &error);
    bool respond(const rpc::MessageId &id, std::optional<rpc::Json> result, rpc::ClientError &error);
    bool respond_error(std::optional<rpc::MessageId> id, rpc::ErrorObject error_object, rpc::ClientError &error);

    // Session bookkeeping
    bool is_session_materialized(const std::string &session_id) const;
    void mark_session_materialized(const std::string &session_id);
    bool is_resuming_session(const std::string &session_id) const;
    void set_resuming_session(const std::string &session_id, bool resuming);
    void reset_session_state();

    transport::ConnectionState state() const;
    bool is_connecting() const;
    bool is_network_available() const;
    bool is_initialized() const;
    bool is_initializing() const;
    std::optional<rpc::ClientError> last_initialization_error() const;
    const std::string &client_id() const { return client_id_; }
    std::optional<int64_t> last_connected_at() const;
    int reconnect_attempts() const { return scheduler_.attempt_count(); }
    bool is_reconnect_scheduled() const { return scheduler_.is_scheduled(); }
    const ManagerOptions &options() const { return options_; }

    std::unique_ptr<events::Subscription> subscribe(const events::EventFilter &filter = events::EventFilter::all(),
                                                    size_t queue_size = 0, const std::string &name = "");

    // SessionListener
    void on_session_state(RpcSession &session, const transport::ConnectionState &state) override;
    void on_session_message(RpcSession &session, const rpc::Message &message) override;
    void on_session_error(RpcSession &session, const rpc::ClientError &error) override;
    void on_request_sending(RpcSession &session, const rpc::Request &request) override;

private:
    // Result of preparing a connect under the lock; carried out unlocked
    struct ConnectPlan {
        std::shared_ptr<RpcSession> retired;
        std::shared_ptr<RpcSession> session;
    };

    ConnectPlan prepare_connect_locked(const ClientConfig &config, bool reset_attempts);
    void execute_plan(ConnectPlan plan);
    void connect_session(const std::shared_ptr<RpcSession> &session);
    void retire_session(std::shared_ptr<RpcSession> session);

    void schedule_reconnect_locked();
    void fire_due_reconnect();
    void set_state_locked(const transport::ConnectionState &state);
    void resolve_connect_locked(bool success);
    void reset_initialization_locked();
    void resolve_initialization_locked(bool success);
    void reset_session_tracking_locked();
    void handle_initialize_result(const RpcSession *session, const RequestResult &result);
    void auto_initialize();
    bool is_current_locked(const RpcSession &session) const { return session_.get() == &session; }

    void post_locked(std::function<void()> task);
    void worker_loop();

    const ManagerOptions options_;
    const std::shared_ptr<IKeyValueStore> store_;
    const std::shared_ptr<transport::IWebSocketFactory> factory_;
    const std::shared_ptr<NetworkMonitor> network_;
    const std::shared_ptr<RequestIdSequence> ids_;
    std::string client_id_;
    std::optional<NetworkMonitor::ObserverId> observer_id_;

    events::EventEmitter emitter_;
    ReconnectScheduler scheduler_;

    mutable std::mutex mutex_;
    std::shared_ptr<RpcSession> session_;
    std::optional<ClientConfig> config_;
    transport::ConnectionState state_;
    bool is_connecting_ = false;
    bool network_available_ = true;
    bool network_reported_ = false;  // An observer callback has set network_available_
    bool should_auto_reconnect_ = false;
    bool user_disconnected_ = false;
    std::optional<int64_t> last_connected_at_;
    std::shared_ptr<std::promise<bool>> connect_promise_;

    bool initialized_ = false;
    bool initializing_ = false;
    std::optional<rpc::ClientError> last_initialization_error_;
    std::vector<std::shared_ptr<std::promise<bool>>> initialize_waiters_;
    InitializePayloadProvider payload_provider_;

    std::set<std::string> materialized_sessions_;
    std::set<std::string> resuming_sessions_;

    // Worker
    std::condition_variable worker_cv_;
    std::deque<std::function<void()>> tasks_;
    std::vector<std::shared_ptr<RpcSession>> retired_sessions_;  // Closed, awaiting release on the worker
    bool stopping_ = false;
    bool schedule_changed_ = false;
    std::thread worker_;
};

}  // namespace session
}  // namespace tether
