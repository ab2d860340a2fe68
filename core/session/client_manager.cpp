#include "client_manager.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <utility>

#include "logging/logger.hpp"

namespace tether {
namespace session {

using transport::ConnectionState;

namespace {

// Poll interval for retired sessions still referenced by another thread
constexpr int kRetiredSweepMs = 20;

// FAILED states with different error kinds count as distinct
bool same_state(const ConnectionState &a, const ConnectionState &b) {
    if (a.kind != b.kind || a.error.has_value() != b.error.has_value()) {
        return false;
    }
    return !a.error || a.error->kind == b.error->kind;
}

bool is_already_initialized(const rpc::ClientError &error) {
    if (error.kind != rpc::ErrorKind::RPC) {
        return false;
    }
    std::string message = error.rpc ? error.rpc->message : error.message;
    std::transform(message.begin(), message.end(), message.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return message.find("already initialized") != std::string::npos;
}

int64_t now_epoch_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

ClientManager::ClientManager(ManagerOptions options, std::shared_ptr<IKeyValueStore> store,
                             std::shared_ptr<transport::IWebSocketFactory> factory,
                             std::shared_ptr<NetworkMonitor> network)
    : options_(std::move(options)),
      store_(store ? std::move(store) : std::make_shared<MemoryKeyValueStore>()),
      factory_(std::move(factory)),
      network_(std::move(network)),
      ids_(std::make_shared<RequestIdSequence>()),
      emitter_(options_.event_queue_size),
      scheduler_(options_.reconnect) {
    client_id_ = resolve_client_id(*store_, options_.client_id);
    last_connected_at_ = load_last_connected_at(*store_);

    worker_ = std::thread(&ClientManager::worker_loop, this);

    // Observe before sampling so a change in between is not lost
    bool available = true;
    if (network_) {
        observer_id_ = network_->add_observer([this](bool now_available) { handle_network_change(now_available); });
        available = network_->is_available();
        std::lock_guard<std::mutex> lock(mutex_);
        if (!network_reported_) {
            network_available_ = available;
        }
        available = network_available_;
    }

    LOG_INFO("[Manager] Client id " << client_id_ << ", network " << (available ? "available" : "unavailable"));
}

ClientManager::~ClientManager() {
    if (network_ && observer_id_) {
        network_->remove_observer(*observer_id_);
    }

    std::shared_ptr<RpcSession> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        should_auto_reconnect_ = false;
        retired = std::move(session_);
        session_.reset();
        resolve_connect_locked(false);
        reset_initialization_locked();
    }
    worker_cv_.notify_all();

    // Unblocks a handshake in progress on the worker
    if (retired) {
        retired->disconnect();
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    std::deque<std::function<void()>> leftover;
    std::vector<std::shared_ptr<RpcSession>> retired_sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftover.swap(tasks_);
        retired_sessions.swap(retired_sessions_);
    }
    leftover.clear();
    retired_sessions.clear();
}

// ----------------------------------------------------------------------------
// Connection lifecycle
// ----------------------------------------------------------------------------

std::future<bool> ClientManager::connect(const ClientConfig &config) {
    auto promise = std::make_shared<std::promise<bool>>();
    auto future = promise->get_future();

    ConnectPlan plan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resolve_connect_locked(false);
        connect_promise_ = promise;
        plan = prepare_connect_locked(config, true);
    }

    execute_plan(std::move(plan));
    return future;
}

bool ClientManager::connect_and_wait(const ClientConfig &config) { return connect(config).get(); }

void ClientManager::disconnect() {
    std::shared_ptr<RpcSession> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        should_auto_reconnect_ = false;
        user_disconnected_ = true;
        scheduler_.reset();
        schedule_changed_ = true;
        reset_initialization_locked();
        reset_session_tracking_locked();

        retired = std::move(session_);
        session_.reset();
        is_connecting_ = false;
        set_state_locked(ConnectionState::disconnected());
        resolve_connect_locked(false);
    }
    worker_cv_.notify_all();

    LOG_INFO("[Manager] Disconnected by caller");
    retire_session(std::move(retired));
}

void ClientManager::resume_connection_if_needed() {
    ConnectPlan plan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (user_disconnected_ || !network_available_ || !config_) {
            return;
        }

        should_auto_reconnect_ = true;
        scheduler_.reset();
        schedule_changed_ = true;

        if (is_connecting_ || state_.is(ConnectionState::Kind::CONNECTED)) {
            return;
        }

        LOG_INFO("[Manager] Resuming connection to " << config_->endpoint);
        ClientConfig config = *config_;
        plan = prepare_connect_locked(config, true);
    }

    execute_plan(std::move(plan));
}

ClientManager::ConnectPlan ClientManager::prepare_connect_locked(const ClientConfig &config, bool reset_attempts) {
    reset_initialization_locked();
    reset_session_tracking_locked();

    config_ = config;
    should_auto_reconnect_ = true;
    user_disconnected_ = false;

    if (reset_attempts) {
        scheduler_.reset();
    } else {
        scheduler_.cancel();
    }
    schedule_changed_ = true;
    worker_cv_.notify_all();

    ConnectPlan plan;
    plan.retired = std::move(session_);
    session_.reset();

    if (!network_available_) {
        LOG_WARN("[Manager] Network offline; waiting to reconnect");
        is_connecting_ = false;
        set_state_locked(ConnectionState::failed(rpc::ClientError::network_offline()));
        resolve_connect_locked(false);
        return plan;
    }

    auto session = std::make_shared<RpcSession>(build_connection_config(config, client_id_), factory_, ids_);
    session->set_listener(this);
    session_ = session;
    is_connecting_ = true;
    plan.session = std::move(session);
    return plan;
}

void ClientManager::execute_plan(ConnectPlan plan) {
    retire_session(std::move(plan.retired));

    if (plan.session) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto session = std::move(plan.session);
        post_locked([this, session] { connect_session(session); });
    }
}

void ClientManager::retire_session(std::shared_ptr<RpcSession> session) {
    if (!session) {
        return;
    }
    session->disconnect();

    // The caller may be running on one of the session's own threads (a
    // request completion, a listener callback). The worker destroys the
    // session once it holds the only reference.
    std::lock_guard<std::mutex> lock(mutex_);
    retired_sessions_.push_back(std::move(session));
    worker_cv_.notify_all();
}

void ClientManager::connect_session(const std::shared_ptr<RpcSession> &session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ || session_ != session) {
            return;
        }
    }

    rpc::ClientError error;
    if (session->connect(error)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    // A failure reported through on_session_state has already cleared
    // is_connecting_; only an unreported one is handled here
    if (session_ != session || !is_connecting_) {
        return;
    }

    LOG_ERROR("[Manager] Connect error: " << error.describe());
    is_connecting_ = false;
    set_state_locked(ConnectionState::failed(error));
    emitter_.emit(events::ErrorEvent{0, error, 0});
    reset_initialization_locked();
    reset_session_tracking_locked();
    resolve_connect_locked(false);
    schedule_reconnect_locked();
}

// ----------------------------------------------------------------------------
// Reconnect
// ----------------------------------------------------------------------------

void ClientManager::schedule_reconnect_locked() {
    if (!should_auto_reconnect_) {
        return;
    }

    if (!network_available_) {
        scheduler_.cancel();
        return;
    }

    if (scheduler_.is_exhausted()) {
        should_auto_reconnect_ = false;
        LOG_WARN("[Manager] Reached maximum reconnect attempts (" << options_.reconnect.max_attempts
                                                                   << "); stopping auto-retry");
        return;
    }

    if (is_connecting_ || state_.is(ConnectionState::Kind::CONNECTED)) {
        return;
    }

    if (!config_) {
        return;
    }

    if (scheduler_.schedule_next()) {
        schedule_changed_ = true;
        worker_cv_.notify_all();
    }
}

void ClientManager::fire_due_reconnect() {
    ConnectPlan plan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!scheduler_.take_due()) {
            return;
        }

        // The connection may have recovered through another path while the
        // timer was pending
        if (!should_auto_reconnect_ || !network_available_ || !config_ || is_connecting_ ||
            state_.is(ConnectionState::Kind::CONNECTED)) {
            LOG_DEBUG("[Manager] Skipping stale reconnect");
            return;
        }

        LOG_INFO("[Manager] Reconnecting (attempt " << scheduler_.attempt_count() << "/"
                                                    << options_.reconnect.max_attempts << ")");
        ClientConfig config = *config_;
        plan = prepare_connect_locked(config, false);
    }

    execute_plan(std::move(plan));
}

void ClientManager::post_locked(std::function<void()> task) {
    tasks_.push_back(std::move(task));
    worker_cv_.notify_all();
}

void ClientManager::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (!tasks_.empty()) {
            auto task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            task();
            // A task may hold the last reference to a retired session, whose
            // teardown calls back into the manager
            task = nullptr;
            lock.lock();
            continue;
        }

        std::vector<std::shared_ptr<RpcSession>> released;
        for (auto it = retired_sessions_.begin(); it != retired_sessions_.end();) {
            if (it->use_count() == 1) {
                released.push_back(std::move(*it));
                it = retired_sessions_.erase(it);
            } else {
                ++it;
            }
        }
        if (!released.empty()) {
            lock.unlock();
            released.clear();
            lock.lock();
            continue;
        }

        schedule_changed_ = false;
        auto wake = [this] { return stopping_ || !tasks_.empty() || schedule_changed_; };
        auto deadline = scheduler_.next_attempt_time();
        if (!retired_sessions_.empty()) {
            // Still referenced elsewhere; look again shortly
            auto sweep = std::chrono::steady_clock::now() + std::chrono::milliseconds(kRetiredSweepMs);
            if (!deadline || sweep < *deadline) {
                worker_cv_.wait_until(lock, sweep, wake);
                continue;
            }
        }
        if (!deadline) {
            worker_cv_.wait(lock, wake);
            continue;
        }

        if (!worker_cv_.wait_until(lock, *deadline, wake)) {
            lock.unlock();
            fire_due_reconnect();
            lock.lock();
        }
    }
}

// ----------------------------------------------------------------------------
// Network and health
// ----------------------------------------------------------------------------

void ClientManager::handle_network_change(bool available) {
    std::shared_ptr<RpcSession> retired;
    bool resume = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        network_reported_ = true;
        if (available == network_available_) {
            return;
        }
        network_available_ = available;
        emitter_.emit(events::NetworkAvailabilityEvent{0, available, 0});

        scheduler_.cancel();
        schedule_changed_ = true;

        if (available) {
            LOG_INFO("[Manager] Network reachable, resuming connection");
            resume = should_auto_reconnect_;
        } else {
            LOG_WARN("[Manager] Network appears to be offline");
            is_connecting_ = false;
            scheduler_.reset();
            retired = std::move(session_);
            session_.reset();
            reset_initialization_locked();
            reset_session_tracking_locked();
            resolve_connect_locked(false);
            if (!state_.is(ConnectionState::Kind::DISCONNECTED)) {
                set_state_locked(ConnectionState::failed(rpc::ClientError::network_offline()));
            }
        }
    }
    worker_cv_.notify_all();

    retire_session(std::move(retired));
    if (resume) {
        resume_connection_if_needed();
    }
}

bool ClientManager::verify_connection_health() {
    std::shared_ptr<RpcSession> session;
    ConnectPlan plan;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!should_auto_reconnect_ || !network_available_ || is_connecting_ || !config_) {
            return state_.is(ConnectionState::Kind::CONNECTED);
        }

        session = session_;
        if (!session) {
            LOG_INFO("[Manager] Health check found no session, reconnecting");
            set_state_locked(ConnectionState::disconnected());
            ClientConfig config = *config_;
            plan = prepare_connect_locked(config, false);
        }
    }

    if (!session) {
        execute_plan(std::move(plan));
        return false;
    }

    rpc::ClientError error;
    if (session->ping(options_.health_check_timeout_ms, error)) {
        LOG_DEBUG("[Manager] Health check passed");
        return true;
    }

    LOG_WARN("[Manager] Health check failed: " << error.describe());
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (session_ != session) {
            // Superseded while the probe was in flight
            lock.unlock();
            retire_session(std::move(session));
            return false;
        }
        if (!config_) {
            return false;
        }

        session_.reset();
        is_connecting_ = false;
        set_state_locked(ConnectionState::disconnected());
        ClientConfig config = *config_;
        plan = prepare_connect_locked(config, false);
        plan.retired = std::move(session);
    }

    execute_plan(std::move(plan));
    return false;
}

// ----------------------------------------------------------------------------
// Initialization
// ----------------------------------------------------------------------------

std::future<bool> ClientManager::initialize(std::optional<rpc::Json> payload) {
    auto waiter = std::make_shared<std::promise<bool>>();
    auto future = waiter->get_future();

    std::shared_ptr<RpcSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (initialized_) {
            waiter->set_value(true);
            return future;
        }
        if (!session_ || !state_.is(ConnectionState::Kind::CONNECTED)) {
            LOG_WARN("[Manager] Initialize requested while not connected");
            waiter->set_value(false);
            return future;
        }

        initialize_waiters_.push_back(waiter);
        if (initializing_) {
            return future;
        }

        initializing_ = true;
        last_initialization_error_.reset();
        session = session_;
    }

    const RpcSession *target = session.get();
    session->send_request(options_.initialize_method, std::move(payload),
                          [this, target](RequestResult result) { handle_initialize_result(target, result); });
    return future;
}

bool ClientManager::initialize_and_wait(std::optional<rpc::Json> payload) {
    return initialize(std::move(payload)).get();
}

void ClientManager::set_initialization_payload_provider(InitializePayloadProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    payload_provider_ = std::move(provider);
}

void ClientManager::handle_initialize_result(const RpcSession *session, const RequestResult &result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session != session_.get() || !initializing_) {
        return;
    }
    initializing_ = false;

    bool success = false;
    if (result.ok()) {
        success = result.response->result.has_value();
        if (!success) {
            LOG_WARN("[Manager] Initialize failed: empty result");
            last_initialization_error_ = rpc::ClientError::decoding_failed("Initialize returned an empty result");
        }
    } else if (is_already_initialized(*result.error)) {
        LOG_INFO("[Manager] Initialize skipped: already initialized");
        success = true;
    } else {
        LOG_WARN("[Manager] Initialize error: " << result.error->describe());
        last_initialization_error_ = result.error;
    }

    initialized_ = success;
    if (success) {
        last_initialization_error_.reset();
    }
    resolve_initialization_locked(success);
}

void ClientManager::auto_initialize() {
    InitializePayloadProvider provider;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!options_.auto_initialize || initialized_ || initializing_) {
            return;
        }
        provider = payload_provider_;
    }

    std::optional<rpc::Json> payload;
    if (provider) {
        payload = provider();
    }
    if (!payload) {
        LOG_INFO("[Manager] Auto-initialize skipped: missing payload provider");
        return;
    }

    initialize(std::move(payload));
}

void ClientManager::reset_initialization_locked() {
    initialized_ = false;
    initializing_ = false;
    last_initialization_error_.reset();
    resolve_initialization_locked(false);
}

void ClientManager::resolve_initialization_locked(bool success) {
    for (auto &waiter : initialize_waiters_) {
        waiter->set_value(success);
    }
    initialize_waiters_.clear();
}

// ----------------------------------------------------------------------------
// Requests
// ----------------------------------------------------------------------------

void ClientManager::send_request(const std::string &method, std::optional<rpc::Json> params, Completion completion) {
    std::shared_ptr<RpcSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
    }

    if (!session) {
        if (completion) {
            completion(RequestResult::failure(rpc::ClientError::disconnected()));
        }
        return;
    }
    session->send_request(method, std::move(params), std::move(completion));
}

std::future<RequestResult> ClientManager::send_request(const std::string &method, std::optional<rpc::Json> params) {
    auto promise = std::make_shared<std::promise<RequestResult>>();
    auto future = promise->get_future();
    send_request(method, std::move(params), [promise](RequestResult result) { promise->set_value(std::move(result)); });
    return future;
}

bool ClientManager::send_notification(const std::string &method, std::optional<rpc::Json> params,
                                      rpc::ClientError &error) {
    std::shared_ptr<RpcSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
    }
    if (!session) {
        error = rpc::ClientError::disconnected();
        return false;
    }
    return session->send_notification(method, std::move(params), error);
}

bool ClientManager::respond(const rpc::MessageId &id, std::optional<rpc::Json> result, rpc::ClientError &error) {
    std::shared_ptr<RpcSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
    }
    if (!session) {
        error = rpc::ClientError::disconnected();
        return false;
    }
    return session->respond(id, std::move(result), error);
}

bool ClientManager::respond_error(std::optional<rpc::MessageId> id, rpc::ErrorObject error_object,
                                  rpc::ClientError &error) {
    std::shared_ptr<RpcSession> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = session_;
    }
    if (!session) {
        error = rpc::ClientError::disconnected();
        return false;
    }
    return session->respond_error(std::move(id), std::move(error_object), error);
}

// ----------------------------------------------------------------------------
// Session bookkeeping
// ----------------------------------------------------------------------------

bool ClientManager::is_session_materialized(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return materialized_sessions_.count(session_id) > 0;
}

void ClientManager::mark_session_materialized(const std::string &session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    materialized_sessions_.insert(session_id);
}

bool ClientManager::is_resuming_session(const std::string &session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resuming_sessions_.count(session_id) > 0;
}

void ClientManager::set_resuming_session(const std::string &session_id, bool resuming) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (resuming) {
        resuming_sessions_.insert(session_id);
    } else {
        resuming_sessions_.erase(session_id);
    }
}

void ClientManager::reset_session_state() {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_session_tracking_locked();
}

void ClientManager::reset_session_tracking_locked() {
    materialized_sessions_.clear();
    resuming_sessions_.clear();
}

// ----------------------------------------------------------------------------
// Accessors
// ----------------------------------------------------------------------------

ConnectionState ClientManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool ClientManager::is_connecting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_connecting_;
}

bool ClientManager::is_network_available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return network_available_;
}

bool ClientManager::is_initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

bool ClientManager::is_initializing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initializing_;
}

std::optional<rpc::ClientError> ClientManager::last_initialization_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_initialization_error_;
}

std::optional<int64_t> ClientManager::last_connected_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_connected_at_;
}

std::unique_ptr<events::Subscription> ClientManager::subscribe(const events::EventFilter &filter, size_t queue_size,
                                                               const std::string &name) {
    return emitter_.subscribe(filter, queue_size, name);
}

void ClientManager::set_state_locked(const ConnectionState &state) {
    bool changed = !same_state(state_, state);
    state_ = state;
    if (changed) {
        LOG_INFO("[Manager] State: " << describe_state(state));
        emitter_.emit(events::StateChangedEvent{0, state, 0});
    }
}

void ClientManager::resolve_connect_locked(bool success) {
    if (connect_promise_) {
        connect_promise_->set_value(success);
        connect_promise_.reset();
    }
}

// ----------------------------------------------------------------------------
// SessionListener
// ----------------------------------------------------------------------------

void ClientManager::on_session_state(RpcSession &session, const ConnectionState &state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_current_locked(session)) {
        LOG_DEBUG("[Manager] Ignoring " << describe_state(state) << " from a retired session");
        return;
    }

    is_connecting_ = state.is(ConnectionState::Kind::CONNECTING);
    set_state_locked(state);

    switch (state.kind) {
        case ConnectionState::Kind::CONNECTED: {
            scheduler_.record_success();
            schedule_changed_ = true;
            worker_cv_.notify_all();

            const int64_t now = now_epoch_seconds();
            last_connected_at_ = now;
            if (!store_last_connected_at(*store_, now)) {
                LOG_WARN("[Manager] Could not persist last connection time");
            }

            resolve_connect_locked(true);
            if (options_.auto_initialize && !initialized_ && !initializing_) {
                post_locked([this] { auto_initialize(); });
            }
            break;
        }
        case ConnectionState::Kind::FAILED:
            reset_initialization_locked();
            reset_session_tracking_locked();
            resolve_connect_locked(false);
            schedule_reconnect_locked();
            break;
        case ConnectionState::Kind::DISCONNECTED:
            reset_initialization_locked();
            reset_session_tracking_locked();
            schedule_reconnect_locked();
            break;
        case ConnectionState::Kind::CONNECTING:
            break;
    }
}

void ClientManager::on_session_message(RpcSession &session, const rpc::Message &message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_current_locked(session)) {
        return;
    }
    emitter_.emit(events::MessageEvent{0, message, 0});
}

void ClientManager::on_session_error(RpcSession &session, const rpc::ClientError &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_current_locked(session)) {
        return;
    }

    emitter_.emit(events::ErrorEvent{0, error, 0});
    if (!state_.is(ConnectionState::Kind::CONNECTED)) {
        schedule_reconnect_locked();
    }
}

void ClientManager::on_request_sending(RpcSession &session, const rpc::Request &request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_current_locked(session)) {
        return;
    }
    emitter_.emit(events::RequestSendingEvent{0, request, 0});
}

}  // namespace session
}  // namespace tether
