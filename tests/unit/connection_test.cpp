/**
 * @file connection_test.cpp
 * @brief Unit tests for the Connection state machine over a scripted socket
 *
 * Tests:
 * - connect: headers, state sequence, failure, no-op when connected,
 *   cancellation by disconnect() during the handshake
 * - send: framing options, DISCONNECTED without a socket
 * - receive: ordered delivery, decode failures, peer close, socket errors
 * - heartbeat: periodic pings, failure moves to FAILED
 * - ping: timeout mapping
 * - disconnect() from a callback while the heartbeat is failing: no
 *   deadlock, and no FAILED after DISCONNECTED
 */

#include "transport/connection.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mocks/fake_websocket.hpp"

using namespace tether;
using namespace tether::transport;
using tether::tests::FakeWebSocketFactory;
using tether::tests::wait_until;

namespace {

class RecordingListener : public ConnectionListener {
public:
    void on_state_changed(const ConnectionState &state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        states_.push_back(state);
    }

    void on_message(const rpc::Message &message) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(message);
            hook = message_hook_;
        }
        if (hook) {
            hook();
        }
    }

    // Runs on the receive thread after each message is recorded
    void set_message_hook(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        message_hook_ = std::move(hook);
    }

    void on_error(const rpc::ClientError &error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.push_back(error);
    }

    std::vector<ConnectionState::Kind> kinds() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ConnectionState::Kind> out;
        for (const auto &state : states_) {
            out.push_back(state.kind);
        }
        return out;
    }

    std::vector<rpc::Message> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<rpc::ClientError> errors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    std::optional<ConnectionState> last_state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (states_.empty()) {
            return std::nullopt;
        }
        return states_.back();
    }

private:
    mutable std::mutex mutex_;
    std::vector<ConnectionState> states_;
    std::vector<rpc::Message> messages_;
    std::vector<rpc::ClientError> errors_;
    std::function<void()> message_hook_;
};

using Kind = ConnectionState::Kind;

}  // namespace

class ConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory = std::make_shared<FakeWebSocketFactory>();
        config.endpoint = "ws://127.0.0.1:9000/agent";
        config.escape_forward_slashes = false;
    }

    void TearDown() override { connection.reset(); }

    Connection &make_connection() {
        connection = std::make_unique<Connection>(config, factory);
        connection->set_listener(&listener);
        return *connection;
    }

    bool last_kind_is(Kind kind) const {
        auto state = listener.last_state();
        return state && state->is(kind);
    }

    RecordingListener listener;
    std::shared_ptr<FakeWebSocketFactory> factory;
    ConnectionConfig config;
    std::unique_ptr<Connection> connection;
};

// ---------------------------------------------------------------------------
// Connect
// ---------------------------------------------------------------------------

TEST_F(ConnectionTest, ConnectReachesConnected) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    EXPECT_TRUE(conn.state().is(Kind::CONNECTED));
    EXPECT_EQ(listener.kinds(), (std::vector<Kind>{Kind::CONNECTING, Kind::CONNECTED}));
    ASSERT_NE(factory->last_socket(), nullptr);
    EXPECT_EQ(factory->last_socket()->url(), config.endpoint);
}

TEST_F(ConnectionTest, ConnectSendsBearerTokenAndStaticHeaders) {
    config.additional_headers["X-Client-Id"] = "client-1";
    config.token_provider = [](std::string &token, std::string &) {
        token = "secret";
        return true;
    };
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    auto headers = factory->last_socket()->connect_headers();
    EXPECT_EQ(headers["Authorization"], "Bearer secret");
    EXPECT_EQ(headers["X-Client-Id"], "client-1");
}

TEST_F(ConnectionTest, TokenProviderFailureConnectsWithoutAuthorization) {
    config.additional_headers["X-Client-Id"] = "client-1";
    config.token_provider = [](std::string &, std::string &error) {
        error = "no token";
        return false;
    };
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    auto headers = factory->last_socket()->connect_headers();
    EXPECT_EQ(headers.count("Authorization"), 0u);
    EXPECT_EQ(headers["X-Client-Id"], "client-1");
}

TEST_F(ConnectionTest, ConnectFailureMovesToFailed) {
    factory->set_configure([](tests::FakeWebSocket &socket) { socket.fail_connect("connection refused"); });
    auto &conn = make_connection();

    rpc::ClientError error;
    EXPECT_FALSE(conn.connect(error));
    EXPECT_EQ(error.kind, rpc::ErrorKind::TRANSPORT);
    EXPECT_EQ(error.message, "connection refused");

    EXPECT_TRUE(conn.state().is(Kind::FAILED));
    EXPECT_EQ(listener.kinds(), (std::vector<Kind>{Kind::CONNECTING, Kind::FAILED}));
    ASSERT_EQ(listener.errors().size(), 1u);
    EXPECT_TRUE(factory->last_socket()->is_closed());
}

TEST_F(ConnectionTest, ConnectIsNoOpUnlessDisconnected) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));
    EXPECT_TRUE(conn.connect(error));
    EXPECT_EQ(factory->created_count(), 1u);
}

TEST_F(ConnectionTest, ReconnectAfterDisconnectUsesNewSocket) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));
    conn.disconnect();
    ASSERT_TRUE(conn.connect(error));
    EXPECT_EQ(factory->created_count(), 2u);
    EXPECT_TRUE(factory->socket(0)->is_closed());
    EXPECT_FALSE(factory->socket(1)->is_closed());
}

TEST_F(ConnectionTest, DisconnectDuringHandshakeCancelsConnect) {
    factory->set_configure([](tests::FakeWebSocket &socket) { socket.hold_connect(); });
    auto &conn = make_connection();

    auto pending = std::async(std::launch::async, [&conn] {
        rpc::ClientError error;
        bool ok = conn.connect(error);
        return std::make_pair(ok, error);
    });

    ASSERT_TRUE(factory->wait_for_created(1));
    conn.disconnect();

    auto [ok, error] = pending.get();
    EXPECT_FALSE(ok);
    EXPECT_EQ(error.kind, rpc::ErrorKind::DISCONNECTED);
    EXPECT_TRUE(conn.state().is(Kind::DISCONNECTED));
}

// ---------------------------------------------------------------------------
// Send
// ---------------------------------------------------------------------------

TEST_F(ConnectionTest, SendWithoutConnectionFails) {
    auto &conn = make_connection();
    rpc::ClientError error;
    EXPECT_FALSE(conn.send(rpc::Notification{"ping", std::nullopt}, error));
    EXPECT_EQ(error.kind, rpc::ErrorKind::DISCONNECTED);
}

TEST_F(ConnectionTest, SendAppendsNewline) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    ASSERT_TRUE(conn.send(rpc::Notification{"fs/changed", std::nullopt}, error));
    auto sent = factory->last_socket()->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], "{\"jsonrpc\":\"2.0\",\"method\":\"fs/changed\"}\n");
}

TEST_F(ConnectionTest, SendHonorsFramingOptions) {
    config.append_newline = false;
    config.include_jsonrpc_header = false;
    config.escape_forward_slashes = true;
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    ASSERT_TRUE(conn.send(rpc::Notification{"fs/changed", std::nullopt}, error));
    auto sent = factory->last_socket()->sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0], "{\"method\":\"fs\\/changed\"}");
}

TEST_F(ConnectionTest, SocketWriteFailureIsTransportError) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));
    factory->last_socket()->fail_sends("broken pipe");

    EXPECT_FALSE(conn.send(rpc::Notification{"x", std::nullopt}, error));
    EXPECT_EQ(error.kind, rpc::ErrorKind::TRANSPORT);
    EXPECT_EQ(error.message, "broken pipe");
}

// ---------------------------------------------------------------------------
// Receive
// ---------------------------------------------------------------------------

TEST_F(ConnectionTest, InboundMessagesAreDeliveredInOrder) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    auto socket = factory->last_socket();
    socket->push_text("{\"method\":\"one\"}\n{\"method\":\"two\"}\n");
    socket->push_text(R"({"method":"thr)");
    socket->push_text(R"(ee"})");

    ASSERT_TRUE(wait_until([&] { return listener.messages().size() == 3; }));
    auto messages = listener.messages();
    EXPECT_EQ(rpc::message_method(messages[0]), "one");
    EXPECT_EQ(rpc::message_method(messages[1]), "two");
    EXPECT_EQ(rpc::message_method(messages[2]), "three");
}

TEST_F(ConnectionTest, UndecodableObjectIsReportedWithoutDropping) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    factory->last_socket()->push_text(R"({"unexpected":true})");
    ASSERT_TRUE(wait_until([&] { return listener.errors().size() == 1; }));
    EXPECT_EQ(listener.errors()[0].kind, rpc::ErrorKind::DECODING_FAILED);
    EXPECT_TRUE(conn.state().is(Kind::CONNECTED));
}

TEST_F(ConnectionTest, PeerCloseMovesToDisconnected) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    factory->last_socket()->push_close(1001, "going away");
    ASSERT_TRUE(wait_until([&] { return last_kind_is(Kind::DISCONNECTED); }));
    EXPECT_TRUE(conn.state().is(Kind::DISCONNECTED));
    EXPECT_TRUE(listener.errors().empty());
}

TEST_F(ConnectionTest, ReceiveErrorMovesToFailed) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    factory->last_socket()->push_error("connection reset");
    ASSERT_TRUE(wait_until([&] { return last_kind_is(Kind::FAILED); }));
    auto state = conn.state();
    ASSERT_TRUE(state.error.has_value());
    EXPECT_EQ(state.error->kind, rpc::ErrorKind::TRANSPORT);
    EXPECT_EQ(state.error->message, "connection reset");
    ASSERT_TRUE(wait_until([&] { return listener.errors().size() == 1; }));
}

TEST_F(ConnectionTest, DisconnectClosesSocket) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    conn.disconnect();
    EXPECT_TRUE(conn.state().is(Kind::DISCONNECTED));
    EXPECT_TRUE(factory->last_socket()->is_closed());
    EXPECT_EQ(listener.kinds(), (std::vector<Kind>{Kind::CONNECTING, Kind::CONNECTED, Kind::DISCONNECTED}));

    // A second disconnect reports nothing new
    conn.disconnect();
    EXPECT_EQ(listener.kinds().size(), 3u);
}

// ---------------------------------------------------------------------------
// Heartbeat and ping
// ---------------------------------------------------------------------------

TEST_F(ConnectionTest, HeartbeatPingsPeriodically) {
    config.ping_interval_ms = 10;
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    auto socket = factory->last_socket();
    EXPECT_TRUE(wait_until([&] { return socket->ping_count() >= 3; }));
    EXPECT_TRUE(conn.state().is(Kind::CONNECTED));
}

TEST_F(ConnectionTest, HeartbeatFailureMovesToFailed) {
    config.ping_interval_ms = 10;
    factory->set_configure([](tests::FakeWebSocket &socket) { socket.set_ping_result(false, "no pong"); });
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));

    ASSERT_TRUE(wait_until([&] { return last_kind_is(Kind::FAILED); }));
    EXPECT_TRUE(factory->last_socket()->is_closed());
    EXPECT_EQ(listener.kinds(), (std::vector<Kind>{Kind::CONNECTING, Kind::CONNECTED, Kind::FAILED}));
}

TEST_F(ConnectionTest, PingTimeoutIsReportedAsTimeout) {
    auto &conn = make_connection();
    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));
    factory->last_socket()->hang_pings();

    EXPECT_FALSE(conn.ping(30, error));
    EXPECT_EQ(error.kind, rpc::ErrorKind::TIMEOUT);
}

TEST_F(ConnectionTest, PingWithoutConnectionFails) {
    auto &conn = make_connection();
    rpc::ClientError error;
    EXPECT_FALSE(conn.ping(30, error));
    EXPECT_EQ(error.kind, rpc::ErrorKind::DISCONNECTED);
}

TEST_F(ConnectionTest, DisconnectFromCallbackWhileHeartbeatFails) {
    config.ping_interval_ms = 10;
    auto &conn = make_connection();

    std::mutex gate_mutex;
    std::condition_variable gate_cv;
    bool entered = false;
    bool proceed = false;
    listener.set_message_hook([&]() {
        {
            std::unique_lock<std::mutex> lock(gate_mutex);
            entered = true;
            gate_cv.notify_all();
            gate_cv.wait(lock, [&] { return proceed; });
        }
        conn.disconnect();
    });

    rpc::ClientError error;
    ASSERT_TRUE(conn.connect(error));
    auto socket = factory->last_socket();

    // Park the receive thread inside the callback
    socket->push_text(R"({"method":"server/switch"})");
    {
        std::unique_lock<std::mutex> lock(gate_mutex);
        ASSERT_TRUE(gate_cv.wait_for(lock, std::chrono::seconds(2), [&] { return entered; }));
    }

    // The heartbeat fails and waits to report FAILED
    socket->set_ping_result(false, "no pong");
    ASSERT_TRUE(wait_until([&] { return conn.state().is(Kind::FAILED); }));

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        proceed = true;
    }
    gate_cv.notify_all();

    ASSERT_TRUE(wait_until([&] { return last_kind_is(Kind::DISCONNECTED); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    EXPECT_TRUE(conn.state().is(Kind::DISCONNECTED));
    EXPECT_EQ(listener.kinds(), (std::vector<Kind>{Kind::CONNECTING, Kind::CONNECTED, Kind::DISCONNECTED}));
}
