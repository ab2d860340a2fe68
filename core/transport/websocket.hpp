#pragma once

#include <map>
#include <memory>
#include <string>

namespace tether {
namespace transport {

using Headers = std::map<std::string, std::string>;

// Error text reported by ping() when no pong arrives in time
constexpr const char *kPingTimedOut = "Ping timed out";

enum class WebSocketEventType { CONNECTED, TEXT, BINARY, CLOSED };

struct WebSocketEvent {
    WebSocketEventType type = WebSocketEventType::TEXT;
    std::string data;          // TEXT / BINARY payload
    int close_code = 0;        // CLOSED only
    std::string close_reason;  // CLOSED only
};

// Interface over a message-oriented socket so the connection state machine
// can run against a real WebSocket or a scripted one in tests.
//
// receive() blocks the calling thread. close() may be called from any
// thread and must unblock a pending receive() or ping().
class IWebSocketConnection {
public:
    virtual ~IWebSocketConnection() = default;

    virtual bool connect(const Headers &headers, std::string &error) = 0;
    virtual bool send_text(const std::string &text, std::string &error) = 0;
    virtual bool receive(WebSocketEvent &event, std::string &error) = 0;
    virtual void close() = 0;

    // Sends a ping frame and waits up to timeout_ms for the pong
    virtual bool ping(int timeout_ms, std::string &error) = 0;
};

class IWebSocketFactory {
public:
    virtual ~IWebSocketFactory() = default;

    // One socket per connect attempt
    virtual std::shared_ptr<IWebSocketConnection> make_connection(const std::string &url) = 0;
};

}  // namespace transport
}  // namespace tether
