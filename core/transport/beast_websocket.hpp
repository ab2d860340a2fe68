#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "websocket.hpp"

namespace tether {
namespace transport {

struct WebSocketUrl {
    bool secure = false;
    std::string host;
    std::string port;
    std::string target = "/";
};

// Parses ws://host[:port][/path][?query] and the wss:// equivalent.
// IPv6 literals are accepted in brackets.
bool parse_websocket_url(const std::string &url, WebSocketUrl &out, std::string &error);

// WebSocket client over Boost.Beast.
//
// Every stream operation runs on a private I/O thread through Beast's async
// API: the handshake, reads, queued writes and pings, and the automatic
// pong/close replies Beast sends while reading. The public calls block the
// caller until their operation completes on that thread. close() is posted
// there too and aborts whatever is outstanding.
//
// Reads are issued on demand by receive(), so pongs are only observed while
// a receive() is in progress.
class BeastWebSocketConnection : public IWebSocketConnection {
public:
    explicit BeastWebSocketConnection(std::string url);
    ~BeastWebSocketConnection() override;

    BeastWebSocketConnection(const BeastWebSocketConnection &) = delete;
    BeastWebSocketConnection &operator=(const BeastWebSocketConnection &) = delete;

    bool connect(const Headers &headers, std::string &error) override;
    bool send_text(const std::string &text, std::string &error) override;
    bool receive(WebSocketEvent &event, std::string &error) override;
    void close() override;
    bool ping(int timeout_ms, std::string &error) override;

private:
    using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using SecureStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;
    using Completion = std::shared_ptr<std::promise<boost::beast::error_code>>;
    using Step = std::function<void(boost::beast::error_code)>;

    struct Outbound {
        bool ping = false;
        std::string text;
        std::promise<boost::beast::error_code> done;
    };

    struct ReadResult {
        boost::beast::error_code ec;
        bool text = true;
        std::string data;
        int close_code = 0;
        std::string close_reason;
    };

    // The methods below run on the I/O thread only

    template <typename Fn>
    auto with_stream(Fn &&fn) {
        if (wss_) {
            return fn(*wss_);
        }
        return fn(*ws_);
    }

    template <typename Stream>
    void configure(Stream &stream, const Headers &headers);

    bool abort_if_closed(const Completion &done);
    void start_connect(const WebSocketUrl &target, const std::string &host_header, const Headers &headers,
                       const Completion &done);
    template <typename Stream>
    void connect_stream(Stream &stream, const boost::asio::ip::tcp::resolver::results_type &results,
                        const WebSocketUrl &target, const std::string &host_header, const Headers &headers,
                        const Completion &done);
    void start_tls(PlainStream &stream, const std::string &host, Step next);
    void start_tls(SecureStream &stream, const std::string &host, Step next);

    void queue_write(const std::shared_ptr<Outbound> &op);
    void write_next();
    void start_read(const std::shared_ptr<std::promise<ReadResult>> &done);
    void finish_read(const std::shared_ptr<std::promise<ReadResult>> &done, boost::beast::error_code ec);
    void shutdown_socket();

    // Posts a write or ping and blocks until the I/O thread completes it
    boost::beast::error_code submit(const std::shared_ptr<Outbound> &op);

    void on_pong();

    const std::string url_;

    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::ip::tcp::resolver resolver_;
    std::unique_ptr<PlainStream> ws_;
    std::unique_ptr<SecureStream> wss_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::shared_ptr<Outbound>> outbound_;  // Front is in flight

    std::mutex pong_mutex_;
    std::condition_variable pong_cv_;
    uint64_t pongs_received_ = 0;

    std::atomic<bool> open_{false};
    std::atomic<bool> closed_{false};

    std::thread io_thread_;  // Runs ioc_ until destruction
};

class BeastWebSocketFactory : public IWebSocketFactory {
public:
    std::shared_ptr<IWebSocketConnection> make_connection(const std::string &url) override;
};

}  // namespace transport
}  // namespace tether
