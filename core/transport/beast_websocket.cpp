#include "beast_websocket.hpp"

#include <openssl/ssl.h>

#include <openssl/err.h>

#include <boost/asio/post.hpp>

#include <chrono>
#include <utility>

#include "logging/logger.hpp"

namespace tether {
namespace transport {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {
constexpr const char *kUserAgent = "tether/0.1";
constexpr int kConnectTimeoutSeconds = 30;
}  // namespace

bool parse_websocket_url(const std::string &url, WebSocketUrl &out, std::string &error) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        error = "Missing scheme in URL: " + url;
        return false;
    }

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "ws") {
        out.secure = false;
    } else if (scheme == "wss") {
        out.secure = true;
    } else {
        error = "Unsupported URL scheme '" + scheme + "' (expected ws or wss)";
        return false;
    }

    std::string rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_start);
    out.target = "/";
    if (path_start != std::string::npos) {
        out.target = rest.substr(path_start);
        if (out.target[0] == '?') {
            out.target = "/" + out.target;
        }
    }

    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            error = "Unterminated IPv6 literal in URL: " + url;
            return false;
        }
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                error = "Malformed authority in URL: " + url;
                return false;
            }
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon == std::string::npos) {
            out.host = authority;
        } else {
            out.host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (out.host.empty()) {
        error = "Missing host in URL: " + url;
        return false;
    }
    out.port = port.empty() ? (out.secure ? "443" : "80") : port;
    return true;
}

BeastWebSocketConnection::BeastWebSocketConnection(std::string url)
    : url_(std::move(url)),
      work_(net::make_work_guard(ioc_)),
      ssl_ctx_(ssl::context::tls_client),
      resolver_(ioc_) {
    io_thread_ = std::thread([this] { ioc_.run(); });
}

BeastWebSocketConnection::~BeastWebSocketConnection() {
    close();
    // run() returns once the aborted operations have drained
    work_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

template <typename Stream>
void BeastWebSocketConnection::configure(Stream &stream, const Headers &headers) {
    // Keepalive is driven by the connection's heartbeat
    stream.set_option(websocket::stream_base::timeout{std::chrono::seconds(kConnectTimeoutSeconds),
                                                      websocket::stream_base::none(), false});
    stream.set_option(websocket::stream_base::decorator([headers](websocket::request_type &req) {
        req.set(beast::http::field::user_agent, kUserAgent);
        for (const auto &[name, value] : headers) {
            req.set(name, value);
        }
    }));
    stream.control_callback([this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong) {
            on_pong();
        }
    });
    stream.auto_fragment(false);
    stream.text(true);
}

bool BeastWebSocketConnection::connect(const Headers &headers, std::string &error) {
    WebSocketUrl parsed;
    if (!parse_websocket_url(url_, parsed, error)) {
        return false;
    }
    if (closed_.load()) {
        error = "Socket closed";
        return false;
    }

    // Host header carries the port when it is not the scheme default
    std::string host_header = parsed.host;
    if ((parsed.secure && parsed.port != "443") || (!parsed.secure && parsed.port != "80")) {
        host_header += ":" + parsed.port;
    }

    auto done = std::make_shared<std::promise<beast::error_code>>();
    auto result = done->get_future();
    net::post(ioc_, [this, parsed, host_header, headers, done] { start_connect(parsed, host_header, headers, done); });

    beast::error_code ec = result.get();
    if (closed_.load()) {
        error = "Connection closed during handshake";
        return false;
    }
    if (ec) {
        error = "WebSocket connect to " + url_ + " failed: " + ec.message();
        return false;
    }

    open_.store(true);
    LOG_DEBUG("[WebSocket] Handshake complete with " << parsed.host << ":" << parsed.port << parsed.target);
    return true;
}

bool BeastWebSocketConnection::abort_if_closed(const Completion &done) {
    if (!closed_.load()) {
        return false;
    }
    done->set_value(net::error::operation_aborted);
    return true;
}

void BeastWebSocketConnection::start_connect(const WebSocketUrl &target, const std::string &host_header,
                                             const Headers &headers, const Completion &done) {
    if (abort_if_closed(done)) {
        return;
    }

    if (target.secure) {
        beast::error_code ec;
        ssl_ctx_.set_default_verify_paths(ec);
        if (ec) {
            done->set_value(ec);
            return;
        }
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
        wss_ = std::make_unique<SecureStream>(ioc_, ssl_ctx_);
    } else {
        ws_ = std::make_unique<PlainStream>(ioc_);
    }

    resolver_.async_resolve(target.host, target.port,
                            [this, target, host_header, headers, done](beast::error_code ec,
                                                                       tcp::resolver::results_type results) {
                                if (abort_if_closed(done)) {
                                    return;
                                }
                                if (ec) {
                                    done->set_value(ec);
                                    return;
                                }
                                with_stream([&](auto &stream) {
                                    connect_stream(stream, results, target, host_header, headers, done);
                                });
                            });
}

template <typename Stream>
void BeastWebSocketConnection::connect_stream(Stream &stream, const tcp::resolver::results_type &results,
                                              const WebSocketUrl &target, const std::string &host_header,
                                              const Headers &headers, const Completion &done) {
    beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(kConnectTimeoutSeconds));
    beast::get_lowest_layer(stream).async_connect(
        results, [this, &stream, target, host_header, headers, done](beast::error_code ec,
                                                                     tcp::resolver::results_type::endpoint_type) {
            if (abort_if_closed(done)) {
                return;
            }
            if (ec) {
                done->set_value(ec);
                return;
            }

            beast::error_code option_ec;
            beast::get_lowest_layer(stream).socket().set_option(tcp::no_delay(true), option_ec);
            if (option_ec) {
                LOG_DEBUG("[WebSocket] TCP_NODELAY not applied: " << option_ec.message());
            }

            start_tls(stream, target.host, [this, &stream, target, host_header, headers, done](beast::error_code tls_ec) {
                if (abort_if_closed(done)) {
                    return;
                }
                if (tls_ec) {
                    done->set_value(tls_ec);
                    return;
                }
                // The websocket stream applies its own handshake timeout
                beast::get_lowest_layer(stream).expires_never();
                configure(stream, headers);
                stream.async_handshake(host_header, target.target,
                                       [done](beast::error_code handshake_ec) { done->set_value(handshake_ec); });
            });
        });
}

void BeastWebSocketConnection::start_tls(PlainStream &, const std::string &, Step next) { next(beast::error_code{}); }

void BeastWebSocketConnection::start_tls(SecureStream &stream, const std::string &host, Step next) {
    // SNI
    if (!SSL_set_tlsext_host_name(stream.next_layer().native_handle(), host.c_str())) {
        next(beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    stream.next_layer().set_verify_callback(ssl::host_name_verification(host));
    stream.next_layer().async_handshake(ssl::stream_base::client, std::move(next));
}

beast::error_code BeastWebSocketConnection::submit(const std::shared_ptr<Outbound> &op) {
    auto result = op->done.get_future();
    net::post(ioc_, [this, op] { queue_write(op); });
    return result.get();
}

void BeastWebSocketConnection::queue_write(const std::shared_ptr<Outbound> &op) {
    outbound_.push_back(op);
    if (outbound_.size() == 1) {
        write_next();
    }
}

void BeastWebSocketConnection::write_next() {
    if (outbound_.empty()) {
        return;
    }
    if (closed_.load()) {
        for (auto &op : outbound_) {
            op->done.set_value(net::error::operation_aborted);
        }
        outbound_.clear();
        return;
    }

    auto op = outbound_.front();
    auto written = [this, op](beast::error_code ec) {
        op->done.set_value(ec);
        outbound_.pop_front();
        write_next();
    };
    with_stream([&](auto &stream) {
        if (op->ping) {
            stream.async_ping(websocket::ping_data{}, written);
        } else {
            stream.async_write(net::buffer(op->text), [written](beast::error_code ec, std::size_t) { written(ec); });
        }
    });
}

bool BeastWebSocketConnection::send_text(const std::string &text, std::string &error) {
    if (!open_.load() || closed_.load()) {
        error = "Socket is not open";
        return false;
    }

    auto op = std::make_shared<Outbound>();
    op->text = text;
    beast::error_code ec = submit(op);
    if (ec) {
        error = "Write failed: " + ec.message();
        return false;
    }
    return true;
}

void BeastWebSocketConnection::start_read(const std::shared_ptr<std::promise<ReadResult>> &done) {
    if (closed_.load()) {
        ReadResult result;
        result.ec = net::error::operation_aborted;
        done->set_value(std::move(result));
        return;
    }
    with_stream([&](auto &stream) {
        stream.async_read(read_buffer_, [this, done](beast::error_code ec, std::size_t) { finish_read(done, ec); });
    });
}

void BeastWebSocketConnection::finish_read(const std::shared_ptr<std::promise<ReadResult>> &done,
                                           beast::error_code ec) {
    ReadResult result;
    result.ec = ec;
    if (ec == websocket::error::closed) {
        with_stream([&](auto &stream) {
            result.close_code = static_cast<int>(stream.reason().code);
            result.close_reason = std::string(stream.reason().reason.c_str());
        });
    } else if (!ec) {
        result.text = with_stream([](auto &stream) { return stream.got_text(); });
        result.data = beast::buffers_to_string(read_buffer_.data());
    }
    read_buffer_.consume(read_buffer_.size());
    done->set_value(std::move(result));
}

bool BeastWebSocketConnection::receive(WebSocketEvent &event, std::string &error) {
    if (!open_.load() || closed_.load()) {
        error = "Socket is not open";
        return false;
    }

    auto done = std::make_shared<std::promise<ReadResult>>();
    auto pending = done->get_future();
    net::post(ioc_, [this, done] { start_read(done); });
    ReadResult result = pending.get();

    if (result.ec == websocket::error::closed) {
        event.type = WebSocketEventType::CLOSED;
        event.close_code = result.close_code;
        event.close_reason = std::move(result.close_reason);
        open_.store(false);
        return true;
    }

    if (result.ec) {
        error = closed_.load() ? std::string("Socket closed") : "Read failed: " + result.ec.message();
        return false;
    }

    event.type = result.text ? WebSocketEventType::TEXT : WebSocketEventType::BINARY;
    event.data = std::move(result.data);
    return true;
}

void BeastWebSocketConnection::close() {
    if (closed_.exchange(true)) {
        return;
    }
    open_.store(false);

    net::post(ioc_, [this] { shutdown_socket(); });

    {
        std::lock_guard<std::mutex> lock(pong_mutex_);
    }
    pong_cv_.notify_all();
}

void BeastWebSocketConnection::shutdown_socket() {
    // Closing the socket aborts the outstanding handshake, read and write
    resolver_.cancel();
    beast::error_code ec;
    if (wss_) {
        auto &socket = beast::get_lowest_layer(*wss_).socket();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    } else if (ws_) {
        auto &socket = beast::get_lowest_layer(*ws_).socket();
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
}

bool BeastWebSocketConnection::ping(int timeout_ms, std::string &error) {
    if (!open_.load() || closed_.load()) {
        error = "Socket is not open";
        return false;
    }

    uint64_t baseline = 0;
    {
        std::lock_guard<std::mutex> lock(pong_mutex_);
        baseline = pongs_received_;
    }

    auto op = std::make_shared<Outbound>();
    op->ping = true;
    beast::error_code ec = submit(op);
    if (ec) {
        error = "Ping write failed: " + ec.message();
        return false;
    }

    std::unique_lock<std::mutex> lock(pong_mutex_);
    bool answered = pong_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                      [&] { return pongs_received_ > baseline || closed_.load(); });
    if (closed_.load()) {
        error = "Socket closed";
        return false;
    }
    if (!answered) {
        error = kPingTimedOut;
        return false;
    }
    return true;
}

void BeastWebSocketConnection::on_pong() {
    {
        std::lock_guard<std::mutex> lock(pong_mutex_);
        ++pongs_received_;
    }
    pong_cv_.notify_all();
}

std::shared_ptr<IWebSocketConnection> BeastWebSocketFactory::make_connection(const std::string &url) {
    return std::make_shared<BeastWebSocketConnection>(url);
}

}  // namespace transport
}  // namespace tether
