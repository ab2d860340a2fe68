#include "runtime.hpp"

#include <poll.h>
#include <signal.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <thread>
#include <type_traits>

#include "logging/logger.hpp"
#include "transport/beast_websocket.hpp"

namespace tether {
namespace runtime {

namespace {

constexpr int kLoopIntervalMs = 100;

// Signal number of the pending stop request, 0 when none
std::atomic<int> g_stop_signal{0};

void on_stop_signal(int signal) { g_stop_signal.store(signal); }

const char *signal_name(int signal) {
    switch (signal) {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    default:
        return "signal";
    }
}

std::string trim(const std::string &text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Splits "word rest" at the first blank
void split_word(const std::string &text, std::string &word, std::string &rest) {
    const auto space = text.find_first_of(" \t");
    if (space == std::string::npos) {
        word = text;
        rest.clear();
        return;
    }
    word = text.substr(0, space);
    rest = trim(text.substr(space + 1));
}

// Empty text means no params
bool parse_params(const std::string &text, std::optional<rpc::Json> &params, std::string &error) {
    if (text.empty()) {
        params.reset();
        return true;
    }
    rpc::Json parsed = rpc::Json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        error = "Invalid JSON: " + text;
        return false;
    }
    params = std::move(parsed);
    return true;
}

rpc::MessageId parse_id(const std::string &text) {
    if (!text.empty() && text.find_first_not_of("-0123456789") == std::string::npos && text != "-") {
        try {
            return rpc::MessageId(static_cast<int64_t>(std::stoll(text)));
        } catch (const std::exception &) {
            // Out of range: fall through and treat it as a string id
        }
    }
    return rpc::MessageId(text);
}

std::string dump_optional(const std::optional<rpc::Json> &value) { return value ? value->dump() : "null"; }

}  // namespace

void install_signal_handlers() {
    struct sigaction stop = {};
    stop.sa_handler = on_stop_signal;
    sigemptyset(&stop.sa_mask);
    // No SA_RESTART: the stdin poll returns EINTR and the loop sees the request
    stop.sa_flags = 0;
    ::sigaction(SIGINT, &stop, nullptr);
    ::sigaction(SIGTERM, &stop, nullptr);

    struct sigaction ignore = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGPIPE, &ignore, nullptr);
}

void request_stop(int signal) { g_stop_signal.store(signal); }

Runtime::Runtime(const CliConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing tether client");

    store_ = std::make_shared<session::YamlKeyValueStore>(expand_home(config_.identity.store_path));
    network_ = std::make_shared<session::ManualNetworkMonitor>(true);

    try {
        manager_ = std::make_unique<session::ClientManager>(
            to_manager_options(config_), store_, std::make_shared<transport::BeastWebSocketFactory>(), network_);
    } catch (const std::exception &e) {
        error = std::string("Failed to create client manager: ") + e.what();
        return false;
    }

    if (config_.initialize.params) {
        const rpc::Json params = *config_.initialize.params;
        manager_->set_initialization_payload_provider([params]() { return std::optional<rpc::Json>(params); });
    }

    subscription_ = manager_->subscribe(events::EventFilter::all(), 0, "cli");
    if (!subscription_) {
        error = "Failed to subscribe to client events";
        return false;
    }

    LOG_INFO("[Runtime] Client id: " << manager_->client_id());
    if (auto last = manager_->last_connected_at()) {
        LOG_INFO("[Runtime] Last connected at " << *last << " (epoch seconds)");
    }
    return true;
}

void Runtime::run() {
    if (!manager_) {
        LOG_ERROR("[Runtime] run() called before initialize()");
        return;
    }

    running_ = true;
    last_health_check_ = std::chrono::steady_clock::now();

    manager_->connect(to_client_config(config_));
    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        if (int signal = g_stop_signal.exchange(0)) {
            LOG_INFO("[Runtime] " << signal_name(signal) << " received, stopping...");
            running_ = false;
            break;
        }

        if (!read_stdin()) {
            // Nothing to wait on; keep the loop cadence
            std::this_thread::sleep_for(std::chrono::milliseconds(kLoopIntervalMs));
        }

        drain_events();
        run_health_check_if_due();
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    subscription_.reset();
    if (manager_) {
        manager_->disconnect();
        manager_.reset();
    }
}

bool Runtime::read_stdin() {
    if (!stdin_open_) {
        return false;
    }

    struct pollfd fd;
    fd.fd = STDIN_FILENO;
    fd.events = POLLIN;
    fd.revents = 0;

    int ready = ::poll(&fd, 1, kLoopIntervalMs);
    if (ready < 0) {
        if (errno != EINTR) {
            LOG_ERROR("[Runtime] poll() on stdin failed: " << std::strerror(errno));
            stdin_open_ = false;
        }
        return true;
    }
    if (ready == 0) {
        return true;
    }

    char chunk[4096];
    ssize_t count = ::read(STDIN_FILENO, chunk, sizeof(chunk));
    if (count <= 0) {
        if (count < 0 && errno == EINTR) {
            return true;
        }
        LOG_INFO("[Runtime] stdin closed, running until signal or :quit");
        stdin_open_ = false;
        if (!input_buffer_.empty()) {
            handle_line(input_buffer_);
            input_buffer_.clear();
        }
        return true;
    }

    input_buffer_.append(chunk, static_cast<size_t>(count));
    size_t newline = 0;
    while ((newline = input_buffer_.find('\n')) != std::string::npos) {
        std::string line = input_buffer_.substr(0, newline);
        input_buffer_.erase(0, newline + 1);
        handle_line(line);
    }
    return true;
}

void Runtime::handle_line(const std::string &raw) {
    const std::string line = trim(raw);
    if (line.empty() || !manager_) {
        return;
    }

    std::string command;
    std::string rest;
    split_word(line, command, rest);

    if (command[0] != ':') {
        std::optional<rpc::Json> params;
        std::string error;
        if (!parse_params(rest, params, error)) {
            print("! " + error);
            return;
        }
        manager_->send_request(command, params, [this, command](session::RequestResult result) {
            if (result.ok()) {
                print("< " + command + " " + result.response->id.to_string() + ": " +
                      dump_optional(result.response->result));
            } else {
                print("< " + command + " failed: " + result.error->describe());
            }
        });
        return;
    }

    if (command == ":quit") {
        stop();
    } else if (command == ":health") {
        bool healthy = manager_->verify_connection_health();
        print(std::string("health: ") + (healthy ? "ok" : "unresponsive"));
    } else if (command == ":offline") {
        network_->set_available(false);
    } else if (command == ":online") {
        network_->set_available(true);
    } else if (command == ":disconnect") {
        manager_->disconnect();
    } else if (command == ":connect") {
        manager_->connect(to_client_config(config_));
    } else if (command == ":notify") {
        std::string method;
        std::string payload;
        split_word(rest, method, payload);
        std::optional<rpc::Json> params;
        std::string parse_error;
        if (method.empty()) {
            print("! usage: :notify method [json-params]");
            return;
        }
        if (!parse_params(payload, params, parse_error)) {
            print("! " + parse_error);
            return;
        }
        rpc::ClientError error;
        if (!manager_->send_notification(method, params, error)) {
            print("! notify failed: " + error.describe());
        }
    } else if (command == ":respond") {
        std::string id;
        std::string payload;
        split_word(rest, id, payload);
        std::optional<rpc::Json> result;
        std::string parse_error;
        if (id.empty()) {
            print("! usage: :respond id [json-result]");
            return;
        }
        if (!parse_params(payload, result, parse_error)) {
            print("! " + parse_error);
            return;
        }
        rpc::ClientError error;
        if (!manager_->respond(parse_id(id), result, error)) {
            print("! respond failed: " + error.describe());
        }
    } else {
        print("! unknown command: " + command);
    }
}

void Runtime::drain_events() {
    if (!subscription_) {
        return;
    }
    while (auto event = subscription_->try_pop()) {
        print_event(*event);
    }
}

void Runtime::print_event(const events::Event &event) {
    std::visit(
        [this](auto &&e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, events::StateChangedEvent>) {
                print("* state " + transport::describe_state(e.state));
            } else if constexpr (std::is_same_v<T, events::MessageEvent>) {
                std::string text = "> " + std::string(rpc::message_type_name(e.message));
                if (auto id = rpc::message_id(e.message)) {
                    text += " " + id->to_string();
                }
                if (auto *request = std::get_if<rpc::Request>(&e.message)) {
                    text += " " + request->method + " " + dump_optional(request->params);
                } else if (auto *notification = std::get_if<rpc::Notification>(&e.message)) {
                    text += " " + notification->method + " " + dump_optional(notification->params);
                }
                print(text);
            } else if constexpr (std::is_same_v<T, events::RequestSendingEvent>) {
                print("* sending " + e.request.id.to_string() + " " + e.request.method);
            } else if constexpr (std::is_same_v<T, events::ErrorEvent>) {
                print("! " + e.error.describe());
            } else {
                print(std::string("* network ") + (e.available ? "online" : "offline"));
            }
        },
        event);
}

void Runtime::run_health_check_if_due() {
    const int interval_ms = config_.reconnect.health_check_interval_ms;
    if (interval_ms <= 0 || !manager_) {
        return;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now - last_health_check_ < std::chrono::milliseconds(interval_ms)) {
        return;
    }
    last_health_check_ = now;

    if (!manager_->state().is(transport::ConnectionState::Kind::CONNECTED)) {
        return;
    }
    if (!manager_->verify_connection_health()) {
        LOG_WARN("[Runtime] Health check failed, reconnecting");
    }
}

void Runtime::print(const std::string &line) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << line << std::endl;
}

}  // namespace runtime
}  // namespace tether
