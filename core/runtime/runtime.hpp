#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "config.hpp"
#include "events/event_emitter.hpp"
#include "session/client_manager.hpp"
#include "session/identity_store.hpp"
#include "session/network_monitor.hpp"

namespace tether {
namespace runtime {

// SIGINT and SIGTERM record a stop request that Runtime::run() consumes.
// SIGPIPE is ignored so a peer dropping mid-write surfaces as a write error.
void install_signal_handlers();

// Records a stop request as if `signal` had been delivered
void request_stop(int signal);

/**
 * @brief Interactive client driven by stdin
 *
 * Input lines:
 *   method [json-params]          send a request and print the response
 *   :notify method [json-params]  send a notification
 *   :respond id [json-result]     answer a server-initiated request
 *   :health                       probe the connection now
 *   :offline / :online            flip the reported network availability
 *   :disconnect / :connect        drop or re-establish the session
 *   :quit                         exit
 */
class Runtime {
public:
    explicit Runtime(const CliConfig &config);
    ~Runtime();

    // Opens the identity store and creates the client manager
    bool initialize(std::string &error);

    // Main loop (blocking)
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Disconnects and releases the manager
    void shutdown();

    session::ClientManager &get_manager() { return *manager_; }

    // Handles one input line. Exposed for tests.
    void handle_line(const std::string &line);

private:
    bool read_stdin();
    void drain_events();
    void print_event(const events::Event &event);
    void run_health_check_if_due();
    void print(const std::string &line);

    CliConfig config_;

    std::shared_ptr<session::IKeyValueStore> store_;
    std::shared_ptr<session::ManualNetworkMonitor> network_;
    std::unique_ptr<session::ClientManager> manager_;
    std::unique_ptr<events::Subscription> subscription_;

    std::string input_buffer_;
    bool stdin_open_ = true;
    std::chrono::steady_clock::time_point last_health_check_;
    std::mutex output_mutex_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace tether
