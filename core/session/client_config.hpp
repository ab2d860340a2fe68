#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "reconnect_scheduler.hpp"
#include "transport/connection_config.hpp"

namespace tether {
namespace session {

constexpr const char *kClientIdHeader = "X-Client-Id";
constexpr const char *kCfAccessClientIdHeader = "CF-Access-Client-Id";
constexpr const char *kCfAccessClientSecretHeader = "CF-Access-Client-Secret";

// What a caller supplies to ClientManager::connect()
struct ClientConfig {
    std::string endpoint;                          // ws:// or wss:// URL
    std::optional<std::string> auth_token;         // Static bearer token
    transport::TokenProvider token_provider;       // Takes precedence over auth_token
    std::string cf_access_client_id;               // Sent when non-blank after trimming
    std::string cf_access_client_secret;           // Sent when non-blank after trimming
    transport::Headers additional_headers;
    bool requires_unescaped_slashes = false;       // Emit "/" rather than "\/"
    bool include_jsonrpc_header = true;
    bool append_newline = true;
    std::optional<int> ping_interval_ms = 15000;   // nullopt or <= 0 disables the heartbeat
};

struct ManagerOptions {
    ReconnectPolicyConfig reconnect;
    int health_check_timeout_ms = 8000;
    bool auto_initialize = false;                  // Initialize after every successful connect
    std::string initialize_method = "initialize";
    std::optional<std::string> client_id;          // Overrides the stored identifier
    size_t event_queue_size = 256;                 // Default per-subscriber queue bound
};

// Builds the transport configuration: caller headers, Cloudflare Access
// headers and the X-Client-Id header, plus the bearer token source.
transport::ConnectionConfig build_connection_config(const ClientConfig &config, const std::string &client_id);

}  // namespace session
}  // namespace tether
