#pragma once

#include <map>
#include <optional>
#include <string>

#include "rpc/json_rpc.hpp"
#include "session/client_config.hpp"

namespace tether {
namespace runtime {

struct ConnectionSection {
    std::string endpoint;                  // ws:// or wss:// URL (required)
    std::string auth_token_env;            // Env var holding the bearer token, read on every connect
    std::string cf_access_client_id;       // Cloudflare Access service token id
    std::string cf_access_client_secret_env;  // Env var holding the Cloudflare Access secret
    std::map<std::string, std::string> headers;
    int ping_interval_ms = 15000;          // 0 disables the heartbeat
    bool append_newline = true;
    bool include_jsonrpc_header = true;
    bool requires_unescaped_slashes = false;
};

struct ReconnectSection {
    bool enabled = true;
    int max_attempts = 3;
    int base_delay_ms = 1000;
    int health_check_timeout_ms = 8000;
    int health_check_interval_ms = 30000;  // 0 disables periodic probes
};

struct InitializeSection {
    bool auto_initialize = false;
    std::string method = "initialize";
    std::optional<rpc::Json> params;
};

struct IdentitySection {
    std::string store_path = "~/.tether/identity.yaml";
    std::string client_id;  // Empty = stored or generated
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct CliConfig {
    ConnectionSection connection;
    ReconnectSection reconnect;
    InitializeSection initialize;
    IdentitySection identity;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, CliConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const CliConfig &config, std::string &error);

// Expands a leading "~/" using $HOME
std::string expand_home(const std::string &path);

// Builds what the manager needs from a loaded configuration
session::ManagerOptions to_manager_options(const CliConfig &config);
session::ClientConfig to_client_config(const CliConfig &config);

}  // namespace runtime
}  // namespace tether
