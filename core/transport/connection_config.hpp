#pragma once

#include <functional>
#include <optional>
#include <string>

#include "websocket.hpp"

namespace tether {
namespace transport {

// Fetches a bearer token. Returns false and sets error on failure.
using TokenProvider = std::function<bool(std::string &token, std::string &error)>;

struct ConnectionConfig {
    std::string endpoint;                // ws:// or wss:// URL
    TokenProvider token_provider;        // Optional, called on every connect
    Headers additional_headers;          // Sent on every connect
    std::optional<int> ping_interval_ms;  // Heartbeat cadence, nullopt disables
    bool append_newline = true;          // Terminate outbound documents with '\n'
    bool include_jsonrpc_header = true;  // Emit "jsonrpc":"2.0"
    bool escape_forward_slashes = true;  // Emit "/" as "\/"
};

}  // namespace transport
}  // namespace tether
