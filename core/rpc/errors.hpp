#pragma once

#include <optional>
#include <string>

#include "json_rpc.hpp"

namespace tether {
namespace rpc {

enum class ErrorKind {
    DISCONNECTED,     // No live connection, or the connection went away while waiting
    ENCODING_FAILED,  // Outbound message could not be serialized
    DECODING_FAILED,  // Inbound frame was not a JSON-RPC envelope
    RPC,              // Peer answered with a JSON-RPC error object
    NETWORK_OFFLINE,  // Network reported unavailable
    TIMEOUT,          // Bounded wait expired (health probe)
    TRANSPORT         // Socket-level failure
};

const char *error_kind_to_string(ErrorKind kind);

// Error value passed to callers, listeners and pending request completions
struct ClientError {
    ErrorKind kind = ErrorKind::TRANSPORT;
    std::string message;
    std::optional<ErrorObject> rpc;  // Set when kind == RPC

    static ClientError disconnected(const std::string &message = "Not connected");
    static ClientError encoding_failed(const std::string &message);
    static ClientError decoding_failed(const std::string &message);
    static ClientError rpc_error(const ErrorObject &error);
    static ClientError network_offline();
    static ClientError timeout(const std::string &message);
    static ClientError transport(const std::string &message);

    // "KIND: message", with the RPC code appended for RPC errors
    std::string describe() const;
};

}  // namespace rpc
}  // namespace tether
