#pragma once

#include <string>
#include <string_view>

#include "errors.hpp"
#include "json_rpc.hpp"

namespace tether {
namespace rpc {

// Literal version tag emitted in the "jsonrpc" member
constexpr const char *kJsonRpcVersion = "2.0";

struct EncodeOptions {
    bool include_jsonrpc_header = true;   // Some peers reject the "jsonrpc" member
    bool escape_forward_slashes = false;  // Emit "/" as "\/" inside strings
};

// Decodes one JSON-RPC envelope from text.
// Dispatch order: method+id -> Request, method -> Notification,
// error -> ErrorResponse, id -> Response. A null id or null params/result
// counts as absent.
// Returns false and sets error if the text is not JSON or has no known shape.
bool decode_message(std::string_view text, Message &message, std::string &error);

// Same as above for an already parsed document
bool decode_document(const Json &document, Message &message, std::string &error);

// Encodes with members in a fixed order: jsonrpc, id, then method/params,
// result or error. Returns false and sets error if a payload cannot be
// serialized (e.g. invalid UTF-8 inside a string).
bool encode_message(const Message &message, const EncodeOptions &options, std::string &out, std::string &error);

}  // namespace rpc
}  // namespace tether
