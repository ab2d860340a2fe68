#pragma once

/**
 * @file json_rpc.hpp
 * @brief JSON-RPC 2.0 message model
 *
 * Four envelope shapes travel over the wire:
 * - Request       {id, method, params?}
 * - Notification  {method, params?}
 * - Response      {id, result}
 * - ErrorResponse {id?, error: {code, message, data?}}
 *
 * Payloads (params, result, error data) are nlohmann::json values and are
 * not inspected by this layer.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace tether {
namespace rpc {

using Json = nlohmann::json;

/**
 * @brief Request identifier: integer or string
 *
 * The two alternatives never compare equal to each other, so the string "1"
 * and the integer 1 identify different requests.
 */
class MessageId {
public:
    MessageId() : value_(int64_t{0}) {}
    MessageId(int value) : value_(static_cast<int64_t>(value)) {}
    MessageId(int64_t value) : value_(value) {}
    MessageId(std::string value) : value_(std::move(value)) {}
    MessageId(const char *value) : value_(std::string(value)) {}

    bool is_integer() const { return std::holds_alternative<int64_t>(value_); }
    bool is_string() const { return std::holds_alternative<std::string>(value_); }

    int64_t as_integer() const { return std::get<int64_t>(value_); }
    const std::string &as_string() const { return std::get<std::string>(value_); }

    Json to_json() const;

    // Integer ids print bare, string ids print quoted
    std::string to_string() const;

    bool operator==(const MessageId &other) const { return value_ == other.value_; }
    bool operator!=(const MessageId &other) const { return !(*this == other); }

    size_t hash() const;

private:
    std::variant<int64_t, std::string> value_;
};

// Reserved error codes
constexpr int64_t kParseError = -32700;
constexpr int64_t kInvalidRequest = -32600;
constexpr int64_t kMethodNotFound = -32601;
constexpr int64_t kInvalidParams = -32602;
constexpr int64_t kInternalError = -32603;

enum class ErrorCode { PARSE_ERROR, INVALID_REQUEST, METHOD_NOT_FOUND, INVALID_PARAMS, INTERNAL_ERROR, SERVER_ERROR };

// Any code outside the five reserved values is a SERVER_ERROR
ErrorCode classify_error_code(int64_t code);
const char *error_code_to_string(ErrorCode code);

struct ErrorObject {
    int64_t code = kInternalError;
    std::string message;
    std::optional<Json> data;

    ErrorCode kind() const { return classify_error_code(code); }

    bool operator==(const ErrorObject &other) const {
        return code == other.code && message == other.message && data == other.data;
    }
    bool operator!=(const ErrorObject &other) const { return !(*this == other); }
};

struct Request {
    MessageId id;
    std::string method;
    std::optional<Json> params;

    bool operator==(const Request &other) const {
        return id == other.id && method == other.method && params == other.params;
    }
    bool operator!=(const Request &other) const { return !(*this == other); }
};

struct Notification {
    std::string method;
    std::optional<Json> params;

    bool operator==(const Notification &other) const { return method == other.method && params == other.params; }
    bool operator!=(const Notification &other) const { return !(*this == other); }
};

struct Response {
    MessageId id;
    std::optional<Json> result;  // nullopt: result was null or missing

    bool operator==(const Response &other) const { return id == other.id && result == other.result; }
    bool operator!=(const Response &other) const { return !(*this == other); }
};

struct ErrorResponse {
    std::optional<MessageId> id;  // nullopt: peer could not attribute the error to a request
    ErrorObject error;

    bool operator==(const ErrorResponse &other) const { return id == other.id && error == other.error; }
    bool operator!=(const ErrorResponse &other) const { return !(*this == other); }
};

using Message = std::variant<Request, Notification, Response, ErrorResponse>;

// "request", "notification", "response" or "error"
const char *message_type_name(const Message &message);

// The id carried by the message, if any
std::optional<MessageId> message_id(const Message &message);

// Method name of a Request or Notification, empty otherwise
std::string message_method(const Message &message);

}  // namespace rpc
}  // namespace tether

namespace std {
template <>
struct hash<tether::rpc::MessageId> {
    size_t operator()(const tether::rpc::MessageId &id) const { return id.hash(); }
};
}  // namespace std
