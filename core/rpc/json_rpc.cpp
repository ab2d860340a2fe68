#include "json_rpc.hpp"

namespace tether {
namespace rpc {

Json MessageId::to_json() const {
    if (is_integer()) {
        return Json(as_integer());
    }
    return Json(as_string());
}

std::string MessageId::to_string() const {
    if (is_integer()) {
        return std::to_string(as_integer());
    }
    return "\"" + as_string() + "\"";
}

size_t MessageId::hash() const {
    // Mix the alternative index in so 1 and "1" land in different buckets
    if (is_integer()) {
        return std::hash<int64_t>{}(as_integer()) ^ 0x9e3779b97f4a7c15ull;
    }
    return std::hash<std::string>{}(as_string());
}

ErrorCode classify_error_code(int64_t code) {
    switch (code) {
        case kParseError:
            return ErrorCode::PARSE_ERROR;
        case kInvalidRequest:
            return ErrorCode::INVALID_REQUEST;
        case kMethodNotFound:
            return ErrorCode::METHOD_NOT_FOUND;
        case kInvalidParams:
            return ErrorCode::INVALID_PARAMS;
        case kInternalError:
            return ErrorCode::INTERNAL_ERROR;
        default:
            return ErrorCode::SERVER_ERROR;
    }
}

const char *error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::PARSE_ERROR:
            return "PARSE_ERROR";
        case ErrorCode::INVALID_REQUEST:
            return "INVALID_REQUEST";
        case ErrorCode::METHOD_NOT_FOUND:
            return "METHOD_NOT_FOUND";
        case ErrorCode::INVALID_PARAMS:
            return "INVALID_PARAMS";
        case ErrorCode::INTERNAL_ERROR:
            return "INTERNAL_ERROR";
        case ErrorCode::SERVER_ERROR:
            return "SERVER_ERROR";
    }
    return "SERVER_ERROR";
}

const char *message_type_name(const Message &message) {
    return std::visit(
        [](auto &&m) -> const char * {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Request>) {
                return "request";
            } else if constexpr (std::is_same_v<T, Notification>) {
                return "notification";
            } else if constexpr (std::is_same_v<T, Response>) {
                return "response";
            } else {
                return "error";
            }
        },
        message);
}

std::optional<MessageId> message_id(const Message &message) {
    return std::visit(
        [](auto &&m) -> std::optional<MessageId> {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, Notification>) {
                return std::nullopt;
            } else {
                return m.id;
            }
        },
        message);
}

std::string message_method(const Message &message) {
    if (auto *request = std::get_if<Request>(&message)) {
        return request->method;
    }
    if (auto *notification = std::get_if<Notification>(&message)) {
        return notification->method;
    }
    return "";
}

}  // namespace rpc
}  // namespace tether
