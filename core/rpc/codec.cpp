#include "codec.hpp"

#include <cmath>
#include <limits>

namespace tether {
namespace rpc {

namespace {

bool decode_id(const Json &node, std::optional<MessageId> &id, std::string &error) {
    if (node.is_null()) {
        id.reset();
        return true;
    }
    if (node.is_string()) {
        id = MessageId(node.get<std::string>());
        return true;
    }
    if (node.is_number_integer()) {
        if (node.is_number_unsigned() &&
            node.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            error = "Request id out of range";
            return false;
        }
        id = MessageId(node.get<int64_t>());
        return true;
    }
    if (node.is_number_float()) {
        double value = node.get<double>();
        if (std::isfinite(value) && std::floor(value) == value &&
            std::fabs(value) <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
            id = MessageId(static_cast<int64_t>(value));
            return true;
        }
    }
    error = "Request id must be a string or an integer";
    return false;
}

std::optional<Json> optional_member(const Json &document, const char *key) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

bool decode_error_object(const Json &node, ErrorObject &out, std::string &error) {
    if (!node.is_object()) {
        error = "Error member must be an object";
        return false;
    }

    auto code = node.find("code");
    if (code == node.end() || !code->is_number()) {
        error = "Error object missing numeric 'code'";
        return false;
    }
    if (code->is_number_float()) {
        double value = code->get<double>();
        if (std::floor(value) != value) {
            error = "Error code must be an integer";
            return false;
        }
        out.code = static_cast<int64_t>(value);
    } else {
        out.code = code->get<int64_t>();
    }

    auto message = node.find("message");
    if (message == node.end() || !message->is_string()) {
        error = "Error object missing string 'message'";
        return false;
    }
    out.message = message->get<std::string>();
    out.data = optional_member(node, "data");
    return true;
}

// Serializes a payload; "strict" makes invalid UTF-8 throw instead of being replaced
std::string dump(const Json &value) { return value.dump(-1, ' ', false, Json::error_handler_t::strict); }

void escape_slashes(std::string &text) {
    std::string escaped;
    escaped.reserve(text.size() + 8);
    for (char c : text) {
        // '/' can only occur inside string literals in serialized JSON
        if (c == '/') {
            escaped += "\\/";
        } else {
            escaped += c;
        }
    }
    text.swap(escaped);
}

}  // namespace

bool decode_message(std::string_view text, Message &message, std::string &error) {
    Json document = Json::parse(text.begin(), text.end(), nullptr, false);
    if (document.is_discarded()) {
        error = "Invalid JSON";
        return false;
    }
    return decode_document(document, message, error);
}

bool decode_document(const Json &document, Message &message, std::string &error) {
    if (!document.is_object()) {
        error = "JSON-RPC message must be an object";
        return false;
    }

    std::optional<MessageId> id;
    auto id_it = document.find("id");
    if (id_it != document.end() && !decode_id(*id_it, id, error)) {
        return false;
    }

    auto method_it = document.find("method");
    if (method_it != document.end() && !method_it->is_null()) {
        if (!method_it->is_string()) {
            error = "Method must be a string";
            return false;
        }
        std::string method = method_it->get<std::string>();
        auto params = optional_member(document, "params");

        if (id) {
            message = Request{*id, std::move(method), std::move(params)};
        } else {
            message = Notification{std::move(method), std::move(params)};
        }
        return true;
    }

    auto error_it = document.find("error");
    if (error_it != document.end() && !error_it->is_null()) {
        ErrorResponse response;
        response.id = id;
        if (!decode_error_object(*error_it, response.error, error)) {
            return false;
        }
        message = std::move(response);
        return true;
    }

    if (id) {
        message = Response{*id, optional_member(document, "result")};
        return true;
    }

    error = "Unknown JSON-RPC shape";
    return false;
}

bool encode_message(const Message &message, const EncodeOptions &options, std::string &out, std::string &error) {
    std::string text = "{";
    bool first = true;
    auto member = [&](const char *key, const std::string &value) {
        if (!first) {
            text += ",";
        }
        first = false;
        text += "\"";
        text += key;
        text += "\":";
        text += value;
    };

    try {
        if (options.include_jsonrpc_header) {
            member("jsonrpc", dump(Json(kJsonRpcVersion)));
        }

        std::visit(
            [&](auto &&m) {
                using T = std::decay_t<decltype(m)>;
                if constexpr (std::is_same_v<T, Request>) {
                    member("id", dump(m.id.to_json()));
                    member("method", dump(Json(m.method)));
                    if (m.params) {
                        member("params", dump(*m.params));
                    }
                } else if constexpr (std::is_same_v<T, Notification>) {
                    member("method", dump(Json(m.method)));
                    if (m.params) {
                        member("params", dump(*m.params));
                    }
                } else if constexpr (std::is_same_v<T, Response>) {
                    member("id", dump(m.id.to_json()));
                    member("result", m.result ? dump(*m.result) : std::string("null"));
                } else {
                    member("id", m.id ? dump(m.id->to_json()) : std::string("null"));
                    std::string body = "{\"code\":" + std::to_string(m.error.code) +
                                       ",\"message\":" + dump(Json(m.error.message));
                    if (m.error.data) {
                        body += ",\"data\":" + dump(*m.error.data);
                    }
                    body += "}";
                    member("error", body);
                }
            },
            message);
    } catch (const Json::exception &e) {
        error = std::string("Failed to encode message: ") + e.what();
        return false;
    }

    text += "}";

    if (options.escape_forward_slashes) {
        escape_slashes(text);
    }

    out = std::move(text);
    return true;
}

}  // namespace rpc
}  // namespace tether
