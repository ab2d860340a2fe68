#include "errors.hpp"

namespace tether {
namespace rpc {

const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DISCONNECTED:
            return "DISCONNECTED";
        case ErrorKind::ENCODING_FAILED:
            return "ENCODING_FAILED";
        case ErrorKind::DECODING_FAILED:
            return "DECODING_FAILED";
        case ErrorKind::RPC:
            return "RPC";
        case ErrorKind::NETWORK_OFFLINE:
            return "NETWORK_OFFLINE";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::TRANSPORT:
            return "TRANSPORT";
    }
    return "TRANSPORT";
}

ClientError ClientError::disconnected(const std::string &message) {
    return ClientError{ErrorKind::DISCONNECTED, message, std::nullopt};
}

ClientError ClientError::encoding_failed(const std::string &message) {
    return ClientError{ErrorKind::ENCODING_FAILED, message, std::nullopt};
}

ClientError ClientError::decoding_failed(const std::string &message) {
    return ClientError{ErrorKind::DECODING_FAILED, message, std::nullopt};
}

ClientError ClientError::rpc_error(const ErrorObject &error) {
    return ClientError{ErrorKind::RPC, error.message, error};
}

ClientError ClientError::network_offline() {
    return ClientError{ErrorKind::NETWORK_OFFLINE, "The network connection appears to be offline", std::nullopt};
}

ClientError ClientError::timeout(const std::string &message) {
    return ClientError{ErrorKind::TIMEOUT, message, std::nullopt};
}

ClientError ClientError::transport(const std::string &message) {
    return ClientError{ErrorKind::TRANSPORT, message, std::nullopt};
}

std::string ClientError::describe() const {
    std::string text = std::string(error_kind_to_string(kind)) + ": " + message;
    if (rpc) {
        text += " (code " + std::to_string(rpc->code) + ")";
    }
    return text;
}

}  // namespace rpc
}  // namespace tether
