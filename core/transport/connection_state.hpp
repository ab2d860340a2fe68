#pragma once

#include <optional>
#include <string>

#include "rpc/errors.hpp"

namespace tether {
namespace transport {

struct ConnectionState {
    enum class Kind { DISCONNECTED, CONNECTING, CONNECTED, FAILED };

    Kind kind = Kind::DISCONNECTED;
    std::optional<rpc::ClientError> error;  // FAILED only

    static ConnectionState disconnected() { return ConnectionState{Kind::DISCONNECTED, std::nullopt}; }
    static ConnectionState connecting() { return ConnectionState{Kind::CONNECTING, std::nullopt}; }
    static ConnectionState connected() { return ConnectionState{Kind::CONNECTED, std::nullopt}; }
    static ConnectionState failed(rpc::ClientError error) { return ConnectionState{Kind::FAILED, std::move(error)}; }

    bool is(Kind k) const { return kind == k; }

    // Any two FAILED states compare equal regardless of the carried error
    bool operator==(const ConnectionState &other) const { return kind == other.kind; }
    bool operator!=(const ConnectionState &other) const { return kind != other.kind; }
};

inline const char *state_to_string(ConnectionState::Kind kind) {
    switch (kind) {
        case ConnectionState::Kind::DISCONNECTED:
            return "DISCONNECTED";
        case ConnectionState::Kind::CONNECTING:
            return "CONNECTING";
        case ConnectionState::Kind::CONNECTED:
            return "CONNECTED";
        case ConnectionState::Kind::FAILED:
            return "FAILED";
    }
    return "DISCONNECTED";
}

inline std::string describe_state(const ConnectionState &state) {
    std::string text = state_to_string(state.kind);
    if (state.error) {
        text += " (" + state.error->describe() + ")";
    }
    return text;
}

}  // namespace transport
}  // namespace tether
