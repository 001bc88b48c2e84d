#pragma once

#include <string>

namespace trader::domain {

enum class ConnectionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED
};

inline std::string toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING: return "CONNECTING";
        case ConnectionState::CONNECTED: return "CONNECTED";
        default: return "UNKNOWN";
    }
}

} // namespace trader::domain
