// types used throughout the session core

#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace stomp {

using Headers = std::map<std::string, std::string>;
using Bytes   = std::vector<std::uint8_t>;

enum class ConnectionState : std::uint8_t {
    Disconnected,
    Connecting,
    SocketConnected,        // websocket open, STOMP handshake still pending
    FullyConnected
};

// which layer an engine connect/disconnect callback refers to
enum class ConnectType {
    ToSocketEndpoint,
    ToStomp
};

enum class DisconnectType {
    FromSocket,
    FromStomp
};

enum class ErrorType {
    FromSocket,
    FromStomp
};

// Convert ConnectionState to string for logging
inline const char* connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "DISCONNECTED";
        case ConnectionState::Connecting: return "CONNECTING";
        case ConnectionState::SocketConnected: return "SOCKET_CONNECTED";
        case ConnectionState::FullyConnected: return "FULLY_CONNECTED";
    }
    return "UNKNOWN";
}

inline const char* error_type_to_string(ErrorType type) {
    switch (type) {
        case ErrorType::FromSocket: return "SOCKET";
        case ErrorType::FromStomp: return "STOMP";
    }
    return "UNKNOWN";
}

} // namespace stomp
