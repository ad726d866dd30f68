#include "state.h"

// Connection state to string for logs and the JSON API
const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Scanning: return "scanning";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Discovering: return "discovering";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Failed: return "failed";
        default: return "unknown";
    }
}
