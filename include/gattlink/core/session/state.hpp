#pragma once

#include <cstdint>
#include <string_view>


namespace gattlink::core::session {

// ===============================================================
// CONNECTION PHASE
// ===============================================================
enum class State : uint8_t {
    Idle,
    Connecting,
    Connected,
    Reconnecting,
    Disconnecting
};

// ------------------------------------------------------------
// State → string
// ------------------------------------------------------------
[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Idle:          return "Idle";
        case State::Connecting:    return "Connecting";
        case State::Connected:     return "Connected";
        case State::Reconnecting:  return "Reconnecting";
        case State::Disconnecting: return "Disconnecting";
        default:                   return "Unknown";
    }
}


// ===============================================================
// FSM INPUT
// ===============================================================
enum class Event : uint8_t {
    // --- User intent ---
    ConnectRequested,
    DisconnectRequested,

    // --- Central lifecycle ---
    TransportConnected,
    TransportConnectFailed,
    TransportDisconnected,     // clean (no error)
    TransportDropped,          // disconnected with an error

    // --- Radio ---
    RadioPoweredOff,

    // --- Watchdog ---
    WatchdogExpired
};

// ===============================================================
// Event → string
// ===============================================================
[[nodiscard]]
inline constexpr std::string_view to_string(Event e) noexcept {
    switch (e) {
        case Event::ConnectRequested:       return "ConnectRequested";
        case Event::DisconnectRequested:    return "DisconnectRequested";
        case Event::TransportConnected:     return "TransportConnected";
        case Event::TransportConnectFailed: return "TransportConnectFailed";
        case Event::TransportDisconnected:  return "TransportDisconnected";
        case Event::TransportDropped:       return "TransportDropped";
        case Event::RadioPoweredOff:        return "RadioPoweredOff";
        case Event::WatchdogExpired:        return "WatchdogExpired";
        default:                            return "UnknownEvent";
    }
}

} // namespace gattlink::core::session
