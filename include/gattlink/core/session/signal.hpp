/*
===============================================================================
 Connection Signals
===============================================================================

session::Signal represents edge-triggered facts emitted by session::Connection
and drained by the owning Session through poll_signal().

Unlike the observer event stream (which carries raw central events), signals
are what the Session acts upon: cache invalidation, failing pending requests,
and the session-level ConnectionFailure notification.

-------------------------------------------------------------------------------
 Signal Meanings
-------------------------------------------------------------------------------

Connected
  Initial connection established (Connecting -> Connected).
  The retry budget has been reset.

Reconnected
  Automatic reconnect succeeded (Reconnecting -> Connected).
  The retry budget is NOT reset.

Disconnected
  The link is no longer usable (user disconnect, clean remote disconnect,
  radio power-off, or an error drop about to be retried).

RetryImmediate
  A reconnect attempt has been issued; one unit of retry budget consumed.

ConnectionTimeout
  The watchdog expired during connect or reconnect. Phase is Idle.

ConnectionDropped
  The link dropped with an error and no retry budget remained. Phase is Idle.

ConnectionFailed
  The central refused the initial connection attempt. Phase is Idle.

===============================================================================
*/


#pragma once

#include <cstdint>
#include <string_view>

#include "gattlink/core/error.hpp"


namespace gattlink::core::session {


enum class Signal : uint8_t {
    None,
    Connected,
    Reconnected,
    Disconnected,
    RetryImmediate,
    // --- Terminal failures (observer is notified) ---
    ConnectionTimeout,
    ConnectionDropped,
    ConnectionFailed,
};

[[nodiscard]]
inline constexpr std::string_view to_string(Signal sig) noexcept {
    switch (sig) {
        case Signal::None:              return "None";
        case Signal::Connected:         return "Connected";
        case Signal::Reconnected:       return "Reconnected";
        case Signal::Disconnected:      return "Disconnected";
        case Signal::RetryImmediate:    return "RetryImmediate";
        case Signal::ConnectionTimeout: return "ConnectionTimeout";
        case Signal::ConnectionDropped: return "ConnectionDropped";
        case Signal::ConnectionFailed:  return "ConnectionFailed";
        default:                        return "Unknown";
    }
}

// Error carried by the ConnectionFailure notification, None for other signals
[[nodiscard]]
inline constexpr Error failure_of(Signal sig) noexcept {
    switch (sig) {
        case Signal::ConnectionTimeout: return Error::ConnectionTimeout;
        case Signal::ConnectionDropped: return Error::ConnectionDropped;
        case Signal::ConnectionFailed:  return Error::ConnectionFailed;
        default:                        return Error::None;
    }
}

} // namespace gattlink::core::session
