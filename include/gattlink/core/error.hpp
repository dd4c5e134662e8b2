#pragma once

#include <string_view>

namespace gattlink::core {

/*
===============================================================================
 gattlink::core::Error
===============================================================================

Session-level error classification.

Errors are values. Synchronous failures (endpoint resolution, encoding, caller
misuse) are returned to the immediate caller; asynchronous outcomes
(connection watchdog, retries exhausted, request deadline) travel through the
channel the caller used: the observer for connection failures, the completion
or future for requests. Nothing is thrown across the asynchronous boundary.

Transport implementations report their own failures through the same enum,
usually as TransportError.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Caller contract ----------------------------------------------------
    InvalidState,          // Operation not allowed in the current connection phase

    // --- Connection lifecycle -----------------------------------------------
    ConnectionTimeout,     // Watchdog expired during connect or reconnect
    ConnectionDropped,     // Link lost with an error and the retry budget is exhausted
    ConnectionFailed,      // Transport refused the connection attempt

    // --- Endpoint resolution ------------------------------------------------
    NoWritableEndpoint,    // No characteristic with write / write-without-response
    NoNotifiableEndpoint,  // No characteristic with notify

    // --- Request / response -------------------------------------------------
    RequestTimeout,        // No matching value before the caller's deadline
    EncodingFailure,       // Command could not be converted to transport bytes
    Disconnected,          // Link went down while the request was pending
    Cancelled,             // Request cancelled explicitly or by session teardown

    // --- Raw transport ------------------------------------------------------
    TransportError,        // Unclassified failure reported by the transport
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                 return "None";
    case Error::InvalidState:         return "InvalidState";
    case Error::ConnectionTimeout:    return "ConnectionTimeout";
    case Error::ConnectionDropped:    return "ConnectionDropped";
    case Error::ConnectionFailed:     return "ConnectionFailed";
    case Error::NoWritableEndpoint:   return "NoWritableEndpoint";
    case Error::NoNotifiableEndpoint: return "NoNotifiableEndpoint";
    case Error::RequestTimeout:       return "RequestTimeout";
    case Error::EncodingFailure:      return "EncodingFailure";
    case Error::Disconnected:         return "Disconnected";
    case Error::Cancelled:            return "Cancelled";
    case Error::TransportError:       return "TransportError";
    default:                          return "Unknown";
    }
}

} // namespace gattlink::core
