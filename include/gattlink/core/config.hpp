#pragma once

#include <chrono>
#include <cstddef>
#include <string>


namespace gattlink::core {

// Default connection-establishment watchdog
inline constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(20);

// Default automatic reconnect attempts after an unexpected drop
inline constexpr int RETRY_COUNT = 3;

// Largest single attribute value a peripheral is required to accept
inline constexpr std::size_t MAX_WRITE_SIZE = 512;

// -----------------------------------------------------------------------------
// Session configuration
// -----------------------------------------------------------------------------
struct SessionConfig {
    /// Automatic reconnect attempts after a drop reported with an error.
    /// Zero disables reconnection.
    int retry_count = RETRY_COUNT;

    /// Watchdog for connect() and for every automatic reconnect attempt.
    std::chrono::milliseconds connect_timeout = CONNECT_TIMEOUT;

    /// Appended to text commands before they are written.
    std::string line_terminator = "\n";

    /// Encoded payloads larger than this are rejected with EncodingFailure.
    std::size_t max_write_size = MAX_WRITE_SIZE;

    /// Ask the transport for a write acknowledgement. Acknowledgements are
    /// only ever surfaced through the observer.
    bool write_with_response = false;
};

} // namespace gattlink::core
