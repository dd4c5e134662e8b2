#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"


namespace gattlink::sim {

using core::Bytes;
using core::Characteristic;
using core::CharacteristicKey;
using core::Error;
using core::PeerId;
using core::Service;

// Value a simulated peripheral pushes on one of its characteristics
struct Notification {
    CharacteristicKey characteristic;
    Bytes value;
};

// Reaction of a peripheral to a write: zero or more notifications
using Responder = std::function<std::vector<Notification>(const Characteristic& target, const Bytes& payload)>;

// -----------------------------------------------------------------------------
// SimulatedPeripheral
// -----------------------------------------------------------------------------
//
// Static description of a peripheral known to a SimulatedCentral, plus the
// knobs used to provoke failure paths.
//
// -----------------------------------------------------------------------------
struct SimulatedPeripheral {
    core::Peer peer;
    core::Advertisement advertisement;
    int rssi{-60};

    std::vector<Service> services;
    std::vector<Characteristic> characteristics;   // each tagged with its service

    Responder responder;

    // false: connect attempts are swallowed without any event
    bool accept_connections{true};

    // Set: connect attempts fail with this error
    std::optional<Error> refuse_with;

    std::chrono::milliseconds connect_latency{20};
    std::chrono::milliseconds discovery_latency{5};
    std::chrono::milliseconds response_latency{10};
};

// Nordic UART service layout: one write characteristic (RX), one notify
// characteristic (TX).
inline constexpr std::string_view UART_SERVICE = "6E400001-B5A3-F393-E0A9-E50E24DCCA9E";
inline constexpr std::string_view UART_RX      = "6E400002-B5A3-F393-E0A9-E50E24DCCA9E";
inline constexpr std::string_view UART_TX      = "6E400003-B5A3-F393-E0A9-E50E24DCCA9E";

[[nodiscard]]
SimulatedPeripheral make_uart_peripheral(const PeerId& id, const std::string& name);

// Responder for line-based text protocols.
// Each written payload is stripped of one trailing "\r\n" or "\n" and handed
// to `handler`; a returned reply is notified on `reply_on`.
[[nodiscard]]
Responder line_responder(CharacteristicKey reply_on,
                         std::function<std::optional<std::string>(std::string_view line)> handler);

} // namespace gattlink::sim
