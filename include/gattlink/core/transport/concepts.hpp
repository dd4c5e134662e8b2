#pragma once

#include <concepts>
#include <functional>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/transport/event.hpp"

namespace gattlink::core::transport {

using EventHandler = std::function<void(const Event&)>;

// -----------------------------------------------------------------------------
// CentralConcept
// -----------------------------------------------------------------------------
//
// Minimal contract a BLE central (radio stack binding) must satisfy to be
// driven by a Session.
//
// The central:
//
//   • Performs every command asynchronously
//   • Reports results exclusively through the installed EventHandler
//   • Serializes all of its callbacks on one worker
//   • Never calls the handler from inside a command (see transport::Event)
//   • Performs its own link-layer retries; the Session never retries a write
//
// write() returns whether the command was accepted for transmission. It says
// nothing about delivery; acknowledgements arrive as WriteAcknowledged.
//
// -----------------------------------------------------------------------------

template<class C>
concept CentralConcept =
    requires(
        C central,
        const PeerId& peer,
        const std::vector<Uuid>& filter,
        const ScanOptions& options,
        const Service& service,
        const Characteristic& characteristic,
        const Bytes& payload,
        bool flag,
        EventHandler handler
    )
{
    // ---------------------------------------------------------------------
    // Discovery
    // ---------------------------------------------------------------------
    { central.scan(filter, options) } -> std::same_as<void>;
    { central.stop_scan() } -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------
    { central.connect(peer) } -> std::same_as<void>;
    { central.disconnect(peer) } -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // GATT
    // ---------------------------------------------------------------------
    { central.discover_services(peer) } -> std::same_as<void>;
    { central.discover_characteristics(peer, service) } -> std::same_as<void>;
    { central.write(peer, characteristic, payload, flag) } -> std::same_as<bool>;
    { central.set_notify(peer, characteristic, flag) } -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Event delivery
    // ---------------------------------------------------------------------
    { central.set_event_handler(handler) } -> std::same_as<void>;
};

} // namespace gattlink::core::transport
