#pragma once

/*
===============================================================================
 gattlink::core::transport::Event
===============================================================================

Tagged event emitted by a central (transport) implementation and delivered to
the owning Session through the handler installed with set_event_handler().

The same type is what the Session forwards, unmodified, to its observer. One
extra kind, ConnectionFailure, is produced by the Session itself when the
connection watchdog expires or the retry budget runs out.

Only the fields relevant to `type` are meaningful; the rest stay defaulted.

-------------------------------------------------------------------------------
 Kind                       Fields
-------------------------------------------------------------------------------
 RadioStateChanged          radio_state
 PeerDiscovered             peer, advertisement, rssi
 Connected                  peer
 ConnectFailed              peer, error
 Disconnected               peer, error (None = clean / user initiated)
 ServicesDiscovered         peer, services
 CharacteristicsDiscovered  peer, service, characteristics
 WriteAcknowledged          peer, characteristic, error
 ValueUpdated               peer, characteristic, value, error
 ConnectionFailure          peer, error (session-originated)
-------------------------------------------------------------------------------

 Threading
-------------------------------------------------------------------------------
Transports deliver events from their own serial worker. Implementations must
never invoke the handler synchronously from inside a command call
(connect(), write(), ...): the Session issues commands while holding its lock.
===============================================================================
*/

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"

namespace gattlink::core::transport {

enum class EventType : std::uint8_t {
    RadioStateChanged,
    PeerDiscovered,
    Connected,
    ConnectFailed,
    Disconnected,
    ServicesDiscovered,
    CharacteristicsDiscovered,
    WriteAcknowledged,
    ValueUpdated,
    ConnectionFailure
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::RadioStateChanged:         return "RadioStateChanged";
        case EventType::PeerDiscovered:            return "PeerDiscovered";
        case EventType::Connected:                 return "Connected";
        case EventType::ConnectFailed:             return "ConnectFailed";
        case EventType::Disconnected:              return "Disconnected";
        case EventType::ServicesDiscovered:        return "ServicesDiscovered";
        case EventType::CharacteristicsDiscovered: return "CharacteristicsDiscovered";
        case EventType::WriteAcknowledged:         return "WriteAcknowledged";
        case EventType::ValueUpdated:              return "ValueUpdated";
        case EventType::ConnectionFailure:         return "ConnectionFailure";
        default:                                   return "Unknown";
    }
}

struct Event {
    EventType type{EventType::RadioStateChanged};

    PeerId peer;
    RadioState radio_state{RadioState::Unknown};
    Advertisement advertisement;
    int rssi{0};
    std::vector<Service> services;
    Service service;
    std::vector<Characteristic> characteristics;
    Characteristic characteristic;
    Bytes value;
    Error error{Error::None};

    // -------------------------------------------------------------------------
    // Factories
    // -------------------------------------------------------------------------

    static Event make_radio_state(RadioState state) {
        Event ev;
        ev.type = EventType::RadioStateChanged;
        ev.radio_state = state;
        return ev;
    }

    static Event make_peer_discovered(Peer peer, Advertisement adv, int rssi) {
        Event ev;
        ev.type = EventType::PeerDiscovered;
        ev.peer = std::move(peer.id);
        if (adv.local_name.empty()) {
            adv.local_name = std::move(peer.name);
        }
        ev.advertisement = std::move(adv);
        ev.rssi = rssi;
        return ev;
    }

    static Event make_connected(PeerId peer) {
        Event ev;
        ev.type = EventType::Connected;
        ev.peer = std::move(peer);
        return ev;
    }

    static Event make_connect_failed(PeerId peer, Error error) {
        Event ev;
        ev.type = EventType::ConnectFailed;
        ev.peer = std::move(peer);
        ev.error = error;
        return ev;
    }

    static Event make_disconnected(PeerId peer, Error error = Error::None) {
        Event ev;
        ev.type = EventType::Disconnected;
        ev.peer = std::move(peer);
        ev.error = error;
        return ev;
    }

    static Event make_services_discovered(PeerId peer, std::vector<Service> services) {
        Event ev;
        ev.type = EventType::ServicesDiscovered;
        ev.peer = std::move(peer);
        ev.services = std::move(services);
        return ev;
    }

    static Event make_characteristics_discovered(PeerId peer, Service service, std::vector<Characteristic> characteristics) {
        Event ev;
        ev.type = EventType::CharacteristicsDiscovered;
        ev.peer = std::move(peer);
        ev.service = std::move(service);
        ev.characteristics = std::move(characteristics);
        return ev;
    }

    static Event make_write_acknowledged(PeerId peer, Characteristic characteristic, Error error = Error::None) {
        Event ev;
        ev.type = EventType::WriteAcknowledged;
        ev.peer = std::move(peer);
        ev.characteristic = std::move(characteristic);
        ev.error = error;
        return ev;
    }

    static Event make_value_updated(PeerId peer, Characteristic characteristic, Bytes value, Error error = Error::None) {
        Event ev;
        ev.type = EventType::ValueUpdated;
        ev.peer = std::move(peer);
        ev.characteristic = std::move(characteristic);
        ev.value = std::move(value);
        ev.error = error;
        return ev;
    }

    static Event make_connection_failure(PeerId peer, Error error) {
        Event ev;
        ev.type = EventType::ConnectionFailure;
        ev.peer = std::move(peer);
        ev.error = error;
        return ev;
    }
};

} // namespace gattlink::core::transport
