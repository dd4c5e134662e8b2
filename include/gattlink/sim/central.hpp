#pragma once

/*
===============================================================================
 gattlink::sim::SimulatedCentral
===============================================================================

In-process implementation of transport::CentralConcept backed by a set of
SimulatedPeripheral descriptions.

Every command completes asynchronously: its events are scheduled on a private
TimerQueue after the peripheral's configured latency, so callbacks are
serialized on one worker thread and never run inside the command call.

Besides the central contract, the simulator exposes controls used by tests and
example programs: radio power changes, link drops, unsolicited notifications
and per-peripheral connection behaviour.

After set_event_handler() returns, the previous handler is not running and
will not be called again.
===============================================================================
*/

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

#include "gattlink/core/types.hpp"
#include "gattlink/core/error.hpp"
#include "gattlink/core/transport/event.hpp"
#include "gattlink/core/transport/concepts.hpp"
#include "gattlink/core/timer/timer_queue.hpp"
#include "gattlink/sim/peripheral.hpp"


namespace gattlink::sim {

class SimulatedCentral {
public:
    SimulatedCentral();
    ~SimulatedCentral();

    SimulatedCentral(const SimulatedCentral&) = delete;
    SimulatedCentral& operator=(const SimulatedCentral&) = delete;

    void add_peripheral(SimulatedPeripheral peripheral);

    // -------------------------------------------------------------------------
    // CentralConcept
    // -------------------------------------------------------------------------
    void scan(const std::vector<core::Uuid>& filter, const core::ScanOptions& options);
    void stop_scan();

    void connect(const PeerId& peer);
    void disconnect(const PeerId& peer);

    void discover_services(const PeerId& peer);
    void discover_characteristics(const PeerId& peer, const Service& service);

    bool write(const PeerId& peer, const Characteristic& characteristic, const Bytes& payload, bool with_response);
    void set_notify(const PeerId& peer, const Characteristic& characteristic, bool enabled);

    void set_event_handler(core::transport::EventHandler handler);

    // -------------------------------------------------------------------------
    // Controls
    // -------------------------------------------------------------------------
    void set_radio_state(core::RadioState state);

    // Connected link is lost; a Disconnected event carrying `error` follows
    void drop_link(const PeerId& peer, Error error = Error::TransportError);

    // Unsolicited value; delivered only while connected and notifying
    void notify(const PeerId& peer, const CharacteristicKey& characteristic, Bytes value);

    void set_accept_connections(const PeerId& peer, bool accept);
    void set_refuse_with(const PeerId& peer, std::optional<Error> error);
    void set_responder(const PeerId& peer, Responder responder);

    // Blocks until every event already due has been delivered.
    // Must not be called from an event handler.
    void flush();

    // -------------------------------------------------------------------------
    // Inspection
    // -------------------------------------------------------------------------
    [[nodiscard]]
    bool is_connected(const PeerId& peer) const;

    [[nodiscard]]
    bool is_notifying(const PeerId& peer, const CharacteristicKey& characteristic) const;

    [[nodiscard]]
    bool scanning() const;

    [[nodiscard]]
    std::size_t connect_attempts(const PeerId& peer) const;

    [[nodiscard]]
    std::vector<Bytes> writes(const PeerId& peer) const;

private:
    struct Link_ {
        SimulatedPeripheral profile;
        bool connecting{false};
        bool connected{false};
        std::uint64_t generation{0};   // bumped on every link change; stale events are dropped
        std::set<std::pair<core::Uuid, core::Uuid>> notifying;
        std::size_t connect_attempts{0};
        std::vector<Bytes> writes;
    };

    Link_* find_(const PeerId& peer);
    const Link_* find_(const PeerId& peer) const;

    // Schedules `ev` for `peer` on the worker; dropped if the link generation
    // moved on meanwhile
    void post_(const PeerId& peer, std::uint64_t generation, std::chrono::milliseconds delay, core::transport::Event ev);

    // Schedules `ev` unconditionally
    void post_(std::chrono::milliseconds delay, core::transport::Event ev);

    void deliver_(const core::transport::Event& ev);

    mutable std::mutex mutex_;
    std::map<PeerId, Link_> links_;
    core::RadioState radio_{core::RadioState::PoweredOn};
    bool scanning_{false};

    std::recursive_mutex handler_mutex_;
    core::transport::EventHandler handler_;

    // Declared last: destroyed (and joined) first
    core::timer::TimerQueue worker_;
};

static_assert(core::transport::CentralConcept<SimulatedCentral>);

} // namespace gattlink::sim
