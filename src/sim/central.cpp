#include "gattlink/sim/central.hpp"

#include <algorithm>
#include <future>

#include "gattlink/log/logger.hpp"


namespace gattlink::sim {

using core::transport::Event;

SimulatedCentral::SimulatedCentral()
    : worker_("sim-central")
{}

SimulatedCentral::~SimulatedCentral() {
    worker_.stop();
}

void SimulatedCentral::add_peripheral(SimulatedPeripheral peripheral) {
    std::lock_guard<std::mutex> lock(mutex_);
    const PeerId id = peripheral.peer.id;
    Link_ link;
    link.profile = std::move(peripheral);
    links_[id] = std::move(link);
    GL_DEBUG("[SIM] Peripheral added: " << id);
}

// -----------------------------------------------------------------------------
// Discovery
// -----------------------------------------------------------------------------

void SimulatedCentral::scan(const std::vector<core::Uuid>& filter, const core::ScanOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (radio_ != core::RadioState::PoweredOn) {
        GL_WARN("[SIM] scan() while radio is " << to_string(radio_) << ". Ignoring.");
        return;
    }
    scanning_ = true;
    for (const auto& [id, link] : links_) {
        const auto& adv = link.profile.advertisement;
        const bool match = filter.empty() || std::any_of(filter.begin(), filter.end(), [&](const core::Uuid& uuid) {
            return std::find(adv.service_uuids.begin(), adv.service_uuids.end(), uuid) != adv.service_uuids.end();
        });
        if (!match) {
            continue;
        }
        // Advertising peripherals are reported once, or twice when duplicates are allowed
        const int reports = options.allow_duplicates ? 2 : 1;
        for (int i = 0; i < reports; ++i) {
            post_(std::chrono::milliseconds(1 + i), Event::make_peer_discovered(link.profile.peer, adv, link.profile.rssi));
        }
    }
}

void SimulatedCentral::stop_scan() {
    std::lock_guard<std::mutex> lock(mutex_);
    scanning_ = false;
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

void SimulatedCentral::connect(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link) {
        GL_WARN("[SIM] connect() to unknown peer '" << peer << "'");
        post_(std::chrono::milliseconds(1), Event::make_connect_failed(peer, Error::ConnectionFailed));
        return;
    }
    ++link->connect_attempts;
    if (radio_ != core::RadioState::PoweredOn) {
        GL_WARN("[SIM] connect() while radio is " << to_string(radio_));
        post_(std::chrono::milliseconds(1), Event::make_connect_failed(peer, Error::TransportError));
        return;
    }
    if (link->connected) {
        return;
    }
    const std::uint64_t generation = ++link->generation;
    link->connecting = true;

    if (link->profile.refuse_with) {
        link->connecting = false;
        post_(peer, generation, link->profile.connect_latency, Event::make_connect_failed(peer, *link->profile.refuse_with));
        return;
    }
    if (!link->profile.accept_connections) {
        GL_DEBUG("[SIM] " << peer << ": connect attempt swallowed");
        return;
    }

    (void)worker_.schedule(link->profile.connect_latency, [this, peer, generation]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            Link_* l = find_(peer);
            if (!l || l->generation != generation || !l->connecting) {
                return;
            }
            l->connecting = false;
            l->connected = true;
        }
        deliver_(Event::make_connected(peer));
    });
}

void SimulatedCentral::disconnect(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link) {
        return;
    }
    const bool was_active = link->connected || link->connecting;
    link->connected = false;
    link->connecting = false;
    link->notifying.clear();
    const std::uint64_t generation = ++link->generation;
    if (was_active) {
        post_(peer, generation, std::chrono::milliseconds(1), Event::make_disconnected(peer));
    }
}

// -----------------------------------------------------------------------------
// GATT
// -----------------------------------------------------------------------------

void SimulatedCentral::discover_services(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link || !link->connected) {
        GL_WARN("[SIM] discover_services() on a peer that is not connected: " << peer);
        return;
    }
    post_(peer, link->generation, link->profile.discovery_latency,
          Event::make_services_discovered(peer, link->profile.services));
}

void SimulatedCentral::discover_characteristics(const PeerId& peer, const Service& service) {
    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link || !link->connected) {
        GL_WARN("[SIM] discover_characteristics() on a peer that is not connected: " << peer);
        return;
    }
    std::vector<Characteristic> found;
    for (const auto& c : link->profile.characteristics) {
        if (c.service == service.uuid) {
            found.push_back(c);
        }
    }
    post_(peer, link->generation, link->profile.discovery_latency,
          Event::make_characteristics_discovered(peer, service, std::move(found)));
}

bool SimulatedCentral::write(const PeerId& peer, const Characteristic& characteristic, const Bytes& payload, bool with_response) {
    std::vector<Notification> replies;
    Responder responder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Link_* link = find_(peer);
        if (!link || !link->connected) {
            GL_WARN("[SIM] write() on a peer that is not connected: " << peer);
            return false;
        }
        auto it = std::find_if(link->profile.characteristics.begin(), link->profile.characteristics.end(),
            [&](const Characteristic& c) { return c.key() == characteristic.key(); });
        if (it == link->profile.characteristics.end()) {
            GL_WARN("[SIM] write() to unknown characteristic " << characteristic.key());
            return false;
        }
        link->writes.push_back(payload);
        if (with_response) {
            post_(peer, link->generation, link->profile.response_latency,
                  Event::make_write_acknowledged(peer, *it));
        }
        responder = link->profile.responder;
    }
    if (!responder) {
        return true;
    }

    // The responder is user code: run it without the simulator lock
    replies = responder(characteristic, payload);

    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link || !link->connected) {
        return true;
    }
    for (auto& n : replies) {
        const auto key = std::make_pair(n.characteristic.service, n.characteristic.uuid);
        if (link->notifying.count(key) == 0) {
            GL_DEBUG("[SIM] Reply on " << n.characteristic << " dropped (notifications disabled)");
            continue;
        }
        Characteristic target;
        target.service = n.characteristic.service;
        target.uuid = n.characteristic.uuid;
        for (const auto& c : link->profile.characteristics) {
            if (c.key() == n.characteristic) {
                target.properties = c.properties;
            }
        }
        post_(peer, link->generation, link->profile.response_latency,
              Event::make_value_updated(peer, std::move(target), std::move(n.value)));
    }
    return true;
}

void SimulatedCentral::set_notify(const PeerId& peer, const Characteristic& characteristic, bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link || !link->connected) {
        GL_WARN("[SIM] set_notify() on a peer that is not connected: " << peer);
        return;
    }
    const auto key = std::make_pair(characteristic.service, characteristic.uuid);
    if (enabled) {
        link->notifying.insert(key);
    }
    else {
        link->notifying.erase(key);
    }
}

void SimulatedCentral::set_event_handler(core::transport::EventHandler handler) {
    std::lock_guard<std::recursive_mutex> lock(handler_mutex_);
    handler_ = std::move(handler);
}

// -----------------------------------------------------------------------------
// Controls
// -----------------------------------------------------------------------------

void SimulatedCentral::set_radio_state(core::RadioState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (radio_ == state) {
        return;
    }
    GL_INFO("[SIM] Radio: " << to_string(radio_) << " -> " << to_string(state));
    radio_ = state;
    if (state != core::RadioState::PoweredOn) {
        scanning_ = false;
        for (auto& [_, link] : links_) {
            link.connected = false;
            link.connecting = false;
            link.notifying.clear();
            ++link.generation;
        }
    }
    post_(std::chrono::milliseconds(1), Event::make_radio_state(state));
}

void SimulatedCentral::drop_link(const PeerId& peer, Error error) {
    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link || (!link->connected && !link->connecting)) {
        GL_WARN("[SIM] drop_link() on a peer that is not connected: " << peer);
        return;
    }
    GL_INFO("[SIM] Dropping link to " << peer << " (" << to_string(error) << ")");
    link->connected = false;
    link->connecting = false;
    link->notifying.clear();
    const std::uint64_t generation = ++link->generation;
    post_(peer, generation, std::chrono::milliseconds(1), Event::make_disconnected(peer, error));
}

void SimulatedCentral::notify(const PeerId& peer, const CharacteristicKey& characteristic, Bytes value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Link_* link = find_(peer);
    if (!link || !link->connected) {
        return;
    }
    if (link->notifying.count(std::make_pair(characteristic.service, characteristic.uuid)) == 0) {
        GL_DEBUG("[SIM] Notification on " << characteristic << " dropped (notifications disabled)");
        return;
    }
    Characteristic target;
    target.service = characteristic.service;
    target.uuid = characteristic.uuid;
    post_(peer, link->generation, std::chrono::milliseconds(1),
          Event::make_value_updated(peer, std::move(target), std::move(value)));
}

void SimulatedCentral::set_accept_connections(const PeerId& peer, bool accept) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Link_* link = find_(peer)) {
        link->profile.accept_connections = accept;
    }
}

void SimulatedCentral::set_refuse_with(const PeerId& peer, std::optional<Error> error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Link_* link = find_(peer)) {
        link->profile.refuse_with = error;
    }
}

void SimulatedCentral::set_responder(const PeerId& peer, Responder responder) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (Link_* link = find_(peer)) {
        link->profile.responder = std::move(responder);
    }
}

void SimulatedCentral::flush() {
    if (worker_.on_worker()) {
        GL_ERROR("[SIM] flush() called from the worker. Ignoring.");
        return;
    }
    std::promise<void> done;
    auto future = done.get_future();
    if (!worker_.post([&done]() { done.set_value(); })) {
        return;
    }
    future.wait();
}

// -----------------------------------------------------------------------------
// Inspection
// -----------------------------------------------------------------------------

bool SimulatedCentral::is_connected(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Link_* link = find_(peer);
    return link && link->connected;
}

bool SimulatedCentral::is_notifying(const PeerId& peer, const CharacteristicKey& characteristic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Link_* link = find_(peer);
    return link && link->notifying.count(std::make_pair(characteristic.service, characteristic.uuid)) != 0;
}

bool SimulatedCentral::scanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanning_;
}

std::size_t SimulatedCentral::connect_attempts(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Link_* link = find_(peer);
    return link ? link->connect_attempts : 0;
}

std::vector<Bytes> SimulatedCentral::writes(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Link_* link = find_(peer);
    return link ? link->writes : std::vector<Bytes>{};
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------

SimulatedCentral::Link_* SimulatedCentral::find_(const PeerId& peer) {
    auto it = links_.find(peer);
    return it == links_.end() ? nullptr : &it->second;
}

const SimulatedCentral::Link_* SimulatedCentral::find_(const PeerId& peer) const {
    auto it = links_.find(peer);
    return it == links_.end() ? nullptr : &it->second;
}

void SimulatedCentral::post_(const PeerId& peer, std::uint64_t generation, std::chrono::milliseconds delay, Event ev) {
    (void)worker_.schedule(delay, [this, peer, generation, ev = std::move(ev)]() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const Link_* link = find_(peer);
            if (!link || link->generation != generation) {
                GL_TRACE("[SIM] Dropping stale " << core::transport::to_string(ev.type) << " for " << peer);
                return;
            }
        }
        deliver_(ev);
    });
}

void SimulatedCentral::post_(std::chrono::milliseconds delay, Event ev) {
    (void)worker_.schedule(delay, [this, ev = std::move(ev)]() {
        deliver_(ev);
    });
}

void SimulatedCentral::deliver_(const Event& ev) {
    std::lock_guard<std::recursive_mutex> lock(handler_mutex_);
    // Called through a copy: the handler may replace itself
    auto handler = handler_;
    if (handler) {
        handler(ev);
    }
}

} // namespace gattlink::sim
