#include <chrono>
#include <iostream>
#include <thread>

#include "gattlink.hpp"
#include "gattlink/sim/central.hpp"
#include "gattlink/sim/peripheral.hpp"
#include "common/cli/minimal.hpp"

using namespace gattlink;


/*
This example shows discovery and the connect watchdog.
We scan for UART peripherals, then connect to one that ignores connection
requests: the watchdog fires after --connect-timeout and the session returns
to Idle. The peripheral then starts accepting and a second connect succeeds.
*/

int main(int argc, char** argv) {
    const auto params = examples::cli::minimal::configure(argc, argv, "gattlink scan, connect watchdog and retry");
    params.dump("=== Parameters ===", std::cout);

    sim::SimulatedCentral central;
    auto device = sim::make_uart_peripheral(params.peer, "uart-shy");
    device.accept_connections = false;
    central.add_peripheral(device);

    Session<sim::SimulatedCentral> session(central, params.session_config());
    session.set_observer([](const Event& ev) {
        GL_INFO("[OBSERVER] " << to_string(ev.type) << " peer='" << ev.peer << "'"
                << (ev.error != Error::None ? " error=" : "") << (ev.error != Error::None ? to_string(ev.error) : ""));
        if (ev.type == EventType::PeerDiscovered) {
            GL_INFO("  name='" << ev.advertisement.local_name << "' rssi=" << ev.rssi);
        }
    });

    // ---------------------------------------------------------------------
    // Discovery
    // ---------------------------------------------------------------------
    session.start_scan({std::string(sim::UART_SERVICE)});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    session.stop_scan();

    // ---------------------------------------------------------------------
    // First attempt: the watchdog fires
    // ---------------------------------------------------------------------
    const auto started = std::chrono::steady_clock::now();
    if (session.connect(params.peer) != Error::None) {
        return -1;
    }
    while (session.state() != State::Idle) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    GL_INFO("[CONNECT] back to Idle after "
            << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count() << " ms");

    // ---------------------------------------------------------------------
    // Second attempt: accepted
    // ---------------------------------------------------------------------
    central.set_accept_connections(params.peer, true);
    if (session.connect(params.peer) != Error::None) {
        return -1;
    }
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(params.connect_timeout_ms) * 2;
    while (session.state() != State::Connected && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    const bool ok = session.state() == State::Connected;
    GL_INFO("[CONNECT] state=" << to_string(session.state()) << ", " << session.characteristics().size() << " characteristic(s)");
    for (const auto& ch : session.characteristics()) {
        GL_INFO("  " << ch.key()
                << (ch.properties.has(Property::Write) ? " write" : "")
                << (ch.properties.has(Property::WriteWithoutResponse) ? " write-no-rsp" : "")
                << (ch.properties.has(Property::Notify) ? " notify" : ""));
    }

    if (ok) {
        (void)session.disconnect(params.peer);
    }
    GL_INFO("=== Done ===");
    return ok ? 0 : 1;
}
