#include <chrono>
#include <future>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "gattlink.hpp"
#include "gattlink/sim/central.hpp"
#include "gattlink/sim/peripheral.hpp"
#include "common/cli/minimal.hpp"

using namespace gattlink;


/*
This example shows the request/response path of a Session.
A simulated Nordic UART peripheral answers "PING" with "PONG" on its notify
characteristic. We connect, wait for discovery, then issue the same request in
its three forms (callback, future, blocking) and measure the local round trip.
A last request expects a reply that never comes and ends with RequestTimeout.
*/

int main(int argc, char** argv) {
    const auto params = examples::cli::minimal::configure(argc, argv, "gattlink ping/pong over a simulated UART peripheral");
    params.dump("=== Parameters ===", std::cout);

    // ---------------------------------------------------------------------
    // Simulated peripheral
    // ---------------------------------------------------------------------
    sim::SimulatedCentral central;
    auto device = sim::make_uart_peripheral(params.peer, "uart-echo");
    const CharacteristicKey tx{std::string(sim::UART_SERVICE), std::string(sim::UART_TX)};
    device.responder = sim::line_responder(tx, [](std::string_view line) -> std::optional<std::string> {
        if (line == "PING") {
            return std::string("PONG");
        }
        return std::nullopt;
    });
    central.add_peripheral(device);

    // ---------------------------------------------------------------------
    // Session
    // ---------------------------------------------------------------------
    Session<sim::SimulatedCentral> session(central, params.session_config());
    session.set_observer([](const Event& ev) {
        if (ev.type == EventType::ValueUpdated) {
            GL_INFO("[OBSERVER] " << ev.characteristic.key() << " = '" << to_text(ev.value) << "'");
        }
        else if (ev.type == EventType::ConnectionFailure) {
            GL_WARN("[OBSERVER] connection failure: " << to_string(ev.error));
        }
    });

    if (session.connect(params.peer) != Error::None) {
        return -1;
    }

    // Wait for the link and for both UART characteristics
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(params.connect_timeout_ms);
    while (session.writable().empty() || session.notifiable().empty()) {
        if (std::chrono::steady_clock::now() > deadline || session.state() == State::Idle) {
            GL_ERROR("[PING] peripheral not ready");
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const auto timeout = std::chrono::milliseconds(params.request_timeout_ms);

    // ---------------------------------------------------------------------
    // Callback form
    // ---------------------------------------------------------------------
    auto sent_at = std::chrono::steady_clock::now();
    std::promise<void> done;
    auto done_future = done.get_future();
    const RequestId id = session.send_and_wait("PING", "PONG", timeout, [&](const Outcome& outcome) {
        auto rtt = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - sent_at);
        GL_INFO("[PING] callback: " << to_string(outcome.error) << " '" << to_text(outcome.value) << "' (" << rtt.count() << " ms)");
        done.set_value();
    });
    GL_INFO("[PING] request #" << id << " issued");
    done_future.wait();

    // ---------------------------------------------------------------------
    // Future form
    // ---------------------------------------------------------------------
    sent_at = std::chrono::steady_clock::now();
    auto future = session.send_and_wait_async("PING", "PONG", timeout);
    const Outcome via_future = future.get();
    GL_INFO("[PING] future: " << to_string(via_future.error) << " ("
            << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - sent_at).count() << " ms)");

    // ---------------------------------------------------------------------
    // Blocking form
    // ---------------------------------------------------------------------
    const Outcome via_block = session.send_and_wait(Command("PING"), Expectation("PONG"), timeout);
    GL_INFO("[PING] blocking: " << to_string(via_block.error));

    // ---------------------------------------------------------------------
    // A reply that never comes
    // ---------------------------------------------------------------------
    sent_at = std::chrono::steady_clock::now();
    const Outcome silent = session.send_and_wait(Command("STATUS"), Expectation("READY"), timeout);
    GL_INFO("[PING] unanswered: " << to_string(silent.error) << " after "
            << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - sent_at).count() << " ms");

    (void)session.disconnect(params.peer);

    std::cout << "\n" << std::endl;
    session.telemetry().debug_dump(std::cout);

    GL_INFO("=== Done ===");
    return (via_future.ok() && via_block.ok() && silent.error == Error::RequestTimeout) ? 0 : 1;
}
