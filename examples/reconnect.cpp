#include <atomic>
#include <chrono>
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
This example exercises automatic reconnection.
The simulated link is dropped with an error every second. The session spends
one unit of retry budget per drop and reconnects on its own; once the budget
is gone the next drop ends the session with ConnectionDropped.
*/

int main(int argc, char** argv) {
    const auto params = examples::cli::minimal::configure(argc, argv, "gattlink automatic reconnection against a flaky link");
    params.dump("=== Parameters ===", std::cout);

    sim::SimulatedCentral central;
    auto device = sim::make_uart_peripheral(params.peer, "uart-flaky");
    const CharacteristicKey tx{std::string(sim::UART_SERVICE), std::string(sim::UART_TX)};
    device.responder = sim::line_responder(tx, [](std::string_view line) -> std::optional<std::string> {
        return "ACK " + std::string(line);
    });
    central.add_peripheral(device);

    std::atomic<int> connects{0};
    std::atomic<int> drops{0};
    std::atomic<bool> finished{false};

    Session<sim::SimulatedCentral> session(central, params.session_config());
    session.set_observer([&](const Event& ev) {
        switch (ev.type) {
            case EventType::Connected:
                ++connects;
                std::cout << "[gattlink] CONNECTED (" << connects.load() << ")" << std::endl;
                break;
            case EventType::Disconnected:
                ++drops;
                std::cout << "[gattlink] DISCONNECTED (" << to_string(ev.error) << ")" << std::endl;
                break;
            case EventType::ConnectionFailure:
                std::cout << "[gattlink] GAVE UP: " << to_string(ev.error) << std::endl;
                finished = true;
                break;
            default:
                break;
        }
    });

    if (session.connect(params.peer) != Error::None) {
        std::cerr << "Failed to connect" << std::endl;
        return -1;
    }

    const auto test_duration = std::chrono::seconds(3 + params.retry_count * 2);
    const auto drop_every = std::chrono::seconds(1);
    auto start = std::chrono::steady_clock::now();
    auto last_drop = start;
    int requests_ok = 0;

    while (!finished && std::chrono::steady_clock::now() - start < test_duration) {
        if (session.state() == State::Connected && !session.notifiable().empty()) {
            const Outcome o = session.send_and_wait(Command("HELLO"), Expectation("ACK"),
                                                    std::chrono::milliseconds(params.request_timeout_ms));
            if (o.ok()) {
                ++requests_ok;
            }
            if (std::chrono::steady_clock::now() - last_drop > drop_every) {
                std::cout << "\n[gattlink] FORCING LINK DROP (budget left: " << session.retry_budget() << ")" << std::endl;
                central.drop_link(params.peer);
                last_drop = std::chrono::steady_clock::now();
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::cout << "\n========== TEST SUMMARY ==========" << std::endl;
    std::cout << "Connections       : " << connects.load() << std::endl;
    std::cout << "Drops             : " << drops.load() << std::endl;
    std::cout << "Requests answered : " << requests_ok << std::endl;
    std::cout << "Final state       : " << to_string(session.state()) << std::endl;

    // Initial connection + one per retry, then the final drop gives up
    if (finished && connects.load() == params.retry_count + 1) {
        std::cout << "[gattlink] Reconnection test PASSED" << std::endl;
        return 0;
    }

    std::cout << "[gattlink] Reconnection test FAILED" << std::endl;
    return 1;
}
