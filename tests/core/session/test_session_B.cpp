/*
===============================================================================
 core::Session — Group B: connect watchdog
===============================================================================

Covered Contracts
-----------------
B1. An unconfirmed connect ends in ConnectionTimeout after connect_timeout,
    the attempt is cancelled and the session returns to Idle
B2. A subsequent connect() succeeds (no stuck state)
B3. A late confirmation after the timeout is ignored
B4. A confirmed connect never reports a stale watchdog expiry
B5. ConnectOptions::timeout overrides the configured watchdog
B6. A reconnect attempt is guarded by the watchdog as well
B7. A confirmed reconnect restores the link without resetting the budget
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <thread>

#include "common/harness/session.hpp"
#include "gattlink/log/logger.hpp"

using namespace std::chrono_literals;
using namespace gattlink::core::test;


// -----------------------------------------------------------------------------
// B1 + B2 + B3
// -----------------------------------------------------------------------------
void test_watchdog_timeout() {
    std::cout << "[TEST] Group B1: unconfirmed connect times out\n";

    SessionHarness h;
    const auto start = std::chrono::steady_clock::now();
    TEST_CHECK(h.session->connect(PEER) == Error::None);

    TEST_CHECK(gattlink::test::wait_until([&] { return !h.failures().empty(); }));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    TEST_CHECK(elapsed >= 100ms);
    TEST_CHECK(elapsed < 1000ms);

    TEST_CHECK(h.failures() == std::vector<Error>{Error::ConnectionTimeout});
    TEST_CHECK(h.session->state() == session::State::Idle);
    TEST_CHECK(h.central.disconnect_calls() == 1);
    TEST_CHECK(h.session->armed_timers() == 0);

    std::cout << "[TEST] Group B3: late confirmation is ignored\n";
    h.central.emit_connected(PEER);
    TEST_CHECK(h.session->state() == session::State::Idle);
    TEST_CHECK(h.central.discover_services_calls() == 0);

    std::cout << "[TEST] Group B2: connect() works again\n";
    TEST_CHECK(h.session->connect(PEER) == Error::None);
    TEST_CHECK(h.session->state() == session::State::Connecting);
    h.central.emit_connected(PEER);
    TEST_CHECK(h.session->state() == session::State::Connected);
    TEST_CHECK(h.failures().size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4. Stale watchdog
// -----------------------------------------------------------------------------
void test_no_stale_timeout() {
    std::cout << "[TEST] Group B4: confirmed connect never times out\n";

    SessionHarness h;
    h.connect_and_discover();
    TEST_CHECK(h.session->armed_timers() == 0);

    std::this_thread::sleep_for(250ms);
    TEST_CHECK(h.failures().empty());
    TEST_CHECK(h.session->state() == session::State::Connected);

    // Disconnect + reconnect: the first attempt's generation is long gone
    TEST_CHECK(h.session->disconnect(PEER) == Error::None);
    TEST_CHECK(h.session->connect(PEER) == Error::None);
    h.central.emit_connected(PEER);
    std::this_thread::sleep_for(250ms);
    TEST_CHECK(h.failures().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B5. Per-connect timeout override
// -----------------------------------------------------------------------------
void test_timeout_override() {
    std::cout << "[TEST] Group B5: ConnectOptions::timeout override\n";

    SessionConfig cfg = test_config();
    cfg.connect_timeout = 10s;
    SessionHarness h{cfg};

    const auto start = std::chrono::steady_clock::now();
    TEST_CHECK(h.session->connect(PEER, ConnectOptions{50ms}) == Error::None);
    TEST_CHECK(gattlink::test::wait_until([&] { return !h.failures().empty(); }));
    TEST_CHECK(std::chrono::steady_clock::now() - start < 2s);
    TEST_CHECK(h.failures()[0] == Error::ConnectionTimeout);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B6. Reconnect watchdog
// -----------------------------------------------------------------------------
void test_reconnect_timeout() {
    std::cout << "[TEST] Group B6: reconnect attempt times out\n";

    SessionHarness h;
    h.connect_and_discover();

    h.central.emit_disconnected(PEER, Error::TransportError);
    TEST_CHECK(h.session->state() == session::State::Reconnecting);
    TEST_CHECK(h.central.connect_calls() == 2);
    TEST_CHECK(h.session->retry_budget() == 2);
    TEST_CHECK(h.session->characteristics().empty());
    TEST_CHECK(h.failures().empty());

    TEST_CHECK(gattlink::test::wait_until([&] { return !h.failures().empty(); }));
    TEST_CHECK(h.failures() == std::vector<Error>{Error::ConnectionTimeout});
    TEST_CHECK(h.session->state() == session::State::Idle);
    TEST_CHECK(h.central.connect_calls() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B7. Successful reconnect
// -----------------------------------------------------------------------------
void test_reconnect_success() {
    std::cout << "[TEST] Group B7: reconnect restores the link\n";

    SessionHarness h;
    h.connect_and_discover();

    h.central.emit_disconnected(PEER, Error::TransportError);
    TEST_CHECK(h.session->state() == session::State::Reconnecting);
    TEST_CHECK(h.session->armed_timers() == 1);

    h.confirm_and_discover();
    TEST_CHECK(h.session->state() == session::State::Connected);
    TEST_CHECK(h.session->armed_timers() == 0);
    TEST_CHECK(h.session->retry_budget() == 2);
    TEST_CHECK(h.central.discover_services_calls() == 2);
    TEST_CHECK(h.session->writable().size() == 1);

    // The disarmed reconnect watchdog must stay silent
    std::this_thread::sleep_for(250ms);
    TEST_CHECK(h.failures().empty());
    TEST_CHECK(h.session->state() == session::State::Connected);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    gattlink::log::Logger::instance().set_level(gattlink::log::Level::Error);

    test_watchdog_timeout();
    test_no_stale_timeout();
    test_timeout_override();
    test_reconnect_timeout();
    test_reconnect_success();

    std::cout << "\n[GROUP B — CONNECT WATCHDOG TESTS PASSED]\n";
    return 0;
}
