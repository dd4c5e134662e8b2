/*
===============================================================================
 core::Session — Group G: telemetry
===============================================================================

Covered Contracts
-----------------
G1. Lifecycle and retry counters follow the connection decisions
G2. Request counters split success, timeout and failure
G3. copy_to() snapshots every counter; debug_dump() renders them

Counters only move when built with GATTLINK_ENABLE_TELEMETRY_L1; otherwise
they must all stay at zero.
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

#include "common/harness/session.hpp"
#include "gattlink/log/logger.hpp"

using namespace std::chrono_literals;
using namespace gattlink::core::test;
using gattlink::core::request::Outcome;
using gattlink::core::request::INVALID_REQUEST;

#if defined(GATTLINK_ENABLE_TELEMETRY_L1)
static constexpr bool TELEMETRY = true;
#else
static constexpr bool TELEMETRY = false;
#endif

// Expected value when telemetry is compiled in, zero otherwise
static std::uint64_t expect(std::uint64_t n) {
    return TELEMETRY ? n : 0;
}

// -----------------------------------------------------------------------------
// G1. Lifecycle
// -----------------------------------------------------------------------------
void test_lifecycle_counters() {
    std::cout << "[TEST] Group G1: lifecycle counters\n";

    SessionHarness h;
    h.connect_and_discover();

    // One drop, one reconnect
    h.central.emit_disconnected(PEER, Error::TransportError);
    h.confirm_and_discover();

    TEST_CHECK(h.session->disconnect(PEER) == Error::None);
    h.central.emit_disconnected(PEER);

    const auto& t = h.session->telemetry();
    TEST_CHECK(t.connect_calls_total.load() == expect(1));
    TEST_CHECK(t.connect_success_total.load() == expect(1));
    TEST_CHECK(t.drops_total.load() == expect(1));
    TEST_CHECK(t.retry_attempts_total.load() == expect(1));
    TEST_CHECK(t.retry_success_total.load() == expect(1));
    TEST_CHECK(t.retry_exhausted_total.load() == 0);
    TEST_CHECK(t.disconnect_calls_total.load() == expect(1));
    TEST_CHECK(t.watchdog_expired_total.load() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// G2. Requests
// -----------------------------------------------------------------------------
void test_request_counters() {
    std::cout << "[TEST] Group G2: request counters\n";

    SessionHarness h;
    h.connect_and_discover();

    std::atomic<int> resolved{0};
    auto completion = [&resolved](const Outcome&) { ++resolved; };

    // Success after a duplicated non-matching value
    TEST_CHECK(h.session->send_and_wait("PING", "PONG", 2000ms, completion) != INVALID_REQUEST);
    h.central.emit_value(PEER, uart_tx(), to_bytes("BUSY"));
    h.central.emit_value(PEER, uart_tx(), to_bytes("BUSY"));
    h.central.emit_value(PEER, uart_tx(), to_bytes("PONG"));
    TEST_CHECK(resolved == 1);

    // Timeout
    TEST_CHECK(h.session->send_and_wait("PING", "PONG", 50ms, completion) != INVALID_REQUEST);
    TEST_CHECK(gattlink::test::wait_until([&] { return h.session->pending_count() == 0; }));

    // Cancelled
    const auto id = h.session->send_and_wait("PING", "PONG", 2000ms, completion);
    TEST_CHECK(h.session->cancel(id));

    // Rejected before any write
    TEST_CHECK(!h.session->send(gattlink::core::dispatch::Command(gattlink::core::Bytes{})));

    const auto& t = h.session->telemetry();
    TEST_CHECK(t.requests_total.load() == expect(3));
    TEST_CHECK(t.requests_succeeded_total.load() == expect(1));
    TEST_CHECK(t.requests_timed_out_total.load() == expect(1));
    TEST_CHECK(t.requests_failed_total.load() == expect(1));
    TEST_CHECK(t.writes_total.load() == expect(3));
    TEST_CHECK(t.writes_rejected_total.load() == expect(1));
    TEST_CHECK(t.values_evaluated_total.load() == expect(2));
    TEST_CHECK(t.values_suppressed_total.load() == expect(1));
    TEST_CHECK(t.events_forwarded_total.load() >= expect(3));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// G3. Snapshot
// -----------------------------------------------------------------------------
void test_snapshot() {
    std::cout << "[TEST] Group G3: copy_to() and debug_dump()\n";

    SessionHarness h;
    h.connect_and_discover();
    TEST_CHECK(h.session->send(gattlink::core::dispatch::Command("HELLO")));

    gattlink::core::telemetry::Session snapshot;
    h.session->telemetry().copy_to(snapshot);
    TEST_CHECK(snapshot.connect_calls_total.load() == h.session->telemetry().connect_calls_total.load());
    TEST_CHECK(snapshot.writes_total.load() == expect(1));
    TEST_CHECK(snapshot.events_forwarded_total.load() == h.session->telemetry().events_forwarded_total.load());

    std::ostringstream os;
    snapshot.debug_dump(os);
    const std::string text = os.str();
    TEST_CHECK(text.find("Session Telemetry") != std::string::npos);
    TEST_CHECK(text.find("Writes                : " + std::to_string(expect(1))) != std::string::npos);

    std::cout << "[TEST] OK\n";
}

int main() {
    gattlink::log::Logger::instance().set_level(gattlink::log::Level::Warn);

    test_lifecycle_counters();
    test_request_counters();
    test_snapshot();

    std::cout << "\n[GROUP G — SESSION TELEMETRY TESTS PASSED]\n";
    return 0;
}
