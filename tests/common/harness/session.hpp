/*
===============================================================================
 Session Test Harness
===============================================================================

Purpose:
--------
Deterministic harness around gattlink::core::Session<MockCentral>.

Design:
-------
- The mock central outlives the Session
- Session lifetime is explicit (destructor behaviour is testable)
- Every observer event is recorded; ConnectionFailure errors are kept in order
- Central events are injected from the test thread; only the watchdog and
  request deadlines run on the session's timer thread

===============================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "gattlink/core/session.hpp"
#include "gattlink/core/transport/event.hpp"
#include "common/mock_central.hpp"
#include "common/test_check.hpp"


// -----------------------------------------------------------------------------
// Setup environment
// -----------------------------------------------------------------------------
using namespace gattlink::core;
using namespace gattlink::core::transport;

using CentralUnderTest = transport::test::MockCentral;
using SessionUnderTest = Session<CentralUnderTest>;

static_assert(CentralConcept<CentralUnderTest>);


namespace gattlink::core::test {

inline const PeerId PEER = "C0:FF:EE:00:00:01";

inline const Service UART_SERVICE{"6E400001-B5A3-F393-E0A9-E50E24DCCA9E", true};

inline Characteristic uart_rx() {
    Characteristic c;
    c.service = UART_SERVICE.uuid;
    c.uuid = "6E400002-B5A3-F393-E0A9-E50E24DCCA9E";
    c.properties = Property::Write | Property::WriteWithoutResponse;
    return c;
}

inline Characteristic uart_tx() {
    Characteristic c;
    c.service = UART_SERVICE.uuid;
    c.uuid = "6E400003-B5A3-F393-E0A9-E50E24DCCA9E";
    c.properties = Properties{Property::Notify};
    return c;
}

// Short watchdog so that timeout paths complete quickly
inline SessionConfig test_config() {
    SessionConfig cfg;
    cfg.retry_count = 3;
    cfg.connect_timeout = std::chrono::milliseconds(100);
    return cfg;
}

namespace harness {

struct Session {
    // -------------------------------------------------------------------------
    // Persistent central (must outlive Session)
    // -------------------------------------------------------------------------
    CentralUnderTest central;

    // -------------------------------------------------------------------------
    // Session under test (explicit lifetime)
    // -------------------------------------------------------------------------
    std::unique_ptr<SessionUnderTest> session;

    explicit Session(SessionConfig config = test_config()) {
        make_session(std::move(config));
    }

    inline void make_session(SessionConfig config = test_config()) {
        session = std::make_unique<SessionUnderTest>(central, std::move(config));
        session->set_observer([this](const Event& ev) { record_(ev); });
    }

    inline void destroy_session() {
        session.reset(); // ~Session() runs here
    }

    // -------------------------------------------------------------------------
    // Scenario helpers
    // -------------------------------------------------------------------------

    // connect() + central confirmation + full discovery of the UART service
    inline void connect_and_discover(const PeerId& peer = PEER) {
        TEST_CHECK(session->connect(peer) == Error::None);
        central.emit_connected(peer);
        central.emit_services(peer, {UART_SERVICE});
        central.emit_characteristics(peer, UART_SERVICE, {uart_rx(), uart_tx()});
    }

    // Central confirms a pending (re)connect and rediscovers the UART service
    inline void confirm_and_discover(const PeerId& peer = PEER) {
        central.emit_connected(peer);
        central.emit_services(peer, {UART_SERVICE});
        central.emit_characteristics(peer, UART_SERVICE, {uart_rx(), uart_tx()});
    }

    // -------------------------------------------------------------------------
    // Observations
    // -------------------------------------------------------------------------

    inline std::size_t count(EventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& ev : events_) {
            if (ev.type == type) {
                ++n;
            }
        }
        return n;
    }

    inline std::vector<Error> failures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Error> out;
        for (const auto& ev : events_) {
            if (ev.type == EventType::ConnectionFailure) {
                out.push_back(ev.error);
            }
        }
        return out;
    }

    inline std::vector<Event> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    inline void reset_events() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;

    inline void record_(const Event& ev) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(ev);
    }
};

} // namespace harness

using SessionHarness = harness::Session;

} // namespace gattlink::core::test
