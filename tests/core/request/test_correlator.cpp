/*
===============================================================================
 request — Correlator
===============================================================================

Covered Contracts
-----------------
C1. A matching value resolves the request with that value and cancels its timer
C2. The deadline resolves with RequestTimeout, within [timeout, timeout + 500ms)
C3. Late values after the deadline are ignored
C4. cancel() resolves once; a second cancel is a no-op
C5. fail_all() resolves every pending request with the given reason
C6. Two requests on the same endpoint resolve independently

Locking mirrors the Session: one mutex around every Correlator call, and
Resolutions fired after it is released.
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "gattlink/core/request/correlator.hpp"
#include "gattlink/core/timer/timer_queue.hpp"
#include "gattlink/core/telemetry/session.hpp"
#include "gattlink/log/logger.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace gattlink::core;
using namespace gattlink::core::request;


static const CharacteristicKey TX{"6E400001-B5A3-F393-E0A9-E50E24DCCA9E", "6E400003-B5A3-F393-E0A9-E50E24DCCA9E"};

struct Fixture {
    std::mutex mutex;
    timer::TimerQueue timers{"test-correlator"};
    telemetry::Session telemetry;
    Correlator correlator{timers, telemetry};

    std::mutex outcomes_mutex;
    std::vector<std::pair<RequestId, Outcome>> outcomes;

    Fixture() {
        correlator.set_expiry_handler([this](RequestId id) {
            std::optional<Resolution> r;
            {
                std::lock_guard<std::mutex> lock(mutex);
                r = correlator.expire(id);
            }
            if (r) {
                r->fire();
            }
        });
    }

    ~Fixture() {
        timers.stop();
    }

    RequestId add(Expectation expected, std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lock(mutex);
        auto slot = std::make_shared<RequestId>(INVALID_REQUEST);
        const RequestId id = correlator.add(TX, std::move(expected), timeout, [this, slot](const Outcome& o) {
            std::lock_guard<std::mutex> l(outcomes_mutex);
            outcomes.emplace_back(*slot, o);
        });
        *slot = id;
        return id;
    }

    void value(const Bytes& v) {
        std::vector<Resolution> rs;
        {
            std::lock_guard<std::mutex> lock(mutex);
            rs = correlator.on_value(TX, v);
        }
        for (auto& r : rs) {
            r.fire();
        }
    }

    std::size_t resolved() {
        std::lock_guard<std::mutex> l(outcomes_mutex);
        return outcomes.size();
    }

    std::optional<Outcome> outcome_of(RequestId id) {
        std::lock_guard<std::mutex> l(outcomes_mutex);
        for (const auto& [rid, o] : outcomes) {
            if (rid == id) {
                return o;
            }
        }
        return std::nullopt;
    }
};

// -----------------------------------------------------------------------------
// C1. Match
// -----------------------------------------------------------------------------
void test_match_resolves() {
    std::cout << "[TEST] Group C1: matching value resolves the request\n";

    Fixture f;
    const RequestId id = f.add("PONG", 5000ms);
    TEST_CHECK(f.timers.pending() == 1);

    f.value(to_bytes("noise"));
    TEST_CHECK(f.resolved() == 0);

    f.value(to_bytes("PONG\n"));
    TEST_CHECK(f.resolved() == 1);
    auto o = f.outcome_of(id);
    TEST_CHECK(o && o->ok());
    TEST_CHECK(o->value == to_bytes("PONG\n"));

    TEST_CHECK(f.correlator.size() == 0);
    TEST_CHECK(f.timers.pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C2 + C3. Deadline
// -----------------------------------------------------------------------------
void test_deadline() {
    std::cout << "[TEST] Group C2: deadline resolves with RequestTimeout\n";

    Fixture f;
    const auto start = std::chrono::steady_clock::now();
    const RequestId id = f.add("PONG", 200ms);

    TEST_CHECK(gattlink::test::wait_until([&] { return f.resolved() == 1; }));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    TEST_CHECK(elapsed >= 200ms);
    TEST_CHECK(elapsed < 700ms);

    auto o = f.outcome_of(id);
    TEST_CHECK(o && o->error == Error::RequestTimeout);
    TEST_CHECK(o->value.empty());

    // Late value: nothing left to resolve
    f.value(to_bytes("PONG"));
    TEST_CHECK(f.resolved() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C4. Cancel
// -----------------------------------------------------------------------------
void test_cancel() {
    std::cout << "[TEST] Group C4: cancel resolves once\n";

    Fixture f;
    const RequestId id = f.add("PONG", 5000ms);

    std::optional<Resolution> r;
    {
        std::lock_guard<std::mutex> lock(f.mutex);
        r = f.correlator.cancel(id, Error::Cancelled);
    }
    TEST_CHECK(r.has_value());
    r->fire();
    TEST_CHECK(f.outcome_of(id)->error == Error::Cancelled);

    {
        std::lock_guard<std::mutex> lock(f.mutex);
        TEST_CHECK(!f.correlator.cancel(id, Error::Cancelled).has_value());
        TEST_CHECK(!f.correlator.expire(id).has_value());
    }
    TEST_CHECK(f.resolved() == 1);
    TEST_CHECK(f.timers.pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C5. fail_all
// -----------------------------------------------------------------------------
void test_fail_all() {
    std::cout << "[TEST] Group C5: fail_all resolves every request\n";

    Fixture f;
    const RequestId a = f.add("A", 5000ms);
    const RequestId b = f.add(Expectation::none(), 5000ms);

    std::vector<Resolution> rs;
    {
        std::lock_guard<std::mutex> lock(f.mutex);
        rs = f.correlator.fail_all(Error::Disconnected);
    }
    TEST_CHECK(rs.size() == 2);
    for (auto& r : rs) {
        r.fire();
    }

    TEST_CHECK(f.outcome_of(a)->error == Error::Disconnected);
    TEST_CHECK(f.outcome_of(b)->error == Error::Disconnected);
    TEST_CHECK(!f.correlator.subscribed(TX));
    TEST_CHECK(f.timers.pending() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// C6. Independent requests on one endpoint
// -----------------------------------------------------------------------------
void test_independent_requests() {
    std::cout << "[TEST] Group C6: requests on one endpoint resolve independently\n";

    Fixture f;
    const RequestId ok = f.add("OK", 5000ms);
    const RequestId err = f.add("ERR", 5000ms);
    TEST_CHECK(ok < err);

    f.value(to_bytes("ERR 12"));
    TEST_CHECK(f.resolved() == 1);
    TEST_CHECK(f.outcome_of(err)->ok());
    TEST_CHECK(!f.outcome_of(ok));

    f.value(to_bytes("OK"));
    TEST_CHECK(f.outcome_of(ok)->ok());
    TEST_CHECK(f.correlator.size() == 0);

    std::cout << "[TEST] OK\n";
}

int main() {
    gattlink::log::Logger::instance().set_level(gattlink::log::Level::Warn);

    test_match_resolves();
    test_deadline();
    test_cancel();
    test_fail_all();
    test_independent_requests();

    std::cout << "\n[GROUP C — CORRELATOR TESTS PASSED]\n";
    return 0;
}
