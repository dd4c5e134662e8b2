/*
===============================================================================
 gatt — Endpoint classification & characteristic cache
===============================================================================

Covered Contracts
-----------------
A1. writable() keeps Write and WriteWithoutResponse, preserving order
A2. notifiable() keeps Notify only (Indicate-only is excluded)
A3. Empty input yields empty output
A4. Cache accumulates across services, deduplicating by (service, uuid)
A5. Cache value updates and first_* defaults
===============================================================================
*/

#include <iostream>
#include <vector>

#include "gattlink/core/gatt/classifier.hpp"
#include "gattlink/core/gatt/characteristic_cache.hpp"
#include "gattlink/log/logger.hpp"
#include "common/test_check.hpp"

using namespace gattlink::core;


static Characteristic make(const char* service, const char* uuid, Properties props) {
    Characteristic c;
    c.service = service;
    c.uuid = uuid;
    c.properties = props;
    return c;
}

// -----------------------------------------------------------------------------
// A1. writable()
// -----------------------------------------------------------------------------
void test_writable() {
    std::cout << "[TEST] Group A1: writable() filters by write capability\n";

    std::vector<Characteristic> all = {
        make("180A", "2A29", Properties{Property::Read}),
        make("FFE0", "FFE1", Property::Write | Property::Notify),
        make("FFE0", "FFE2", Properties{Property::WriteWithoutResponse}),
        make("FFE0", "FFE3", Properties{Property::Notify}),
    };

    auto w = gatt::writable(all);
    TEST_CHECK(w.size() == 2);
    TEST_CHECK(w[0].uuid == "FFE1");
    TEST_CHECK(w[1].uuid == "FFE2");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A2. notifiable()
// -----------------------------------------------------------------------------
void test_notifiable() {
    std::cout << "[TEST] Group A2: notifiable() requires Notify\n";

    std::vector<Characteristic> all = {
        make("FFE0", "FFE1", Property::Write | Property::Notify),
        make("FFE0", "FFE4", Properties{Property::Indicate}),
        make("FFE0", "FFE3", Property::Notify | Property::Read),
    };

    auto n = gatt::notifiable(all);
    TEST_CHECK(n.size() == 2);
    TEST_CHECK(n[0].uuid == "FFE1");
    TEST_CHECK(n[1].uuid == "FFE3");
    TEST_CHECK(!gatt::is_notifiable(all[1]));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A3. Empty in, empty out
// -----------------------------------------------------------------------------
void test_empty() {
    std::cout << "[TEST] Group A3: empty input\n";

    TEST_CHECK(gatt::writable({}).empty());
    TEST_CHECK(gatt::notifiable({}).empty());

    gatt::CharacteristicCache cache;
    TEST_CHECK(cache.empty());
    TEST_CHECK(!cache.first_writable());
    TEST_CHECK(!cache.first_notifiable());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A4. Cache accumulation
// -----------------------------------------------------------------------------
void test_cache_accumulates() {
    std::cout << "[TEST] Group A4: cache accumulates across services\n";

    gatt::CharacteristicCache cache;
    cache.add({make("180A", "2A29", Properties{Property::Read})});
    cache.add({make("FFE0", "FFE1", Properties{Property::Write}),
               make("FFE0", "FFE3", Properties{Property::Notify})});
    TEST_CHECK(cache.size() == 3);

    // Same key in the same service: refreshed, not duplicated
    cache.add({make("FFE0", "FFE1", Property::Write | Property::WriteWithoutResponse)});
    TEST_CHECK(cache.size() == 3);
    TEST_CHECK(cache.find({"FFE0", "FFE1"})->properties.has(Property::WriteWithoutResponse));

    // Same characteristic uuid under another service is a distinct endpoint
    cache.add({make("FFF0", "FFE1", Properties{Property::Write})});
    TEST_CHECK(cache.size() == 4);

    cache.clear();
    TEST_CHECK(cache.empty());
    TEST_CHECK(cache.writable().empty());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// A5. Values and defaults
// -----------------------------------------------------------------------------
void test_cache_values() {
    std::cout << "[TEST] Group A5: last value and default endpoints\n";

    gatt::CharacteristicCache cache;
    cache.add({make("FFE0", "FFE3", Properties{Property::Notify}),
               make("FFE0", "FFE1", Properties{Property::Write})});

    TEST_CHECK(cache.first_writable()->uuid == "FFE1");
    TEST_CHECK(cache.first_notifiable()->uuid == "FFE3");

    TEST_CHECK(!cache.find({"FFE0", "FFE3"})->value);
    TEST_CHECK(cache.update_value({"FFE0", "FFE3"}, to_bytes("42")));
    TEST_CHECK(*cache.find({"FFE0", "FFE3"})->value == to_bytes("42"));
    TEST_CHECK(!cache.update_value({"FFE0", "0000"}, to_bytes("x")));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    gattlink::log::Logger::instance().set_level(gattlink::log::Level::Warn);

    test_writable();
    test_notifiable();
    test_empty();
    test_cache_accumulates();
    test_cache_values();

    std::cout << "\n[GROUP A — ENDPOINT CLASSIFICATION TESTS PASSED]\n";
    return 0;
}
