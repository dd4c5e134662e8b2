/*
===============================================================================
 config — JSON session configuration
===============================================================================

L1. Every key is applied; absent keys keep their defaults
L2. Wrong root or wrong field type -> InvalidSchema
L3. Out-of-range values (negative, zero, beyond int or ATT limits) -> InvalidValue,
    output untouched
L4. Malformed JSON -> InvalidJson
L5. load(): missing file -> FileNotFound, real file parsed
===============================================================================
*/

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "gattlink/config/loader.hpp"
#include "gattlink/log/logger.hpp"
#include "common/test_check.hpp"

using namespace std::chrono_literals;
using namespace gattlink;
using config::Result;


void test_full_document() {
    std::cout << "[TEST] Group L1: full document\n";

    config::Settings s;
    const Result r = config::parse(R"({
        "retry_count": 5,
        "connect_timeout_ms": 1500,
        "line_terminator": "\r\n",
        "max_write_size": 20,
        "write_with_response": true,
        "log_level": "debug",
        "comment": "unknown keys are ignored"
    })", s);

    TEST_CHECK(r == Result::Ok);
    TEST_CHECK(s.session.retry_count == 5);
    TEST_CHECK(s.session.connect_timeout == 1500ms);
    TEST_CHECK(s.session.line_terminator == "\r\n");
    TEST_CHECK(s.session.max_write_size == 20);
    TEST_CHECK(s.session.write_with_response);
    TEST_CHECK(s.log_level == "debug");

    config::Settings partial;
    TEST_CHECK(config::parse(R"({"retry_count": 0})", partial) == Result::Ok);
    TEST_CHECK(partial.session.retry_count == 0);
    TEST_CHECK(partial.session.connect_timeout == core::CONNECT_TIMEOUT);
    TEST_CHECK(partial.session.max_write_size == core::MAX_WRITE_SIZE);
    TEST_CHECK(!partial.log_level);

    std::cout << "[TEST] OK\n";
}

void test_schema_errors() {
    std::cout << "[TEST] Group L2: schema errors\n";

    config::Settings s;
    TEST_CHECK(config::parse("[1, 2]", s) == Result::InvalidSchema);
    TEST_CHECK(config::parse(R"({"retry_count": "3"})", s) == Result::InvalidSchema);
    TEST_CHECK(config::parse(R"({"write_with_response": 1})", s) == Result::InvalidSchema);
    TEST_CHECK(config::parse(R"({"line_terminator": null})", s) == Result::InvalidSchema);

    std::cout << "[TEST] OK\n";
}

void test_value_errors() {
    std::cout << "[TEST] Group L3: value errors leave output untouched\n";

    config::Settings s;
    s.session.retry_count = 7;

    TEST_CHECK(config::parse(R"({"retry_count": -1})", s) == Result::InvalidValue);
    TEST_CHECK(config::parse(R"({"retry_count": 1, "connect_timeout_ms": 0})", s) == Result::InvalidValue);
    TEST_CHECK(config::parse(R"({"max_write_size": 0})", s) == Result::InvalidValue);
    TEST_CHECK(config::parse(R"({"max_write_size": 513})", s) == Result::InvalidValue);

    // Values that do not fit an int are rejected, never truncated
    TEST_CHECK(config::parse(R"({"retry_count": 4294967296})", s) == Result::InvalidValue);
    TEST_CHECK(config::parse(R"({"retry_count": 4294967299})", s) == Result::InvalidValue);
    TEST_CHECK(config::parse(R"({"retry_count": 2147483648})", s) == Result::InvalidValue);
    TEST_CHECK(config::parse(R"({"log_level": "verbose"})", s) == Result::InvalidValue);
    TEST_CHECK(s.session.retry_count == 7);

    std::cout << "[TEST] OK\n";
}

void test_malformed_json() {
    std::cout << "[TEST] Group L4: malformed JSON\n";

    config::Settings s;
    TEST_CHECK(config::parse(R"({"retry_count": 3)", s) == Result::InvalidJson);
    TEST_CHECK(config::parse("", s) == Result::InvalidJson);

    std::cout << "[TEST] OK\n";
}

void test_load_file() {
    std::cout << "[TEST] Group L5: load from file\n";

    config::Settings s;
    TEST_CHECK(config::load("/nonexistent/gattlink.json", s) == Result::FileNotFound);

    const auto path = std::filesystem::temp_directory_path() / "gattlink_test_config.json";
    {
        std::ofstream file(path);
        file << R"({"retry_count": 1, "log_level": "warn"})";
    }
    TEST_CHECK(config::load(path.string(), s) == Result::Ok);
    TEST_CHECK(s.session.retry_count == 1);
    TEST_CHECK(s.log_level == "warn");
    std::filesystem::remove(path);

    std::cout << "[TEST] OK\n";
}

int main() {
    gattlink::log::Logger::instance().set_level(gattlink::log::Level::Fatal);

    test_full_document();
    test_schema_errors();
    test_value_errors();
    test_malformed_json();
    test_load_file();

    std::cout << "\n[GROUP L — CONFIG LOADER TESTS PASSED]\n";
    return 0;
}
