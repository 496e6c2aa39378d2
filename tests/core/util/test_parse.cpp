/*
===============================================================================
 util::parse_duration / util::parse_header — Unit Tests
===============================================================================

Covered Requirements:
---------------------
U1. Durations accept ms / s / m suffixes and bare seconds
U2. Malformed durations are rejected
U3. Header lines split on the first ':' with trimmed parts
===============================================================================
*/

#include <chrono>
#include <iostream>

#include "wirecheck/core/util/parse.hpp"
#include "common/test_check.hpp"

using namespace wirecheck::core::util;
using namespace std::chrono_literals;


void test_durations() {
    std::cout << "[TEST] U1: durations\n";

    TEST_CHECK(parse_duration("500ms") == 500ms);
    TEST_CHECK(parse_duration("30s") == 30s);
    TEST_CHECK(parse_duration("2m") == 120s);
    TEST_CHECK(parse_duration("15") == 15s);
    TEST_CHECK(parse_duration(" 10s ") == 10s);
    TEST_CHECK(parse_duration("0") == 0ms);

    std::cout << "[TEST] OK\n";
}

void test_bad_durations() {
    std::cout << "[TEST] U2: malformed durations\n";

    TEST_CHECK(!parse_duration(""));
    TEST_CHECK(!parse_duration("ms"));
    TEST_CHECK(!parse_duration("-5s"));
    TEST_CHECK(!parse_duration("1.5s"));
    TEST_CHECK(!parse_duration("10h"));
    TEST_CHECK(!parse_duration("abc"));

    std::cout << "[TEST] OK\n";
}

void test_headers() {
    std::cout << "[TEST] U3: header lines\n";

    auto h = parse_header("Authorization: Bearer abc:def");
    TEST_CHECK(h.has_value());
    TEST_CHECK(h->first == "Authorization");
    TEST_CHECK(h->second == "Bearer abc:def");

    auto empty_value = parse_header("X-Empty:");
    TEST_CHECK(empty_value && empty_value->second.empty());

    TEST_CHECK(!parse_header("no separator"));
    TEST_CHECK(!parse_header("  : value"));

    std::cout << "[TEST] OK\n";
}


int main() {
    test_durations();
    test_bad_durations();
    test_headers();

    std::cout << "\n[TEST] ALL PARSE TESTS PASSED!\n";
    return 0;
}
