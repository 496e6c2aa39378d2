/*
===============================================================================
 assertion::evaluate — Status / Header / Path Unit Tests
===============================================================================

Covered Requirements:
---------------------
A1. No declared checks: implicit "status < 400"
A2. Exact status codes and status classes ("2xx")
A3. Malformed status expectation is an InvalidExpectation, not a crash
A4. Header presence and value (case-insensitive name, trimmed value)
A5. Path checks: equal value, unequal value, missing path, non-JSON body
A6. Numbers compare across integer / floating representations
A7. Every failed check is reported, in declaration order
A8. Path mismatches are located in canonical form whatever the declared
    spelling ("data.name" and "$['data']['name']" both read "$.data.name")
===============================================================================
*/

#include <iostream>
#include <string>

#include "wirecheck/core/assertion/evaluator.hpp"
#include "wirecheck/core/assertion/path.hpp"
#include "common/test_check.hpp"

using namespace wirecheck::core;
using assertion::MismatchKind;


namespace {

Response make_response(int status, std::string body = {}, Headers headers = {}) {
    Response r;
    r.status = status;
    r.body = std::move(body);
    r.headers = std::move(headers);
    return r;
}

Expectation expect(std::initializer_list<Check> checks) {
    Expectation e;
    e.checks.assign(checks.begin(), checks.end());
    return e;
}

} // namespace


void test_implicit_expectation() {
    std::cout << "[TEST] A1: implicit status < 400\n";

    TEST_CHECK(assertion::evaluate(make_response(200), Expectation{}).passed());
    TEST_CHECK(assertion::evaluate(make_response(302), Expectation{}).passed());

    auto v = assertion::evaluate(make_response(404), Expectation{});
    TEST_CHECK(!v.passed());
    TEST_CHECK(v.mismatches.size() == 1);
    TEST_CHECK(v.mismatches[0].kind == MismatchKind::Status);
    TEST_CHECK(v.mismatches[0].actual == "404");

    std::cout << "[TEST] OK\n";
}

void test_status_checks() {
    std::cout << "[TEST] A2/A3: status codes and classes\n";

    TEST_CHECK(assertion::evaluate(make_response(201), expect({StatusCheck{"201"}})).passed());
    TEST_CHECK(assertion::evaluate(make_response(204), expect({StatusCheck{"2xx"}})).passed());
    TEST_CHECK(assertion::evaluate(make_response(503), expect({StatusCheck{"5XX"}})).passed());

    auto wrong = assertion::evaluate(make_response(500), expect({StatusCheck{"200"}}));
    TEST_CHECK(wrong.mismatches.size() == 1);
    TEST_CHECK(wrong.mismatches[0].kind == MismatchKind::Status);
    TEST_CHECK(wrong.mismatches[0].locator == "status");
    TEST_CHECK(wrong.mismatches[0].expected == "200");
    TEST_CHECK(wrong.mismatches[0].actual == "500");

    auto klass = assertion::evaluate(make_response(404), expect({StatusCheck{"2xx"}}));
    TEST_CHECK(klass.mismatches.size() == 1 && klass.mismatches[0].kind == MismatchKind::Status);

    for (const char* bad : {"abc", "", "99", "600", "2x"}) {
        auto v = assertion::evaluate(make_response(200), expect({StatusCheck{bad}}));
        TEST_CHECK(v.mismatches.size() == 1);
        TEST_CHECK(v.mismatches[0].kind == MismatchKind::InvalidExpectation);
    }

    std::cout << "[TEST] OK\n";
}

void test_header_checks() {
    std::cout << "[TEST] A4: headers\n";

    const Response r = make_response(200, "", {{"Content-Type", " application/json "}, {"X-Trace", "abc"}});

    TEST_CHECK(assertion::evaluate(r, expect({HeaderCheck{"content-type", std::nullopt}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({HeaderCheck{"CONTENT-TYPE", std::string("application/json")}})).passed());

    auto missing = assertion::evaluate(r, expect({HeaderCheck{"X-Missing", std::nullopt}}));
    TEST_CHECK(missing.mismatches.size() == 1);
    TEST_CHECK(missing.mismatches[0].kind == MismatchKind::HeaderMissing);
    TEST_CHECK(missing.mismatches[0].locator == "header:X-Missing");

    auto value = assertion::evaluate(r, expect({HeaderCheck{"x-trace", std::string("xyz")}}));
    TEST_CHECK(value.mismatches.size() == 1);
    TEST_CHECK(value.mismatches[0].kind == MismatchKind::HeaderValue);
    TEST_CHECK(value.mismatches[0].expected == "xyz");
    TEST_CHECK(value.mismatches[0].actual == "abc");

    std::cout << "[TEST] OK\n";
}

void test_path_checks() {
    std::cout << "[TEST] A5/A6: path checks\n";

    const Response r = make_response(200, R"({"data":{"id":42,"name":"Ada","tags":["a","b"],"score":1.5,"ok":true,"none":null}})");

    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$.data.id", "42"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$.data.id", "42.0"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"data.name", R"("Ada")"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$.data.name", "Ada"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$.data.tags[1]", R"("b")"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$.data.tags", R"(["a","b"])"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$.data.ok", "true"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$.data.none", "null"}})).passed());
    TEST_CHECK(assertion::evaluate(r, expect({PathCheck{"$['data']['score']", "1.5"}})).passed());

    auto unequal = assertion::evaluate(r, expect({PathCheck{"$.data.id", "43"}}));
    TEST_CHECK(unequal.mismatches.size() == 1);
    TEST_CHECK(unequal.mismatches[0].kind == MismatchKind::PathValue);
    TEST_CHECK(unequal.mismatches[0].locator == "$.data.id");
    TEST_CHECK(unequal.mismatches[0].actual == "42");

    auto type_differs = assertion::evaluate(r, expect({PathCheck{"$.data.id", R"("42")"}}));
    TEST_CHECK(type_differs.mismatches.size() == 1 && type_differs.mismatches[0].kind == MismatchKind::PathValue);

    auto missing = assertion::evaluate(r, expect({PathCheck{"$.data.email", R"("x")"}}));
    TEST_CHECK(missing.mismatches.size() == 1 && missing.mismatches[0].kind == MismatchKind::PathMissing);

    auto out_of_range = assertion::evaluate(r, expect({PathCheck{"$.data.tags[5]", R"("x")"}}));
    TEST_CHECK(out_of_range.mismatches.size() == 1 && out_of_range.mismatches[0].kind == MismatchKind::PathMissing);

    auto not_json = assertion::evaluate(make_response(200, "<html>"), expect({PathCheck{"$.id", "1"}}));
    TEST_CHECK(not_json.mismatches.size() == 1 && not_json.mismatches[0].kind == MismatchKind::BodyNotJson);

    auto malformed = assertion::evaluate(r, expect({PathCheck{"$.data[", "1"}}));
    TEST_CHECK(malformed.mismatches.size() == 1 && malformed.mismatches[0].kind == MismatchKind::InvalidExpectation);

    std::cout << "[TEST] OK\n";
}

void test_all_failures_reported() {
    std::cout << "[TEST] A7: all failures reported in order\n";

    const Response r = make_response(500, R"({"id":1})");
    auto v = assertion::evaluate(r, expect({
        StatusCheck{"200"},
        HeaderCheck{"X-Request-Id", std::nullopt},
        PathCheck{"$.id", "1"},
        PathCheck{"$.id", "2"}
    }));
    TEST_CHECK(v.mismatches.size() == 3);
    TEST_CHECK(v.mismatches[0].kind == MismatchKind::Status);
    TEST_CHECK(v.mismatches[1].kind == MismatchKind::HeaderMissing);
    TEST_CHECK(v.mismatches[2].kind == MismatchKind::PathValue);
    TEST_CHECK(!v.mismatches[2].str().empty());

    std::cout << "[TEST] OK\n";
}

void test_canonical_locators() {
    std::cout << "[TEST] A8: canonical path locators\n";

    const Response r = make_response(200, R"({"data":{"name":"Ada","items":[{"v.1":2}]}})");

    auto bare = assertion::evaluate(r, expect({PathCheck{"data.name", R"("Bob")"}}));
    TEST_CHECK(bare.mismatches.size() == 1);
    TEST_CHECK(bare.mismatches[0].locator == "$.data.name");

    auto quoted = assertion::evaluate(r, expect({PathCheck{"$['data'][\"name\"]", R"("Bob")"}}));
    TEST_CHECK(quoted.mismatches.size() == 1);
    TEST_CHECK(quoted.mismatches[0].locator == "$.data.name");

    auto dotted_key = assertion::evaluate(r, expect({PathCheck{"data.items[0]['v.1']", "3"}}));
    TEST_CHECK(dotted_key.mismatches.size() == 1);
    TEST_CHECK(dotted_key.mismatches[0].kind == MismatchKind::PathValue);
    TEST_CHECK(dotted_key.mismatches[0].locator == "$.data.items[0]['v.1']");

    auto missing = assertion::evaluate(r, expect({PathCheck{"data.email", R"("x")"}}));
    TEST_CHECK(missing.mismatches.size() == 1);
    TEST_CHECK(missing.mismatches[0].locator == "$.data.email");

    // Round trip through the parser
    assertion::PathSegments segments;
    TEST_CHECK(assertion::parse_path("$.data.items[0]['v.1']", segments));
    TEST_CHECK(assertion::format_path(segments) == "$.data.items[0]['v.1']");
    TEST_CHECK(assertion::parse_path("$", segments));
    TEST_CHECK(assertion::format_path(segments) == "$");

    std::cout << "[TEST] OK\n";
}


int main() {
    test_implicit_expectation();
    test_status_checks();
    test_header_checks();
    test_path_checks();
    test_all_failures_reported();
    test_canonical_locators();

    std::cout << "\n[TEST] ALL EVALUATOR TESTS PASSED!\n";
    return 0;
}
