/*
===============================================================================
 Engine::execute — Integration Tests (MockTransport)
===============================================================================

Covered Requirements:
---------------------
E1.  Outcomes are reported in plan order whatever the completion order
E2.  Repeated runs of the same suite give identical counts
E3.  Configuration errors are reported before any request is sent
E4.  Dataset rows expand every test case; the dataset bound applies
E5.  Setup runs first, teardown last, each one unit at a time
E6.  Bail stops dispatch after the first failure; teardown still runs
E7.  Name filter keeps matching steps only
E8.  Retryable statuses are retried; late success is reported flaky
E9.  Slow responses fail with a timeout
E10. Exceptions escaping the transport fail the unit, not the run
E11. Coverage is computed against the declared catalog
E12. Secrets never reach reported snapshots
E13. External abandon cancels in-flight units and skips the rest; a run with
     no executed unit is summarised as NOT RUN
E14. Environment bindings and per-outcome notification
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "wirecheck/core/engine.hpp"
#include "common/mock_transport.hpp"
#include "common/test_check.hpp"

using namespace wirecheck::core;
using namespace std::chrono_literals;
using transport::test::MockTransport;


namespace {

TestCase make_case(std::string name, std::string url, std::string status = "200") {
    TestCase tc;
    tc.name = std::move(name);
    tc.request.method = "GET";
    tc.request.url = std::move(url);
    tc.expect.checks.push_back(StatusCheck{std::move(status)});
    return tc;
}

Suite numbered_suite(std::size_t n) {
    Suite suite;
    suite.name = "numbered";
    for (std::size_t i = 0; i < n; ++i) {
        suite.tests.push_back(make_case("case " + std::to_string(i), "http://api/items/" + std::to_string(i)));
    }
    return suite;
}

RunContext context(std::uint32_t concurrency = 1) {
    RunContext ctx;
    ctx.concurrency = concurrency;
    ctx.timeout = 2s;
    ctx.env = [](const std::string&) -> std::optional<std::string> { return std::nullopt; };
    return ctx;
}

} // namespace


void test_plan_order() {
    std::cout << "[TEST] E1: plan order with random latencies\n";

    MockTransport mock;
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> delay(0, 40);
    for (std::size_t i = 0; i < 24; ++i) {
        mock.on("http://api/items/" + std::to_string(i)).respond(200).delay(std::chrono::milliseconds(delay(rng)));
    }

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(numbered_suite(24), nullptr, context(8));

    TEST_CHECK(r.ok());
    TEST_CHECK(r.passed);
    TEST_CHECK(r.outcomes.size() == 24);
    for (std::size_t i = 0; i < 24; ++i) {
        TEST_CHECK(r.outcomes[i].name == "case " + std::to_string(i));
        TEST_CHECK(r.outcomes[i].status == OutcomeStatus::Passed);
        TEST_CHECK(r.outcomes[i].attempts == 1);
    }
    TEST_CHECK(r.max_in_flight <= 8);
    TEST_CHECK(mock.max_in_flight() <= 8);
    TEST_CHECK(mock.total_calls() == 24);
    TEST_CHECK(r.latency.count == 24);

    std::cout << "[TEST] OK\n";
}

void test_repeatable_counts() {
    std::cout << "[TEST] E2: repeatable counts\n";

    MockTransport mock;
    mock.on("http://api/items/3").respond(500);
    mock.on("http://api/items/5").respond(404);

    Engine<MockTransport> engine(mock);
    const Suite suite = numbered_suite(10);
    const RunResult first = engine.execute(suite, nullptr, context(4));
    const RunResult second = engine.execute(suite, nullptr, context(4));

    TEST_CHECK(first.counts == second.counts);
    TEST_CHECK(first.counts.failed == 2);
    TEST_CHECK(first.counts.passed == 8);
    TEST_CHECK(!first.passed);
    TEST_CHECK(first.outcomes[3].failures.size() == 1);
    TEST_CHECK(first.outcomes[3].failures[0].kind == assertion::MismatchKind::Status);
    TEST_CHECK(first.outcomes[3].failures[0].actual == "500");

    std::cout << "[TEST] OK\n";
}

void test_config_errors() {
    std::cout << "[TEST] E3: configuration errors\n";

    MockTransport mock;
    Engine<MockTransport> engine(mock);

    RunResult r = engine.execute(numbered_suite(2), nullptr, context(0));
    TEST_CHECK(r.config_error == config::Error::ZeroConcurrency);
    TEST_CHECK(!r.passed);

    r = engine.execute(numbered_suite(0), nullptr, context());
    TEST_CHECK(r.config_error == config::Error::EmptySuite);

    Suite with_ref = numbered_suite(1);
    with_ref.dataset_ref = "users";
    r = engine.execute(with_ref, nullptr, context());
    TEST_CHECK(r.config_error == config::Error::EmptyDataset);

    Dataset empty;
    empty.name = "users";
    r = engine.execute(with_ref, &empty, context());
    TEST_CHECK(r.config_error == config::Error::EmptyDataset);

    RunContext filtered = context();
    filtered.filter = "nothing matches this";
    r = engine.execute(numbered_suite(3), nullptr, filtered);
    TEST_CHECK(r.config_error == config::Error::EmptySuite);
    TEST_CHECK(r.summary().find("EmptySuite") != std::string::npos);

    Suite bad_retry = numbered_suite(1);
    bad_retry.tests[0].retry = retry::Policy::attempts(0);
    r = engine.execute(bad_retry, nullptr, context());
    TEST_CHECK(r.config_error == config::Error::InvalidRetryPolicy);

    Suite bad_timeout = numbered_suite(1);
    bad_timeout.tests[0].timeout = 0ms;
    r = engine.execute(bad_timeout, nullptr, context());
    TEST_CHECK(r.config_error == config::Error::InvalidTimeout);

    RunContext bad_ctx = context();
    bad_ctx.retry.multiplier = 0.5;
    r = engine.execute(numbered_suite(1), nullptr, bad_ctx);
    TEST_CHECK(r.config_error == config::Error::InvalidRetryPolicy);

    TEST_CHECK(mock.total_calls() == 0);

    std::cout << "[TEST] OK\n";
}

void test_dataset() {
    std::cout << "[TEST] E4: dataset rows\n";

    MockTransport mock;
    mock.set_default(200, {}, 20ms);

    Suite suite;
    suite.name = "users";
    suite.dataset_ref = "ids";
    suite.tests.push_back(make_case("get user", "http://api/users/{{id}}"));
    suite.tests.push_back(make_case("get orders", "http://api/users/{{id}}/orders"));

    Dataset ds;
    ds.name = "ids";
    ds.rows = {{{"id", "1"}}, {{"id", "2"}}, {{"id", "3"}}};
    ds.parallel = 2;

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, &ds, context(16));

    TEST_CHECK(r.ok());
    TEST_CHECK(r.outcomes.size() == 6);
    TEST_CHECK(r.outcomes[0].name == "get user [row 1]");
    TEST_CHECK(r.outcomes[1].name == "get orders [row 1]");
    TEST_CHECK(r.outcomes[4].name == "get user [row 3]");
    TEST_CHECK(r.outcomes[4].request->url == "http://api/users/3");
    TEST_CHECK(r.outcomes[5].request->url == "http://api/users/3/orders");
    TEST_CHECK(mock.calls("http://api/users/2/orders") == 1);
    TEST_CHECK(mock.max_in_flight() <= 2);

    TEST_CHECK(r.cases.size() == 2);
    TEST_CHECK(r.cases[0].name == "get user");
    TEST_CHECK(r.cases[0].passed == 3);
    TEST_CHECK(r.cases[0].verdict == OutcomeStatus::Passed);

    std::cout << "[TEST] OK\n";
}

void test_setup_teardown() {
    std::cout << "[TEST] E5: setup and teardown\n";

    MockTransport mock;
    mock.set_default(200, {}, 5ms);

    Suite suite = numbered_suite(6);
    suite.setup.push_back(make_case("login", "http://api/login"));
    suite.teardown.push_back(make_case("logout", "http://api/logout"));

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, nullptr, context(4));

    TEST_CHECK(r.passed);
    TEST_CHECK(r.outcomes.size() == 8);
    TEST_CHECK(r.outcomes.front().name == "Setup: login");
    TEST_CHECK(r.outcomes.back().name == "Teardown: logout");
    TEST_CHECK(r.cases.front().phase == Phase::Setup);
    TEST_CHECK(r.cases.back().phase == Phase::Teardown);

    const auto requests = mock.requests();
    TEST_CHECK(requests.front().url == "http://api/login");
    TEST_CHECK(requests.back().url == "http://api/logout");

    std::cout << "[TEST] OK\n";
}

void test_bail() {
    std::cout << "[TEST] E6: bail\n";

    MockTransport mock;
    mock.on("http://api/items/1").respond(500);

    Suite suite = numbered_suite(6);
    suite.teardown.push_back(make_case("cleanup", "http://api/cleanup"));

    RunContext ctx = context(1);
    ctx.bail = true;

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, nullptr, ctx);

    TEST_CHECK(r.ok());
    TEST_CHECK(!r.passed);
    TEST_CHECK(r.outcomes[0].status == OutcomeStatus::Passed);
    TEST_CHECK(r.outcomes[1].status == OutcomeStatus::Failed);
    for (std::size_t i = 2; i < 6; ++i) {
        TEST_CHECK(r.outcomes[i].status == OutcomeStatus::Skipped);
    }
    TEST_CHECK(r.outcomes[6].name == "Teardown: cleanup");
    TEST_CHECK(r.outcomes[6].status == OutcomeStatus::Passed);
    TEST_CHECK(mock.calls("http://api/cleanup") == 1);
    TEST_CHECK(mock.calls("http://api/items/4") == 0);
    TEST_CHECK(!r.cancelled);

    // A failing setup step skips every test, teardown still runs
    MockTransport mock2;
    mock2.on("http://api/login").respond(401);
    Suite with_setup = numbered_suite(3);
    with_setup.setup.push_back(make_case("login", "http://api/login"));
    with_setup.teardown.push_back(make_case("cleanup", "http://api/cleanup"));

    Engine<MockTransport> engine2(mock2);
    const RunResult r2 = engine2.execute(with_setup, nullptr, ctx);
    TEST_CHECK(r2.outcomes[0].status == OutcomeStatus::Failed);
    TEST_CHECK(r2.counts.skipped == 3);
    TEST_CHECK(r2.outcomes.back().status == OutcomeStatus::Passed);

    std::cout << "[TEST] OK\n";
}

void test_filter() {
    std::cout << "[TEST] E7: name filter\n";

    MockTransport mock;
    Suite suite;
    suite.name = "filter";
    suite.tests.push_back(make_case("users list", "http://api/users"));
    suite.tests.push_back(make_case("orders list", "http://api/orders"));
    suite.tests.push_back(make_case("users get", "http://api/users/1"));

    RunContext ctx = context(2);
    ctx.filter = "users";

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, nullptr, ctx);
    TEST_CHECK(r.outcomes.size() == 2);
    TEST_CHECK(r.outcomes[0].name == "users list");
    TEST_CHECK(r.outcomes[1].name == "users get");
    TEST_CHECK(mock.calls("http://api/orders") == 0);

    std::cout << "[TEST] OK\n";
}

void test_flaky() {
    std::cout << "[TEST] E8: retry and flaky\n";

    MockTransport mock;
    mock.on("http://api/items/0").respond(503).respond(200);
    mock.on("http://api/items/1").respond(503);

    RunContext ctx = context(2);
    ctx.retry.max_attempts = 3;
    ctx.retry.base_backoff = 1ms;
    ctx.retry.retryable_statuses = retry::Policy::gateway_statuses();

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(numbered_suite(2), nullptr, ctx);

    TEST_CHECK(r.outcomes[0].status == OutcomeStatus::Flaky);
    TEST_CHECK(r.outcomes[0].attempts == 2);
    TEST_CHECK(r.outcomes[0].reason == "passed on attempt 2");

    TEST_CHECK(r.outcomes[1].status == OutcomeStatus::Failed);
    TEST_CHECK(r.outcomes[1].attempts == 3);
    TEST_CHECK(mock.calls("http://api/items/1") == 3);

    TEST_CHECK(r.counts.flaky == 1);
    TEST_CHECK(r.counts.failed == 1);

    // Assertion failures are not retried unless asked for
    MockTransport mock2;
    mock2.on("http://api/items/0").respond(404).respond(200);
    Engine<MockTransport> engine2(mock2);
    const RunResult no_retry = engine2.execute(numbered_suite(1), nullptr, ctx);
    TEST_CHECK(no_retry.outcomes[0].status == OutcomeStatus::Failed);
    TEST_CHECK(mock2.calls("http://api/items/0") == 1);

    MockTransport mock3;
    mock3.on("http://api/items/0").respond(404).respond(200);
    Suite opt_in = numbered_suite(1);
    opt_in.tests[0].retry_on_assertion = true;
    Engine<MockTransport> engine3(mock3);
    const RunResult retried = engine3.execute(opt_in, nullptr, ctx);
    TEST_CHECK(retried.outcomes[0].status == OutcomeStatus::Flaky);
    TEST_CHECK(mock3.calls("http://api/items/0") == 2);

    std::cout << "[TEST] OK\n";
}

void test_timeout() {
    std::cout << "[TEST] E9: timeout\n";

    MockTransport mock;
    mock.on("http://api/items/0").respond(200).delay(300ms);

    Suite suite = numbered_suite(1);
    suite.tests[0].timeout = 50ms;

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, nullptr, context());

    TEST_CHECK(r.outcomes[0].status == OutcomeStatus::Failed);
    TEST_CHECK(r.outcomes[0].reason.rfind("Timeout", 0) == 0);
    TEST_CHECK(!r.outcomes[0].response.has_value());

    std::cout << "[TEST] OK\n";
}

void test_transport_exception() {
    std::cout << "[TEST] E10: transport exception\n";

    MockTransport mock;
    mock.on("http://api/items/1").raise("socket exploded");

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(numbered_suite(3), nullptr, context(3));

    TEST_CHECK(r.ok());
    TEST_CHECK(r.outcomes[0].status == OutcomeStatus::Passed);
    TEST_CHECK(r.outcomes[1].status == OutcomeStatus::Failed);
    TEST_CHECK(r.outcomes[1].reason.find("TransportFailure") != std::string::npos);
    TEST_CHECK(r.outcomes[1].reason.find("socket exploded") != std::string::npos);
    TEST_CHECK(r.outcomes[2].status == OutcomeStatus::Passed);

    std::cout << "[TEST] OK\n";
}

void test_coverage() {
    std::cout << "[TEST] E11: coverage\n";

    MockTransport mock;
    Suite suite;
    suite.name = "coverage";
    suite.tests.push_back(make_case("get user", "http://api/users/42"));
    suite.tests.push_back(make_case("health", "http://api/health"));

    RunContext ctx = context();
    ctx.catalog = coverage::Catalog{{"GET", "/users/{id}", {200, 404}}, {"DELETE", "/users/{id}", {204}}};

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, nullptr, ctx);

    TEST_CHECK(r.coverage.has_value());
    TEST_CHECK(r.coverage->entries[0].hit);
    TEST_CHECK(r.coverage->entries[0].hit_statuses == std::vector<int>{200});
    TEST_CHECK(!r.coverage->entries[1].hit);
    TEST_CHECK(r.coverage->uncatalogued.size() == 1);
    TEST_CHECK(r.coverage->uncatalogued[0].path == "/health");

    const RunResult none = engine.execute(suite, nullptr, context());
    TEST_CHECK(!none.coverage.has_value());

    std::cout << "[TEST] OK\n";
}

void test_redaction() {
    std::cout << "[TEST] E12: redaction\n";

    MockTransport mock;
    mock.on("http://api/me").respond(401, R"({"error":"bad token","token":"abc"})");

    Suite suite;
    suite.name = "secrets";
    TestCase tc = make_case("me", "http://api/me");
    tc.request.headers = {{"Authorization", "Bearer {{token}}"}};
    suite.tests.push_back(tc);
    suite.vars = {{"token", "s3cr3t"}};

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, nullptr, context());

    // The transport saw the real credential, reports never do
    TEST_CHECK(mock.requests()[0].headers[0].second == "Bearer s3cr3t");
    const Outcome& o = r.outcomes[0];
    TEST_CHECK(o.status == OutcomeStatus::Failed);
    TEST_CHECK(o.request->headers[0].second == redaction::MASK);
    TEST_CHECK(o.response->body.find("abc") == std::string::npos);
    TEST_CHECK(r.summary().find("s3cr3t") == std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_external_abandon() {
    std::cout << "[TEST] E13: external abandon\n";

    MockTransport mock;
    mock.set_default(200, {}, 400ms);

    Suite suite = numbered_suite(6);
    suite.teardown.push_back(make_case("cleanup", "http://api/cleanup"));

    schedule::Cancellation cancel;
    RunContext ctx = context(2);
    ctx.cancel = &cancel;

    std::thread canceller([&] {
        std::this_thread::sleep_for(60ms);
        cancel.request(schedule::CancelMode::Abandon, "user interrupt");
    });

    Engine<MockTransport> engine(mock);
    const auto t0 = std::chrono::steady_clock::now();
    const RunResult r = engine.execute(suite, nullptr, ctx);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    canceller.join();

    TEST_CHECK(r.cancelled);
    TEST_CHECK(r.cancel_reason == "user interrupt");
    TEST_CHECK(r.outcomes.size() == 7);
    TEST_CHECK(r.outcomes[0].status == OutcomeStatus::Cancelled);
    TEST_CHECK(r.outcomes[1].status == OutcomeStatus::Cancelled);
    for (std::size_t i = 2; i < 7; ++i) {
        TEST_CHECK(r.outcomes[i].status == OutcomeStatus::Skipped);
    }
    TEST_CHECK(r.counts.cancelled == 2);
    TEST_CHECK(mock.calls("http://api/cleanup") == 0);
    // In-flight sends are joined, nothing is dispatched afterwards
    TEST_CHECK(elapsed < 2s);
    TEST_CHECK(mock.total_calls() == 2);
    // Nothing failed but nothing ran either
    TEST_CHECK(r.passed);
    TEST_CHECK(!r.executed());
    TEST_CHECK(r.summary().find("NOT RUN") != std::string::npos);
    TEST_CHECK(r.summary().find("PASSED") == std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_environment_and_notification() {
    std::cout << "[TEST] E14: environment and notification\n";

    MockTransport mock;
    Suite suite;
    suite.name = "env";
    suite.tests.push_back(make_case("env host", "http://{{WIRECHECK_ENV}}.example/ping"));
    suite.tests.push_back(make_case("env var", "http://api/${REGION:eu}/ping"));

    std::atomic<int> notified{0};
    RunContext ctx = context(2);
    ctx.environment = "staging";
    ctx.env = [](const std::string& name) -> std::optional<std::string> {
        if (name == "REGION") return std::string("us");
        return std::nullopt;
    };
    ctx.on_outcome = [&](const Outcome& o) {
        TEST_CHECK(!o.name.empty());
        ++notified;
    };

    Engine<MockTransport> engine(mock);
    const RunResult r = engine.execute(suite, nullptr, ctx);

    TEST_CHECK(r.passed);
    TEST_CHECK(mock.calls("http://staging.example/ping") == 1);
    TEST_CHECK(mock.calls("http://api/us/ping") == 1);
    TEST_CHECK(notified.load() == 2);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_plan_order();
    test_repeatable_counts();
    test_config_errors();
    test_dataset();
    test_setup_teardown();
    test_bail();
    test_filter();
    test_flaky();
    test_timeout();
    test_transport_exception();
    test_coverage();
    test_redaction();
    test_external_abandon();
    test_environment_and_notification();

    std::cout << "\n[TEST] ALL ENGINE EXECUTE TESTS PASSED!\n";
    return 0;
}
