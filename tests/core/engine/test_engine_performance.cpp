/*
===============================================================================
 Engine::execute_performance — Integration Tests (MockTransport)
===============================================================================

Covered Requirements:
---------------------
EP1. Constant load keeps concurrency at the target and collects statistics
EP2. Ramp-up reaches the target without exceeding it
EP3. An arrival-rate target paces requests
EP4. Live snapshots are delivered at the report interval
EP5. Error statistics (status errors and transport errors)
EP6. Plan and context errors are reported before any request is sent
EP7. External cancellation ends the run early and drains in-flight units
===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
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

std::vector<TestCase> templates() {
    std::vector<TestCase> units(2);
    units[0].name = "list";
    units[0].request.url = "http://api/items";
    units[1].name = "get";
    units[1].request.url = "http://api/items/{{id}}";
    return units;
}

PerfContext context() {
    PerfContext ctx;
    ctx.tick = 10ms;
    ctx.report_interval = 0ms;
    ctx.timeout = 1s;
    ctx.vars = {{"id", "7"}};
    ctx.env = [](const std::string&) -> std::optional<std::string> { return std::nullopt; };
    return ctx;
}

load::LoadPlan constant(std::uint32_t target, std::chrono::milliseconds duration) {
    load::LoadPlan plan;
    plan.target = target;
    plan.duration = duration;
    return plan;
}

} // namespace


void test_constant() {
    std::cout << "[TEST] EP1: constant load\n";

    MockTransport mock;
    mock.set_default(200, "ok", 10ms);

    Engine<MockTransport> engine(mock);
    const PerformanceResult r = engine.execute_performance(constant(3, 400ms), templates(), context());

    TEST_CHECK(r.ok());
    TEST_CHECK(!r.cancelled);
    TEST_CHECK(r.peak_target == 3);
    TEST_CHECK(r.max_in_flight <= 3);
    TEST_CHECK(mock.max_in_flight() <= 3);
    TEST_CHECK(r.stats.count > 10);
    TEST_CHECK(r.stats.count == mock.total_calls());
    TEST_CHECK(r.stats.errors == 0);
    TEST_CHECK(r.stats.status_codes.at(200) == r.stats.count);
    TEST_CHECK(r.stats.bytes_received == 2 * r.stats.count);
    TEST_CHECK(r.stats.latency.p50 >= 9.0);
    TEST_CHECK(r.stats.throughput > 0.0);

    // Units round-robin over the templates
    TEST_CHECK(mock.calls("http://api/items") > 0);
    TEST_CHECK(mock.calls("http://api/items/7") > 0);
    TEST_CHECK(r.summary().find("constant") != std::string::npos);

    std::cout << "[TEST] OK\n";
}

void test_ramp() {
    std::cout << "[TEST] EP2: ramp-up\n";

    MockTransport mock;
    mock.set_default(200, {}, 15ms);

    load::LoadPlan plan;
    plan.pattern = load::Pattern::RampUp;
    plan.target = 4;
    plan.ramp = 300ms;
    plan.duration = 500ms;

    Engine<MockTransport> engine(mock);
    const PerformanceResult r = engine.execute_performance(plan, templates(), context());

    TEST_CHECK(r.ok());
    TEST_CHECK(r.peak_target == 4);
    TEST_CHECK(mock.max_in_flight() <= 4);
    TEST_CHECK(r.stats.count > 0);

    std::cout << "[TEST] OK\n";
}

void test_paced() {
    std::cout << "[TEST] EP3: arrival rate\n";

    MockTransport mock;

    load::LoadPlan plan = constant(4, 500ms);
    plan.target_rps = 40.0;

    Engine<MockTransport> engine(mock);
    const PerformanceResult r = engine.execute_performance(plan, templates(), context());

    // About 20 arrivals in 500 ms; unpaced this would be thousands
    TEST_CHECK(r.ok());
    TEST_CHECK(r.stats.count >= 10);
    TEST_CHECK(r.stats.count <= 30);

    std::cout << "[TEST] OK\n";
}

void test_snapshots() {
    std::cout << "[TEST] EP4: live snapshots\n";

    MockTransport mock;
    mock.set_default(200, {}, 5ms);

    PerfContext ctx = context();
    ctx.report_interval = 100ms;

    std::size_t delivered = 0;
    bool ordered = true;
    std::uint64_t last_count = 0;

    Engine<MockTransport> engine(mock);
    const PerformanceResult r = engine.execute_performance(constant(2, 450ms), templates(), ctx,
        [&](const metrics::Snapshot& snap, const load::Tick& tick) {
            ++delivered;
            ordered = ordered && snap.count >= last_count && snap.partial;
            last_count = snap.count;
            TEST_CHECK(tick.target == 2);
        });

    TEST_CHECK(r.snapshots >= 2);
    TEST_CHECK(r.snapshots <= 5);
    TEST_CHECK(delivered == r.snapshots);
    TEST_CHECK(ordered);

    std::cout << "[TEST] OK\n";
}

void test_errors() {
    std::cout << "[TEST] EP5: error statistics\n";

    MockTransport mock;
    mock.on("http://api/items").respond(500).delay(5ms);
    mock.on("http://api/items/7").fail(transport::Error::ConnectionFailed, "refused").delay(5ms);

    Engine<MockTransport> engine(mock);
    const PerformanceResult r = engine.execute_performance(constant(2, 300ms), templates(), context());

    TEST_CHECK(r.ok());
    TEST_CHECK(r.stats.count > 0);
    TEST_CHECK(r.stats.errors == r.stats.count);
    TEST_CHECK_NEAR(r.stats.error_rate, 1.0, 1e-12);
    TEST_CHECK(r.stats.connection_errors > 0);
    TEST_CHECK(r.stats.status_codes.count(500) == 1);

    std::cout << "[TEST] OK\n";
}

void test_config_errors() {
    std::cout << "[TEST] EP6: configuration errors\n";

    MockTransport mock;
    Engine<MockTransport> engine(mock);

    PerformanceResult r = engine.execute_performance(constant(2, 0ms), templates(), context());
    TEST_CHECK(r.config_error == config::Error::ZeroDuration);

    r = engine.execute_performance(constant(0, 1s), templates(), context());
    TEST_CHECK(r.config_error == config::Error::ZeroTarget);

    r = engine.execute_performance(constant(2, 1s), {}, context());
    TEST_CHECK(r.config_error == config::Error::NoUnits);

    PerfContext bad_tick = context();
    bad_tick.tick = 0ms;
    r = engine.execute_performance(constant(2, 1s), templates(), bad_tick);
    TEST_CHECK(r.config_error == config::Error::InvalidTimeout);

    std::vector<TestCase> bad_retry = templates();
    bad_retry[0].retry = retry::Policy::attempts(0);
    r = engine.execute_performance(constant(2, 1s), bad_retry, context());
    TEST_CHECK(r.config_error == config::Error::InvalidRetryPolicy);
    TEST_CHECK(!r.ok());
    TEST_CHECK(r.summary().find("InvalidRetryPolicy") != std::string::npos);

    TEST_CHECK(mock.total_calls() == 0);

    std::cout << "[TEST] OK\n";
}

void test_cancellation() {
    std::cout << "[TEST] EP7: external cancellation\n";

    MockTransport mock;
    mock.set_default(200, {}, 20ms);

    schedule::Cancellation cancel;
    PerfContext ctx = context();
    ctx.cancel = &cancel;

    std::thread canceller([&] {
        std::this_thread::sleep_for(150ms);
        cancel.request(schedule::CancelMode::GracefulDrain, "stop requested");
    });

    Engine<MockTransport> engine(mock);
    const auto t0 = std::chrono::steady_clock::now();
    const PerformanceResult r = engine.execute_performance(constant(3, 10s), templates(), ctx);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    canceller.join();

    TEST_CHECK(r.ok());
    TEST_CHECK(r.cancelled);
    TEST_CHECK(r.cancel_reason == "stop requested");
    TEST_CHECK(elapsed < 2s);
    TEST_CHECK(r.stats.count > 0);
    TEST_CHECK(mock.in_flight() == 0);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_constant();
    test_ramp();
    test_paced();
    test_snapshots();
    test_errors();
    test_config_errors();
    test_cancellation();

    std::cout << "\n[TEST] ALL ENGINE PERFORMANCE TESTS PASSED!\n";
    return 0;
}
