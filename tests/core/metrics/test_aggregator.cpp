/*
===============================================================================
 metrics::Aggregator — Unit Tests
===============================================================================

Covered Requirements:
---------------------
M1. Exact percentiles: latencies 10..1000 ms (step 10) give p50 = 505 ms and
    p95 = 950.5 ms (linear interpolation, rank = q * (n - 1))
M2. Final statistics: counts, error rate, status codes, bytes, throughput
M3. Exceeding the memory cap switches to the histogram estimator and flags
    the results approximate
M4. Live snapshots report trailing-window throughput and are partial
M5. Concurrent record() calls are not lost
M6. Live snapshot percentiles come from the histogram estimator while the
    final statistics stay exact, and snapshots never change the retained data
===============================================================================
*/

#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

#include "wirecheck/core/metrics/aggregator.hpp"
#include "common/test_check.hpp"

using namespace wirecheck::core;
using namespace wirecheck::core::metrics;
using namespace std::chrono_literals;


namespace {

Sample sample_at(Clock::time_point t, std::chrono::microseconds latency, int status = 200) {
    Sample s;
    s.timestamp = t;
    s.latency = latency;
    s.status = status;
    s.success = status < 400;
    return s;
}

} // namespace


void test_exact_percentiles() {
    std::cout << "[TEST] M1: exact percentiles\n";

    TEST_CHECK(percentile({}, 0.5) == 0.0);
    TEST_CHECK(percentile({7}, 0.99) == 7.0);
    TEST_CHECK_NEAR(percentile({1, 2, 3, 4}, 0.5), 2.5, 1e-9);

    const auto t0 = Clock::now();
    Aggregator agg(Config{}, t0);
    // Recorded out of order on purpose
    for (int ms = 1000; ms >= 10; ms -= 10) {
        agg.record(sample_at(t0 + 1ms, std::chrono::milliseconds(ms)));
    }

    const FinalStats stats = agg.finalize(t0 + 1s);
    TEST_CHECK(stats.count == 100);
    TEST_CHECK(!stats.approximate);
    TEST_CHECK_NEAR(stats.latency.p50, 505.0, 1e-6);
    TEST_CHECK_NEAR(stats.latency.p95, 950.5, 1e-6);
    TEST_CHECK_NEAR(stats.latency.p99, 990.1, 1e-6);
    TEST_CHECK_NEAR(stats.latency.mean, 505.0, 1e-6);
    TEST_CHECK_NEAR(stats.latency.min, 10.0, 1e-9);
    TEST_CHECK_NEAR(stats.latency.max, 1000.0, 1e-9);

    std::cout << "[TEST] OK\n";
}

void test_final_stats() {
    std::cout << "[TEST] M2: final statistics\n";

    const auto t0 = Clock::now();
    Aggregator agg(Config{}, t0);

    for (int i = 0; i < 8; ++i) {
        Sample s = sample_at(t0 + 10ms, 2ms, 200);
        s.bytes_sent = 100;
        s.bytes_received = 1000;
        agg.record(s);
    }
    agg.record(sample_at(t0 + 10ms, 5ms, 500));
    Sample dropped = sample_at(t0 + 10ms, 30ms, 0);
    dropped.success = false;
    dropped.transport_error = true;
    agg.record(dropped);

    const FinalStats stats = agg.finalize(t0 + 2s);
    TEST_CHECK(stats.count == 10);
    TEST_CHECK(stats.errors == 2);
    TEST_CHECK_NEAR(stats.error_rate, 0.2, 1e-9);
    TEST_CHECK(stats.connection_errors == 1);
    TEST_CHECK(stats.status_codes.size() == 2);
    TEST_CHECK(stats.status_codes.at(200) == 8);
    TEST_CHECK(stats.status_codes.at(500) == 1);
    TEST_CHECK(stats.bytes_sent == 800);
    TEST_CHECK(stats.bytes_received == 8000);
    TEST_CHECK_NEAR(stats.throughput, 5.0, 1e-9);
    TEST_CHECK_NEAR(stats.bytes_received_per_sec, 4000.0, 1e-9);
    TEST_CHECK(stats.duration == 2000ms);
    TEST_CHECK(!stats.str().empty());

    // Empty run
    Aggregator empty(Config{}, t0);
    const FinalStats none = empty.finalize(t0 + 1s);
    TEST_CHECK(none.count == 0);
    TEST_CHECK(none.error_rate == 0.0);
    TEST_CHECK(none.latency.p50 == 0.0);

    std::cout << "[TEST] OK\n";
}

void test_approximate_downgrade() {
    std::cout << "[TEST] M3: memory cap downgrade\n";

    Config cfg;
    cfg.expected_samples = 4;
    cfg.memory_cap = 64 * sizeof(std::uint64_t);   // 64 exact samples

    const auto t0 = Clock::now();
    Aggregator agg(cfg, t0);
    for (int i = 1; i <= 64; ++i) {
        agg.record(sample_at(t0, std::chrono::milliseconds(i)));
    }
    TEST_CHECK(!agg.approximate());

    for (int i = 65; i <= 1000; ++i) {
        agg.record(sample_at(t0, std::chrono::milliseconds(i)));
    }
    TEST_CHECK(agg.approximate());

    const FinalStats stats = agg.finalize(t0 + 1s);
    TEST_CHECK(stats.approximate);
    TEST_CHECK(stats.latency.approximate);
    TEST_CHECK(stats.count == 1000);
    // Exact p50 would be 500.5 ms; the estimator stays within its bucket error
    TEST_CHECK_NEAR(stats.latency.p50, 500.5, 500.5 * 0.05);
    TEST_CHECK_NEAR(stats.latency.p99, 990.01, 990.01 * 0.05);
    TEST_CHECK_NEAR(stats.latency.min, 1.0, 1e-9);
    TEST_CHECK_NEAR(stats.latency.max, 1000.0, 1e-9);

    std::cout << "[TEST] OK\n";
}

void test_live_snapshot() {
    std::cout << "[TEST] M4: live snapshot throughput\n";

    Config cfg;
    cfg.window = 1000ms;
    cfg.buckets = 10;

    const auto t0 = Clock::now();
    Aggregator agg(cfg, t0);
    for (int i = 0; i < 50; ++i) {
        agg.record(sample_at(t0 + std::chrono::milliseconds(150 + i * 10), 1ms));
    }

    const Snapshot snap = agg.snapshot(t0 + 1000ms);
    TEST_CHECK(snap.partial);
    TEST_CHECK(snap.count == 50);
    TEST_CHECK(snap.elapsed == 1000ms);
    TEST_CHECK_NEAR(snap.throughput, 50.0, 1e-9);

    // Window has moved past every sample
    const Snapshot later = agg.snapshot(t0 + 5000ms);
    TEST_CHECK(later.count == 50);
    TEST_CHECK(later.throughput == 0.0);

    std::cout << "[TEST] OK\n";
}

void test_concurrent_record() {
    std::cout << "[TEST] M5: concurrent ingestion\n";

    const auto t0 = Clock::now();
    Aggregator agg(Config{}, t0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&agg, t] {
            for (int i = 0; i < 1000; ++i) {
                Sample s;
                s.timestamp = Clock::now();
                s.latency = std::chrono::microseconds(100 + t);
                agg.record(s);
            }
        });
    }
    for (auto& th : threads) th.join();

    TEST_CHECK(agg.count() == 8000);
    TEST_CHECK(agg.finalize(Clock::now()).count == 8000);

    std::cout << "[TEST] OK\n";
}

void test_snapshot_percentiles() {
    std::cout << "[TEST] M6: snapshot percentiles without sorting\n";

    const auto t0 = Clock::now();
    Aggregator agg(Config{}, t0);
    for (int ms = 1000; ms >= 10; ms -= 10) {
        agg.record(sample_at(t0 + 1ms, std::chrono::milliseconds(ms)));
    }

    const Snapshot snap = agg.snapshot(t0 + 1s);
    TEST_CHECK(snap.partial);
    TEST_CHECK(!snap.latency.approximate);
    TEST_CHECK_NEAR(snap.latency.p50, 505.0, 505.0 * 0.05);
    TEST_CHECK_NEAR(snap.latency.p99, 990.1, 990.1 * 0.05);
    TEST_CHECK_NEAR(snap.latency.min, 10.0, 1e-9);
    TEST_CHECK_NEAR(snap.latency.max, 1000.0, 1e-9);

    // Snapshots in between do not disturb the exact figures
    for (int i = 0; i < 5; ++i) {
        (void)agg.snapshot(t0 + 1s);
    }
    const FinalStats stats = agg.finalize(t0 + 1s);
    TEST_CHECK(!stats.approximate);
    TEST_CHECK_NEAR(stats.latency.p50, 505.0, 1e-6);
    TEST_CHECK_NEAR(stats.latency.p99, 990.1, 1e-6);

    std::cout << "[TEST] OK\n";
}


int main() {
    test_exact_percentiles();
    test_final_stats();
    test_approximate_downgrade();
    test_live_snapshot();
    test_concurrent_record();
    test_snapshot_percentiles();

    std::cout << "\n[TEST] ALL AGGREGATOR TESTS PASSED!\n";
    return 0;
}
