#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "wirecheck/core/config/defaults.hpp"
#include "wirecheck/core/metrics/sample.hpp"
#include "lcr/metrics/counter.hpp"
#include "lcr/metrics/latency_histogram.hpp"


namespace wirecheck::core::metrics {

struct Config {
    std::size_t expected_samples{config::METRICS_EXPECTED_SAMPLES};
    std::size_t memory_cap{config::METRICS_MEMORY_CAP};          // Bytes of exact latencies retained
    std::chrono::milliseconds window{config::THROUGHPUT_WINDOW}; // Trailing throughput window
    std::size_t buckets{config::THROUGHPUT_BUCKETS};              // Window resolution
};

// Latency statistics, in milliseconds
struct LatencyStats {
    std::uint64_t count{0};
    double mean{0.0};
    double min{0.0};
    double max{0.0};
    double p50{0.0};
    double p95{0.0};
    double p99{0.0};
    bool approximate{false};

    [[nodiscard]] std::string str() const;
};

// Live view while samples are still arriving
struct Snapshot {
    std::chrono::milliseconds elapsed{0};
    std::uint64_t count{0};
    std::uint64_t errors{0};
    double throughput{0.0};   // ops/s over the trailing window
    LatencyStats latency;
    bool partial{true};

    [[nodiscard]] std::string str() const;
};

// Final statistics, computed once from the full retained distribution
struct FinalStats {
    std::chrono::milliseconds duration{0};
    std::uint64_t count{0};
    std::uint64_t errors{0};
    double error_rate{0.0};   // errors / count, in [0, 1]
    double throughput{0.0};   // ops/s over the whole run
    LatencyStats latency;
    std::map<int, std::uint64_t> status_codes;
    std::uint64_t bytes_sent{0};
    std::uint64_t bytes_received{0};
    double bytes_sent_per_sec{0.0};
    double bytes_received_per_sec{0.0};
    std::uint64_t connection_errors{0};
    bool approximate{false};

    [[nodiscard]] std::string str() const;
};

// Linear interpolation between closest ranks, rank = q * (n - 1).
// `sorted` must be in ascending order.
[[nodiscard]]
double percentile(const std::vector<std::uint64_t>& sorted, double q) noexcept;

/*
===============================================================================
 Aggregator
===============================================================================

Thread-safe sample sink. record() is the single, lock-protected ingestion
point shared by all workers.

Exact latencies (microseconds) are retained in a vector reserved for the
expected sample count. When retaining one more would exceed the memory cap,
the vector is released and percentiles come from the log-linear histogram
that is maintained alongside from the first sample; every statistic produced
afterwards is flagged approximate.

Live snapshots always read their percentiles from the histogram so that
ingestion is never stalled behind a sort; only finalize() sorts.
===============================================================================
*/
class Aggregator {
public:
    explicit Aggregator(Config cfg = {}, Clock::time_point start = Clock::now());

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    void record(const Sample& sample);

    [[nodiscard]] Snapshot snapshot(Clock::time_point now) const;
    [[nodiscard]] FinalStats finalize(Clock::time_point end) const;

    [[nodiscard]] bool approximate() const;
    [[nodiscard]] std::uint64_t count() const;
    [[nodiscard]] Clock::time_point start() const noexcept { return start_; }

private:
    // Sorting the exact latencies is reserved for finalize()
    [[nodiscard]] LatencyStats latency_locked_(bool exact) const;
    [[nodiscard]] double window_throughput_locked_(Clock::time_point now) const;
    [[nodiscard]] std::int64_t epoch_of_(Clock::time_point t) const noexcept;

private:
    struct WindowBucket {
        std::int64_t epoch{-1};
        std::uint64_t count{0};
    };

    const Config cfg_;
    const Clock::time_point start_;
    const std::chrono::nanoseconds bucket_width_;

    mutable std::mutex mtx_;

    lcr::metrics::counter64 count_;
    lcr::metrics::counter64 errors_;
    lcr::metrics::counter64 connection_errors_;
    lcr::metrics::counter64 bytes_sent_;
    lcr::metrics::counter64 bytes_received_;
    std::map<int, std::uint64_t> status_codes_;

    std::vector<std::uint64_t> exact_us_;
    bool approximate_{false};
    lcr::metrics::latency_histogram histogram_;

    std::vector<WindowBucket> window_;
};

} // namespace wirecheck::core::metrics
