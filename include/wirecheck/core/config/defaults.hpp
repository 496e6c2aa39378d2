/*
================================================================================
Wirecheck Engine Defaults
================================================================================

Compile-time defaults used when a run context, load plan or metrics
configuration leaves a value unset. Runtime structures copy these values at
construction; nothing reads them after a run has started.
================================================================================
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>


namespace wirecheck::core::config {

// -----------------------------------------------------------------------------
// Scheduling
// -----------------------------------------------------------------------------

inline constexpr static std::uint32_t DEFAULT_CONCURRENCY = 1;
inline constexpr static std::uint32_t MAX_WORKERS         = 1024;

inline constexpr static auto DEFAULT_UNIT_TIMEOUT = std::chrono::milliseconds(30'000);
// Performance runs use a longer timeout so that saturation shows up as latency
inline constexpr static auto PERF_UNIT_TIMEOUT    = std::chrono::milliseconds(60'000);

// -----------------------------------------------------------------------------
// Retry
// -----------------------------------------------------------------------------

inline constexpr static std::uint32_t DEFAULT_MAX_ATTEMPTS = 1;
inline constexpr static auto DEFAULT_BASE_BACKOFF          = std::chrono::milliseconds(100);
inline constexpr static double DEFAULT_BACKOFF_MULTIPLIER  = 2.0;
inline constexpr static auto DEFAULT_MAX_BACKOFF           = std::chrono::milliseconds(10'000);

// -----------------------------------------------------------------------------
// Load shaping
// -----------------------------------------------------------------------------

inline constexpr static auto LOAD_TICK            = std::chrono::milliseconds(100);
inline constexpr static auto REPORT_INTERVAL      = std::chrono::seconds(5);
inline constexpr static auto SPIKE_INTERVAL       = std::chrono::seconds(30);
inline constexpr static auto SPIKE_DURATION       = std::chrono::seconds(5);
inline constexpr static std::uint32_t SPIKE_FACTOR = 2;

// -----------------------------------------------------------------------------
// Metrics
// -----------------------------------------------------------------------------

// Exact latencies are retained up to this many bytes before the aggregator
// switches to the histogram estimator (1M samples of 8 bytes).
inline constexpr static std::size_t METRICS_MEMORY_CAP      = 8u * 1024u * 1024u;
inline constexpr static std::size_t METRICS_EXPECTED_SAMPLES = 16'384;
inline constexpr static auto THROUGHPUT_WINDOW              = std::chrono::milliseconds(1'000);
inline constexpr static std::size_t THROUGHPUT_BUCKETS      = 10;

} // namespace wirecheck::core::config
