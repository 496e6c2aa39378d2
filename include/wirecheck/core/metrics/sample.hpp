#pragma once

#include <chrono>
#include <cstdint>


namespace wirecheck::core::metrics {

using Clock = std::chrono::steady_clock;

// -----------------------------------------------------------------------------
// Sample: one completed operation, consumed by the aggregator
// -----------------------------------------------------------------------------
struct Sample {
    Clock::time_point timestamp{};           // Completion time
    std::chrono::microseconds latency{0};
    bool success{true};
    int status{0};                            // 0 when no response was received
    std::uint64_t bytes_sent{0};
    std::uint64_t bytes_received{0};
    bool transport_error{false};              // Failed before a response arrived
};

} // namespace wirecheck::core::metrics
