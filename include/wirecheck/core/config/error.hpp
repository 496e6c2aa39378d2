#pragma once

#include <cstdint>
#include <string_view>


namespace wirecheck::core::config {

/*
===============================================================================
 config::Error
===============================================================================

Run-level configuration failures. They are detected before any unit is
dispatched and are reported as a single run-level error; a run carrying one of
these errors executed nothing.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Run context ---------------------------------------------------------
    ZeroConcurrency,      // Concurrency bound of zero
    EmptySuite,           // No test case survives planning (none declared or all filtered)
    EmptyDataset,         // Dataset referenced but holds no rows
    InvalidRetryPolicy,   // Zero attempts, multiplier < 1, negative backoff
    InvalidTimeout,       // Non-positive unit timeout

    // --- Load plan -----------------------------------------------------------
    ZeroTarget,           // Target concurrency of zero
    ZeroDuration,         // Run duration of zero
    RampTooLong,          // Ramp duration longer than the run duration
    InvalidSpike,         // Spike longer than its interval, or peak below baseline
    CapBelowTarget,       // Hard concurrency cap below the declared target / peak
    NoUnits               // Performance run without any unit template
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
        case Error::None:               return "None";
        case Error::ZeroConcurrency:    return "ZeroConcurrency";
        case Error::EmptySuite:         return "EmptySuite";
        case Error::EmptyDataset:       return "EmptyDataset";
        case Error::InvalidRetryPolicy: return "InvalidRetryPolicy";
        case Error::InvalidTimeout:     return "InvalidTimeout";
        case Error::ZeroTarget:         return "ZeroTarget";
        case Error::ZeroDuration:       return "ZeroDuration";
        case Error::RampTooLong:        return "RampTooLong";
        case Error::InvalidSpike:       return "InvalidSpike";
        case Error::CapBelowTarget:     return "CapBelowTarget";
        case Error::NoUnits:            return "NoUnits";
        default:                        return "Unknown";
    }
}

} // namespace wirecheck::core::config
