#pragma once

#include <algorithm>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string_view>

#include "wirecheck/core/config/defaults.hpp"
#include "wirecheck/core/config/error.hpp"


namespace wirecheck::core::load {

enum class Pattern : std::uint8_t {
    Constant,
    RampUp,
    Spike
};

[[nodiscard]]
inline constexpr std::string_view to_string(Pattern p) noexcept {
    switch (p) {
        case Pattern::Constant: return "constant";
        case Pattern::RampUp:   return "ramp-up";
        case Pattern::Spike:    return "spike";
        default:                return "unknown";
    }
}

[[nodiscard]]
inline std::optional<Pattern> parse_pattern(std::string_view text) noexcept {
    if (text == "constant")                    return Pattern::Constant;
    if (text == "ramp-up" || text == "rampup") return Pattern::RampUp;
    if (text == "spike")                       return Pattern::Spike;
    return std::nullopt;
}

// Spike bursts: one spike of `duration` centred in each `interval`
struct SpikeParams {
    std::uint32_t peak{0};                                   // 0 = target * SPIKE_FACTOR
    std::chrono::milliseconds duration{config::SPIKE_DURATION};
    std::chrono::milliseconds interval{config::SPIKE_INTERVAL};
    std::uint32_t repeat{0};                                 // 0 = as many as fit
};

// -----------------------------------------------------------------------------
// LoadPlan
// -----------------------------------------------------------------------------
struct LoadPlan {
    Pattern pattern{Pattern::Constant};
    std::uint32_t target{1};                  // Target (baseline) concurrency
    std::chrono::milliseconds duration{0};
    std::chrono::milliseconds ramp{0};        // Ramp-up only
    SpikeParams spike{};
    std::uint32_t max_concurrency{0};         // Hard cap; 0 = max(target, peak)
    std::optional<double> target_rps;         // Arrival rate at the target level

    [[nodiscard]]
    std::uint32_t peak() const noexcept {
        return spike.peak != 0 ? spike.peak : target * config::SPIKE_FACTOR;
    }

    [[nodiscard]]
    std::uint32_t cap() const noexcept {
        if (max_concurrency != 0) {
            return max_concurrency;
        }
        return pattern == Pattern::Spike ? std::max(target, peak()) : target;
    }

    [[nodiscard]]
    config::Error validate() const noexcept {
        if (target == 0) return config::Error::ZeroTarget;
        if (duration.count() <= 0) return config::Error::ZeroDuration;
        if (target_rps && !(*target_rps > 0.0)) return config::Error::ZeroTarget;
        if (max_concurrency != 0 && max_concurrency < target) return config::Error::CapBelowTarget;
        if (max_concurrency > config::MAX_WORKERS) return config::Error::CapBelowTarget;
        switch (pattern) {
            case Pattern::RampUp:
                if (ramp > duration) return config::Error::RampTooLong;
                break;
            case Pattern::Spike:
                if (spike.interval.count() <= 0 || spike.duration.count() <= 0) return config::Error::InvalidSpike;
                if (spike.duration > spike.interval) return config::Error::InvalidSpike;
                if (peak() < target) return config::Error::InvalidSpike;
                if (max_concurrency != 0 && max_concurrency < peak()) return config::Error::CapBelowTarget;
                break;
            default:
                break;
        }
        return config::Error::None;
    }
};

} // namespace wirecheck::core::load
