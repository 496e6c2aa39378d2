#pragma once

#include <cstdint>
#include <chrono>
#include <vector>
#include <algorithm>
#include <cmath>
#include <string_view>

#include "wirecheck/core/config/defaults.hpp"
#include "wirecheck/core/config/error.hpp"
#include "wirecheck/core/transport/error.hpp"


namespace wirecheck::core::retry {

// -----------------------------------------------------------------------------
// FailureClass: how an attempt ended, from the retry point of view
// -----------------------------------------------------------------------------
enum class FailureClass : std::uint8_t {
    None = 0,   // Attempt passed
    Transient,  // Timeout, connection failure, retryable status code
    Assertion,  // Response received but expectations mismatched
    Terminal    // Protocol error, invalid request, cancellation
};

[[nodiscard]]
inline constexpr std::string_view to_string(FailureClass c) noexcept {
    switch (c) {
        case FailureClass::None:      return "None";
        case FailureClass::Transient: return "Transient";
        case FailureClass::Assertion: return "Assertion";
        case FailureClass::Terminal:  return "Terminal";
        default:                      return "Unknown";
    }
}

// Transport error classification (None maps to None)
[[nodiscard]]
inline constexpr FailureClass classify(transport::Error err) noexcept {
    switch (err) {
        case transport::Error::None:
            return FailureClass::None;
        case transport::Error::Timeout:
        case transport::Error::ConnectionFailed:
        case transport::Error::ConnectionReset:
            return FailureClass::Transient;
        default:
            return FailureClass::Terminal;
    }
}

// -----------------------------------------------------------------------------
// Policy
// -----------------------------------------------------------------------------
//
// Backoff before attempt k+1 (k >= 1) is base * multiplier^(k-1), capped at
// max_backoff. No backoff follows the final attempt.
//
// Retryable status codes are empty by default: a 5xx response is judged by the
// assertions unless the caller lists it here.
// -----------------------------------------------------------------------------
struct Policy {
    std::uint32_t max_attempts{config::DEFAULT_MAX_ATTEMPTS};
    std::chrono::milliseconds base_backoff{config::DEFAULT_BASE_BACKOFF};
    double multiplier{config::DEFAULT_BACKOFF_MULTIPLIER};
    std::chrono::milliseconds max_backoff{config::DEFAULT_MAX_BACKOFF};
    std::vector<int> retryable_statuses{};
    bool retry_transport_errors{true};
    bool retry_on_assertion{false};

    [[nodiscard]]
    static Policy attempts(std::uint32_t n) {
        Policy p;
        p.max_attempts = n;
        return p;
    }

    // Common gateway statuses, for callers that want them retried
    [[nodiscard]]
    static std::vector<int> gateway_statuses() {
        return {502, 503, 504};
    }

    [[nodiscard]]
    config::Error validate() const noexcept {
        if (max_attempts == 0) return config::Error::InvalidRetryPolicy;
        if (multiplier < 1.0 || !std::isfinite(multiplier)) return config::Error::InvalidRetryPolicy;
        if (base_backoff.count() < 0 || max_backoff.count() < 0) return config::Error::InvalidRetryPolicy;
        return config::Error::None;
    }

    [[nodiscard]]
    bool is_retryable_status(int status) const noexcept {
        return std::find(retryable_statuses.begin(), retryable_statuses.end(), status) != retryable_statuses.end();
    }

    // Whether an attempt that ended with `c` may be retried under this policy
    [[nodiscard]]
    bool should_retry(FailureClass c) const noexcept {
        switch (c) {
            case FailureClass::Transient: return retry_transport_errors;
            case FailureClass::Assertion: return retry_on_assertion;
            default:                      return false;
        }
    }

    // Delay to wait after attempt `k` (1-based) before attempt k+1
    [[nodiscard]]
    std::chrono::milliseconds backoff_for(std::uint32_t k) const noexcept {
        if (k == 0 || base_backoff.count() <= 0) {
            return std::chrono::milliseconds{0};
        }
        const double cap = static_cast<double>(max_backoff.count());
        double delay = static_cast<double>(base_backoff.count()) * std::pow(multiplier, static_cast<double>(k - 1));
        if (!std::isfinite(delay) || delay > cap) {
            delay = cap;
        }
        return std::chrono::milliseconds{static_cast<std::int64_t>(delay)};
    }
};

} // namespace wirecheck::core::retry
