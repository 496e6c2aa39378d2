#pragma once

#include <cstdint>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "wirecheck/core/config/defaults.hpp"
#include "wirecheck/core/config/error.hpp"
#include "wirecheck/core/coverage/report.hpp"
#include "wirecheck/core/metrics/aggregator.hpp"
#include "wirecheck/core/model/outcome.hpp"
#include "wirecheck/core/model/suite.hpp"
#include "wirecheck/core/redaction/policy.hpp"
#include "wirecheck/core/retry/policy.hpp"
#include "wirecheck/core/schedule/cancellation.hpp"
#include "wirecheck/core/vars/resolver.hpp"


namespace wirecheck::core::config {

// -----------------------------------------------------------------------------
// RunContext: run-wide settings for a functional suite run
// -----------------------------------------------------------------------------
struct RunContext {
    std::uint32_t concurrency{DEFAULT_CONCURRENCY};
    bool bail{false};                                // Stop dispatch after the first failed unit

    // Shared cancellation token (optional). The engine observes it for the
    // whole run; the caller may request it from any thread.
    schedule::Cancellation* cancel{nullptr};

    core::retry::Policy retry{};                     // Default for cases without an override
    std::chrono::milliseconds timeout{DEFAULT_UNIT_TIMEOUT};

    std::string filter;                              // Substring of step names to keep; empty keeps all
    std::string environment;                         // Bound as {{WIRECHECK_ENV}} when set

    core::redaction::Policy redaction{};
    std::optional<coverage::Catalog> catalog;        // Coverage is computed when set

    vars::EnvLookup env{};                           // Empty = process environment

    // Called from worker threads after each accepted outcome
    std::function<void(const Outcome&)> on_outcome{};

    [[nodiscard]]
    Error validate() const noexcept {
        if (concurrency == 0) return Error::ZeroConcurrency;
        if (timeout.count() <= 0) return Error::InvalidTimeout;
        return retry.validate();
    }
};

// -----------------------------------------------------------------------------
// PerfContext: run-wide settings for a performance run
// -----------------------------------------------------------------------------
struct PerfContext {
    std::chrono::milliseconds tick{LOAD_TICK};                // Driver re-evaluation period
    std::chrono::milliseconds report_interval{REPORT_INTERVAL}; // 0 disables live snapshots

    core::metrics::Config metrics{};
    core::retry::Policy retry{};
    std::chrono::milliseconds timeout{PERF_UNIT_TIMEOUT};

    schedule::Cancellation* cancel{nullptr};

    Bindings vars;
    std::string environment;
    vars::EnvLookup env{};

    core::redaction::Policy redaction{};

    [[nodiscard]]
    Error validate() const noexcept {
        if (tick.count() <= 0) return Error::InvalidTimeout;
        if (timeout.count() <= 0) return Error::InvalidTimeout;
        if (report_interval.count() < 0) return Error::InvalidTimeout;
        return retry.validate();
    }
};

} // namespace wirecheck::core::config
