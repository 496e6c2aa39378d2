#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <utility>

#include "wirecheck/core/config/error.hpp"
#include "wirecheck/core/model/outcome.hpp"
#include "wirecheck/core/coverage/report.hpp"
#include "wirecheck/core/metrics/aggregator.hpp"


namespace wirecheck::core {

// Unit-level counts
struct Counts {
    std::size_t total{0};
    std::size_t passed{0};
    std::size_t failed{0};
    std::size_t skipped{0};
    std::size_t flaky{0};
    std::size_t cancelled{0};
    std::size_t pending{0};   // Live snapshots only

    [[nodiscard]]
    bool operator==(const Counts&) const = default;
};

// One test case summarized across its dataset rows
struct CaseTally {
    std::string name;
    Phase phase{Phase::Test};
    std::size_t passed{0};
    std::size_t failed{0};
    std::size_t flaky{0};
    std::size_t skipped{0};
    std::size_t cancelled{0};
    // failed if any row failed; flaky if it passed with a flaky row; skipped /
    // cancelled only when no row ran to completion
    OutcomeStatus verdict{OutcomeStatus::Skipped};
};

// -----------------------------------------------------------------------------
// RunResult
// -----------------------------------------------------------------------------
struct RunResult {
    std::string suite;

    // Set when the run was rejected before dispatch; nothing else is filled
    config::Error config_error{config::Error::None};
    std::string config_message;

    Counts counts;
    std::vector<CaseTally> cases;
    std::vector<Outcome> outcomes;       // Sequence-index order
    bool passed{false};
    bool partial{false};                 // Live snapshot with pending units
    bool cancelled{false};
    std::string cancel_reason;

    std::chrono::milliseconds duration{0};
    metrics::LatencyStats latency;
    std::size_t max_in_flight{0};

    std::optional<core::coverage::Report> coverage;

    [[nodiscard]]
    bool ok() const noexcept { return config_error == config::Error::None; }

    // At least one unit ran to a pass; a vacuous pass is reported as NOT RUN
    [[nodiscard]]
    bool executed() const noexcept { return counts.passed + counts.flaky > 0; }

    [[nodiscard]]
    static RunResult config_failure(std::string suite, config::Error err, std::string message) {
        RunResult r;
        r.suite = std::move(suite);
        r.config_error = err;
        r.config_message = std::move(message);
        r.passed = false;
        return r;
    }

    [[nodiscard]] std::string summary() const;
};

} // namespace wirecheck::core
