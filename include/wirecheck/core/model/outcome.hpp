#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <chrono>
#include <optional>
#include <utility>

#include "wirecheck/core/model/request.hpp"
#include "wirecheck/core/assertion/mismatch.hpp"


namespace wirecheck::core {

// ===============================================================
// OUTCOME STATUS
// ===============================================================
enum class OutcomeStatus : std::uint8_t {
    Passed,
    Failed,
    Skipped,     // Never started (bail, cancellation, filtered phase)
    Flaky,       // Failed on early attempt(s), passed on a later retry
    Cancelled    // In flight when the run was abandoned
};

[[nodiscard]]
inline constexpr std::string_view to_string(OutcomeStatus s) noexcept {
    switch (s) {
        case OutcomeStatus::Passed:    return "passed";
        case OutcomeStatus::Failed:    return "failed";
        case OutcomeStatus::Skipped:   return "skipped";
        case OutcomeStatus::Flaky:     return "flaky";
        case OutcomeStatus::Cancelled: return "cancelled";
        default:                       return "unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_success(OutcomeStatus s) noexcept {
    return s == OutcomeStatus::Passed || s == OutcomeStatus::Flaky;
}

// Unit phase inside a suite run
enum class Phase : std::uint8_t {
    Setup,
    Test,
    Teardown
};

[[nodiscard]]
inline constexpr std::string_view to_string(Phase p) noexcept {
    switch (p) {
        case Phase::Setup:    return "setup";
        case Phase::Test:     return "test";
        case Phase::Teardown: return "teardown";
        default:              return "unknown";
    }
}

// (method, path, status) of an executed request, used for coverage
struct ExecutedCall {
    std::string method;
    std::string path;
    int status{0};
};

// -----------------------------------------------------------------------------
// Outcome: terminal result of one execution unit
// -----------------------------------------------------------------------------
struct Outcome {
    std::string name;                       // Filled by the collator from the plan
    OutcomeStatus status{OutcomeStatus::Skipped};
    std::chrono::microseconds duration{0};
    std::uint32_t attempts{0};
    std::string reason;                     // Skip / cancel / transport failure reason
    std::vector<assertion::Mismatch> failures;

    // Redacted snapshots
    std::optional<Request> request;
    std::optional<Response> response;

    std::optional<ExecutedCall> call;

    [[nodiscard]]
    static Outcome skipped(std::string why) {
        Outcome o;
        o.status = OutcomeStatus::Skipped;
        o.reason = std::move(why);
        return o;
    }

    [[nodiscard]]
    static Outcome cancelled(std::string why) {
        Outcome o;
        o.status = OutcomeStatus::Cancelled;
        o.reason = std::move(why);
        return o;
    }
};

} // namespace wirecheck::core
