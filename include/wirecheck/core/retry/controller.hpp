#pragma once

#include <cstdint>
#include <chrono>
#include <thread>
#include <utility>
#include <concepts>

#include "wirecheck/core/retry/policy.hpp"
#include "wirecheck/core/model/outcome.hpp"
#include "wirecheck/core/schedule/cancellation.hpp"
#include "lcr/log/logger.hpp"


namespace wirecheck::core::retry {

// Terminal verdict of a retried unit
struct Result {
    OutcomeStatus status{OutcomeStatus::Failed};
    std::uint32_t attempts{0};
    FailureClass last_failure{FailureClass::None};
    bool interrupted{false}; // Backoff cut short by an abandon request
};

template<class Fn>
concept AttemptFunction = requires(Fn fn, std::uint32_t attempt) {
    { fn(attempt) } -> std::same_as<FailureClass>;
};

/*
===============================================================================
 retry::Controller
===============================================================================

Drives the attempts of one execution unit under a Policy.

  - `attempt(k)` performs attempt k (1-based) and classifies its result; the
    caller keeps whatever payload it needs from the last attempt.
  - A failure is retried when the policy allows its class and attempts remain.
  - Backoff sleeps between attempts, never after the final one. The sleep is
    interrupted by an abandon request; a graceful drain lets retries continue.
  - Passing on attempt 1 is Passed, passing later is Flaky, exhaustion is
    Failed.
===============================================================================
*/
class Controller {
public:
    explicit Controller(const Policy& policy, const schedule::Cancellation* cancel = nullptr) noexcept
        : policy_(policy)
        , cancel_(cancel)
    {}

    template<AttemptFunction Fn>
    [[nodiscard]]
    Result run(Fn&& attempt) const {
        Result result;
        const std::uint32_t max_attempts = policy_.max_attempts == 0 ? 1 : policy_.max_attempts;
        for (std::uint32_t k = 1; k <= max_attempts; ++k) {
            result.attempts = k;
            const FailureClass failure = attempt(k);
            if (failure == FailureClass::None) {
                result.status = (k > 1) ? OutcomeStatus::Flaky : OutcomeStatus::Passed;
                result.last_failure = FailureClass::None;
                if (k > 1) {
                    WC_DEBUG("[RETRY] Passed on attempt " << k << "/" << max_attempts);
                }
                return result;
            }
            result.last_failure = failure;
            if (k == max_attempts || !policy_.should_retry(failure)) {
                break;
            }
            const auto delay = policy_.backoff_for(k);
            WC_TRACE("[RETRY] Attempt " << k << "/" << max_attempts << " failed (" << to_string(failure)
                     << "), next attempt in " << delay.count() << " ms");
            if (!sleep_(delay)) {
                result.interrupted = true;
                WC_DEBUG("[RETRY] Backoff interrupted by cancellation after attempt " << k);
                break;
            }
        }
        result.status = OutcomeStatus::Failed;
        return result;
    }

    [[nodiscard]]
    const Policy& policy() const noexcept { return policy_; }

private:
    // Returns false when interrupted
    [[nodiscard]]
    bool sleep_(std::chrono::milliseconds delay) const {
        if (cancel_) {
            if (cancel_->abandoned()) {
                return false;
            }
            return delay.count() <= 0 || cancel_->wait_for(delay);
        }
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return true;
    }

private:
    const Policy& policy_;
    const schedule::Cancellation* cancel_;
};

} // namespace wirecheck::core::retry
