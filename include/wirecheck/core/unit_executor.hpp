#pragma once

#include <cstdint>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include "wirecheck/core/assertion/evaluator.hpp"
#include "wirecheck/core/coverage/calculator.hpp"
#include "wirecheck/core/metrics/aggregator.hpp"
#include "wirecheck/core/model/outcome.hpp"
#include "wirecheck/core/model/suite.hpp"
#include "wirecheck/core/redaction/policy.hpp"
#include "wirecheck/core/retry/controller.hpp"
#include "wirecheck/core/schedule/cancellation.hpp"
#include "wirecheck/core/transport/concepts.hpp"
#include "wirecheck/core/vars/resolver.hpp"
#include "lcr/log/logger.hpp"


namespace wirecheck::core {

/*
===============================================================================
 UnitExecutor
===============================================================================

Runs one execution unit on the calling worker thread:

  resolve templates -> [ send -> classify -> evaluate ] x attempts -> Outcome

  - Templates are resolved once per unit, against the bindings in scope.
  - Exceptions escaping Transport::send() are caught per attempt and
    classified as TransportFailure.
  - An attempt whose elapsed time exceeds the unit timeout counts as a
    Timeout, even when the transport returned a response.
  - A retryable status code is a transient failure; a failed expectation is an
    assertion failure.
  - Every attempt emits one metrics sample when a sink is attached.
  - Snapshots and failure details are redacted before they leave the unit.
===============================================================================
*/
template<transport::TransportConcept Transport>
class UnitExecutor {
public:
    UnitExecutor(Transport& transport,
                 const redaction::Policy& redaction,
                 const schedule::Cancellation* cancel = nullptr,
                 metrics::Aggregator* sink = nullptr) noexcept
        : transport_(transport)
        , redaction_(redaction)
        , cancel_(cancel)
        , sink_(sink)
    {}

    [[nodiscard]]
    Outcome execute(const TestCase& tc,
                    const vars::Resolver& resolver,
                    const retry::Policy& defaults,
                    std::chrono::milliseconds default_timeout) const
    {
        const Request request = resolver.resolve(tc.request);
        const Expectation expect = resolver.resolve(tc.expect);

        retry::Policy policy = tc.retry ? *tc.retry : defaults;
        policy.retry_on_assertion = policy.retry_on_assertion || tc.retry_on_assertion;
        const std::chrono::milliseconds timeout = tc.timeout ? *tc.timeout : default_timeout;

        // Last attempt payload
        transport::Reply last;
        assertion::Verdict verdict;

        const auto started = metrics::Clock::now();
        retry::Controller controller(policy, cancel_);
        const retry::Result result = controller.run([&](std::uint32_t attempt) -> retry::FailureClass {
            verdict = {};
            last = send_(request, timeout);
            WC_TRACE("[ENGINE] " << tc.name << " attempt " << attempt << ": "
                     << (last.ok() ? std::to_string(last.response.status) : std::string(transport::to_string(last.error))));

            if (!last.ok()) {
                return retry::classify(last.error);
            }
            verdict = assertion::evaluate(last.response, expect);
            if (policy.is_retryable_status(last.response.status)) {
                return retry::FailureClass::Transient;
            }
            return verdict.passed() ? retry::FailureClass::None : retry::FailureClass::Assertion;
        });
        const auto finished = metrics::Clock::now();

        if (result.interrupted) {
            Outcome cancelled = Outcome::cancelled(cancel_ ? cancel_->reason() : std::string("cancelled"));
            cancelled.attempts = result.attempts;
            cancelled.duration = std::chrono::duration_cast<std::chrono::microseconds>(finished - started);
            return cancelled;
        }

        Outcome outcome;
        outcome.status = result.status;
        outcome.attempts = result.attempts;
        outcome.duration = std::chrono::duration_cast<std::chrono::microseconds>(finished - started);
        outcome.request = redaction_.redact(request);

        if (last.ok()) {
            outcome.response = redaction_.redact(last.response);
            outcome.call = ExecutedCall{request.method, coverage::normalize_path(request.url), last.response.status};
        }

        if (outcome.status == OutcomeStatus::Failed) {
            if (!last.ok()) {
                outcome.reason = std::string(transport::to_string(last.error)) + ": " + redaction_.redact_text(last.detail);
            }
            else if (result.last_failure == retry::FailureClass::Transient && verdict.passed()) {
                outcome.reason = "retryable status " + std::to_string(last.response.status);
            }
            outcome.failures = std::move(verdict.mismatches);
            redaction_.redact(outcome.failures);
        }
        else if (outcome.status == OutcomeStatus::Flaky) {
            outcome.reason = "passed on attempt " + std::to_string(result.attempts);
        }
        return outcome;
    }

private:
    [[nodiscard]]
    transport::Reply send_(const Request& request, std::chrono::milliseconds timeout) const {
        transport::Reply reply;
        const auto t0 = metrics::Clock::now();
        try {
            reply = transport_.send(request, timeout);
        }
        catch (const std::exception& e) {
            reply = transport::Reply{};
            reply.error = transport::Error::TransportFailure;
            reply.detail = e.what();
        }
        catch (...) {
            reply = transport::Reply{};
            reply.error = transport::Error::TransportFailure;
            reply.detail = "non-standard exception escaped send()";
        }
        const auto t1 = metrics::Clock::now();
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0);

        if (reply.ok() && elapsed > timeout) {
            reply.error = transport::Error::Timeout;
            reply.detail = "no response within " + std::to_string(timeout.count()) + " ms";
        }

        if (sink_) {
            metrics::Sample sample;
            sample.timestamp = t1;
            sample.latency = elapsed;
            sample.transport_error = !reply.ok();
            sample.status = reply.ok() ? reply.response.status : 0;
            sample.success = reply.ok() && reply.response.status < 400;
            sample.bytes_sent = request.url.size() + (request.body ? request.body->size() : 0);
            sample.bytes_received = reply.ok() ? reply.response.body.size() : 0;
            sink_->record(sample);
        }
        return reply;
    }

private:
    Transport& transport_;
    const redaction::Policy& redaction_;
    const schedule::Cancellation* cancel_;
    metrics::Aggregator* sink_;
};

} // namespace wirecheck::core
