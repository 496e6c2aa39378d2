#pragma once

#include <vector>

#include "wirecheck/core/model/request.hpp"
#include "wirecheck/core/model/expectation.hpp"
#include "wirecheck/core/assertion/mismatch.hpp"


namespace wirecheck::core::assertion {

// -----------------------------------------------------------------------------
// Verdict: pass, or the ordered list of failed checks
// -----------------------------------------------------------------------------
struct Verdict {
    std::vector<Mismatch> mismatches;

    [[nodiscard]] bool passed() const noexcept { return mismatches.empty(); }
};

/*
===============================================================================
 evaluate
===============================================================================

Checks a response against an already-resolved expectation. Pure function:
no substitution, no logging, safe to call concurrently.

  - Checks are evaluated in declaration order; every failing check
    contributes one Mismatch.
  - An empty expectation means "status < 400".
  - The body is parsed as JSON at most once, on the first structured check.
    A body that is not JSON fails each structured check with BodyNotJson.
  - Expected path values are JSON literals; text that is not valid JSON is
    compared as a JSON string.
===============================================================================
*/
[[nodiscard]]
Verdict evaluate(const Response& response, const Expectation& expectation);

} // namespace wirecheck::core::assertion
