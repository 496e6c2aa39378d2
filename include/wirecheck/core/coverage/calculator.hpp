#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "wirecheck/core/coverage/report.hpp"
#include "wirecheck/core/model/outcome.hpp"
#include "wirecheck/core/model/run_result.hpp"


namespace wirecheck::core::coverage {

/*
===============================================================================
 Coverage Calculator
===============================================================================

Matches executed calls against a declared catalog.

  - Paths are normalized before matching: scheme and authority, query string
    and fragment are dropped, duplicate and trailing slashes removed.
    Methods compare upper-cased.
  - Matching is structural per segment: "{param}" matches any non-empty
    segment, literal segments must be equal. When several entries match, the
    one with the fewest parameters wins (ties: catalog order).
  - Executed calls that match no entry are reported as uncatalogued, once per
    distinct (method, path, status).
===============================================================================
*/

// "/users//42/?x=1" -> "/users/42"; "https://h/a" -> "/a"
[[nodiscard]]
std::string normalize_path(std::string_view url);

[[nodiscard]]
Report evaluate(const std::vector<Call>& calls, const Catalog& catalog);

// Executed calls recorded in outcomes (units that received a response)
[[nodiscard]]
std::vector<Call> collect_calls(const std::vector<Outcome>& outcomes);

[[nodiscard]]
std::vector<Call> collect_calls(const RunResult& result);

} // namespace wirecheck::core::coverage
