#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

#include "wirecheck/core/model/request.hpp"
#include "wirecheck/core/model/expectation.hpp"
#include "wirecheck/core/retry/policy.hpp"


namespace wirecheck::core {

// Variable bindings (name -> value). Values are strings; typed coercion is
// deferred to template resolution and assertion evaluation.
using Bindings = std::map<std::string, std::string>;

// -----------------------------------------------------------------------------
// TestCase (also used for setup / teardown steps)
// -----------------------------------------------------------------------------
struct TestCase {
    std::string name;
    Request request;
    Expectation expect;

    // Per-case overrides (run defaults apply when unset)
    std::optional<core::retry::Policy> retry;
    std::optional<std::chrono::milliseconds> timeout;
    bool retry_on_assertion{false};
};

// -----------------------------------------------------------------------------
// Dataset
// -----------------------------------------------------------------------------
using DatasetRow = Bindings;

struct Dataset {
    std::string name;
    std::vector<DatasetRow> rows;
    // Concurrency override for dataset-driven runs (0 = use the run bound)
    std::uint32_t parallel{0};
};

// -----------------------------------------------------------------------------
// Suite
// -----------------------------------------------------------------------------
struct Suite {
    std::string name;
    Bindings vars;
    std::vector<TestCase> setup;
    std::vector<TestCase> tests;
    std::optional<std::string> dataset_ref;
    std::vector<TestCase> teardown;
};

} // namespace wirecheck::core
