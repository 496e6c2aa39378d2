#pragma once

#include <cstddef>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "wirecheck/core/model/outcome.hpp"
#include "wirecheck/core/model/run_result.hpp"


namespace wirecheck::core::collate {

// Plan-time description of one execution unit
struct UnitInfo {
    std::string name;        // Reported outcome name ("Setup: login", "get user [row 2]")
    std::string case_key;    // Groups dataset rows of the same case
    Phase phase{Phase::Test};
};

/*
===============================================================================
 ResultCollator
===============================================================================

Restores plan order from an unordered completion stream.

Outcomes land in a slot arena indexed by sequence number: publish() fills a
slot, snapshot() reads the arena at any time (unfilled slots are pending),
finalize() builds the ordered RunResult. A second publication for the same
slot is rejected and logged; the first outcome stays.

All members are safe to call concurrently.
===============================================================================
*/
class ResultCollator {
public:
    explicit ResultCollator(std::string suite, std::vector<UnitInfo> units);

    ResultCollator(const ResultCollator&) = delete;
    ResultCollator& operator=(const ResultCollator&) = delete;

    // Returns false for an out-of-range index or a duplicate publication
    bool publish(std::size_t index, Outcome outcome);

    // Published outcome of one slot, if any
    [[nodiscard]] std::optional<Outcome> outcome(std::size_t index) const;

    [[nodiscard]] RunResult snapshot() const;
    [[nodiscard]] RunResult finalize(std::chrono::milliseconds duration) const;

    [[nodiscard]] std::size_t size() const noexcept { return units_.size(); }
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t rejected() const;

private:
    [[nodiscard]] RunResult build_locked_(bool live) const;

private:
    const std::string suite_;
    const std::vector<UnitInfo> units_;

    mutable std::mutex mtx_;
    std::vector<std::optional<Outcome>> slots_;
    std::size_t filled_{0};
    std::size_t rejected_{0};
};

} // namespace wirecheck::core::collate
