#include "wirecheck/core/collate/result_collator.hpp"

#include <unordered_map>
#include <utility>

#include "lcr/log/logger.hpp"


namespace wirecheck::core::collate {

namespace {

void tally(CaseTally& t, OutcomeStatus s) noexcept {
    switch (s) {
        case OutcomeStatus::Passed:    ++t.passed;    break;
        case OutcomeStatus::Failed:    ++t.failed;    break;
        case OutcomeStatus::Flaky:     ++t.flaky;     break;
        case OutcomeStatus::Skipped:   ++t.skipped;   break;
        case OutcomeStatus::Cancelled: ++t.cancelled; break;
    }
}

void count(Counts& c, OutcomeStatus s) noexcept {
    switch (s) {
        case OutcomeStatus::Passed:    ++c.passed;    break;
        case OutcomeStatus::Failed:    ++c.failed;    break;
        case OutcomeStatus::Flaky:     ++c.flaky;     break;
        case OutcomeStatus::Skipped:   ++c.skipped;   break;
        case OutcomeStatus::Cancelled: ++c.cancelled; break;
    }
}

[[nodiscard]]
OutcomeStatus case_verdict(const CaseTally& t) noexcept {
    if (t.failed > 0)    return OutcomeStatus::Failed;
    if (t.flaky > 0)     return OutcomeStatus::Flaky;
    if (t.passed > 0)    return OutcomeStatus::Passed;
    if (t.cancelled > 0) return OutcomeStatus::Cancelled;
    return OutcomeStatus::Skipped;
}

} // namespace

ResultCollator::ResultCollator(std::string suite, std::vector<UnitInfo> units)
    : suite_(std::move(suite))
    , units_(std::move(units))
    , slots_(units_.size())
{}

bool ResultCollator::publish(std::size_t index, Outcome outcome) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (index >= slots_.size()) {
        ++rejected_;
        WC_ERROR("[COLLATE] Rejected outcome for unknown unit #" << index);
        return false;
    }
    if (slots_[index].has_value()) {
        ++rejected_;
        WC_WARN("[COLLATE] Rejected duplicate outcome for unit #" << index << " ('" << units_[index].name
                << "'): kept " << to_string(slots_[index]->status) << ", dropped " << to_string(outcome.status));
        return false;
    }
    outcome.name = units_[index].name;
    WC_TRACE("[COLLATE] #" << index << " " << outcome.name << " -> " << to_string(outcome.status));
    slots_[index] = std::move(outcome);
    ++filled_;
    return true;
}

std::optional<Outcome> ResultCollator::outcome(std::size_t index) const {
    std::lock_guard<std::mutex> lk(mtx_);
    if (index >= slots_.size()) {
        return std::nullopt;
    }
    return slots_[index];
}

RunResult ResultCollator::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return build_locked_(true);
}

RunResult ResultCollator::finalize(std::chrono::milliseconds duration) const {
    std::lock_guard<std::mutex> lk(mtx_);
    RunResult result = build_locked_(false);
    result.duration = duration;
    return result;
}

std::size_t ResultCollator::pending() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return slots_.size() - filled_;
}

std::size_t ResultCollator::rejected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return rejected_;
}

RunResult ResultCollator::build_locked_(bool live) const {
    RunResult result;
    result.suite = suite_;
    result.counts.total = slots_.size();
    result.outcomes.reserve(filled_);

    std::unordered_map<std::string, std::size_t> case_index;

    for (std::size_t i = 0; i < slots_.size(); ++i) {
        const UnitInfo& unit = units_[i];
        auto [it, inserted] = case_index.try_emplace(unit.case_key, result.cases.size());
        if (inserted) {
            CaseTally t;
            t.name = unit.case_key;
            t.phase = unit.phase;
            result.cases.push_back(std::move(t));
        }
        CaseTally& t = result.cases[it->second];

        if (!slots_[i].has_value()) {
            if (live) {
                ++result.counts.pending;
                continue;
            }
            // Every unit reports exactly one outcome
            WC_WARN("[COLLATE] Unit #" << i << " ('" << unit.name << "') never reported, recorded as not started");
            Outcome missing = Outcome::skipped("not started");
            missing.name = unit.name;
            count(result.counts, missing.status);
            tally(t, missing.status);
            result.outcomes.push_back(std::move(missing));
            continue;
        }
        const Outcome& o = *slots_[i];
        count(result.counts, o.status);
        tally(t, o.status);
        result.outcomes.push_back(o);
    }

    for (auto& t : result.cases) {
        t.verdict = case_verdict(t);
    }

    // Skipped and cancelled units do not count against the suite
    result.passed = result.counts.failed == 0;
    result.partial = live && result.counts.pending > 0;
    return result;
}

} // namespace wirecheck::core::collate
