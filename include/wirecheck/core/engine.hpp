#pragma once

#include <cstddef>
#include <cstdint>
#include <algorithm>
#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "wirecheck/core/collate/result_collator.hpp"
#include "wirecheck/core/config/run_context.hpp"
#include "wirecheck/core/coverage/calculator.hpp"
#include "wirecheck/core/load/driver.hpp"
#include "wirecheck/core/load/pacer.hpp"
#include "wirecheck/core/metrics/aggregator.hpp"
#include "wirecheck/core/model/performance_result.hpp"
#include "wirecheck/core/model/run_result.hpp"
#include "wirecheck/core/model/suite.hpp"
#include "wirecheck/core/schedule/cancellation.hpp"
#include "wirecheck/core/schedule/worker_pool.hpp"
#include "wirecheck/core/transport/concepts.hpp"
#include "wirecheck/core/unit_executor.hpp"
#include "wirecheck/core/vars/resolver.hpp"
#include "lcr/log/logger.hpp"


namespace wirecheck::core {

using RunContext = config::RunContext;
using PerfContext = config::PerfContext;

// Live snapshot callback of a performance run (called on the driving thread)
using SnapshotCallback = std::function<void(const metrics::Snapshot&, const load::Tick&)>;

/*
===============================================================================
 Engine
===============================================================================

Facade over the scheduler, retry controller, assertion evaluator, metrics
aggregator, result collator and coverage calculator.

execute()
  Plan, in sequence-index order:
    setup steps  ->  [dataset row] x tests  ->  teardown steps
  Setup and teardown run one unit at a time; the main phase runs through a
  worker pool bounded by the run concurrency (or the dataset override).
  Bail stops dispatch of setup and main units after the first failure;
  teardown still runs. A caller cancellation skips everything not yet
  started, teardown included.

execute_performance()
  Drives an open-ended worker pool from the load pattern: every tick the
  driver's target becomes the pool bound (and its rate the pacer rate).
  Units round-robin over the templates. When the plan duration is reached
  dispatch stops, in-flight units drain, and the final statistics are
  computed once.

Configuration errors are returned in the result before anything is
dispatched. Per-unit failures never abort a run unless bail is enabled.
===============================================================================
*/
template<transport::TransportConcept Transport>
class Engine {
public:
    explicit Engine(Transport& transport) noexcept
        : transport_(transport)
    {}

    [[nodiscard]]
    RunResult execute(const Suite& suite, const Dataset* dataset, const RunContext& ctx) {
        if (auto err = ctx.validate(); err != config::Error::None) {
            WC_ERROR("[ENGINE] Suite '" << suite.name << "' rejected: " << config::to_string(err));
            return RunResult::config_failure(suite.name, err, "invalid run context");
        }
        if (suite.dataset_ref && !dataset) {
            return reject_(suite.name, config::Error::EmptyDataset, "dataset '" + *suite.dataset_ref + "' not supplied");
        }
        if (dataset && dataset->rows.empty()) {
            return reject_(suite.name, config::Error::EmptyDataset, "dataset '" + dataset->name + "' has no rows");
        }
        for (const auto* phase : {&suite.setup, &suite.tests, &suite.teardown}) {
            for (const auto& tc : *phase) {
                if (tc.retry && tc.retry->validate() != config::Error::None) {
                    return reject_(suite.name, config::Error::InvalidRetryPolicy, "case '" + tc.name + "'");
                }
                if (tc.timeout && tc.timeout->count() <= 0) {
                    return reject_(suite.name, config::Error::InvalidTimeout, "case '" + tc.name + "'");
                }
            }
        }

        // Resolution contexts: suite-level, then one per dataset row
        const vars::Resolver base = make_resolver_(ctx.env, suite.vars, ctx.environment);
        std::vector<vars::Resolver> rows;
        if (dataset) {
            rows.reserve(dataset->rows.size());
            for (const auto& row : dataset->rows) {
                vars::Resolver r = base;
                r.with_row(row);
                rows.push_back(std::move(r));
            }
        }

        // Plan
        std::vector<PlannedUnit> plan;
        std::vector<collate::UnitInfo> infos;
        auto add = [&](const TestCase& tc, Phase phase, const vars::Resolver& resolver, std::string name, std::string key) {
            plan.push_back(PlannedUnit{&tc, &resolver});
            infos.push_back(collate::UnitInfo{std::move(name), std::move(key), phase});
        };
        for (const auto& tc : suite.setup) {
            if (selected_(ctx, tc)) add(tc, Phase::Setup, base, "Setup: " + tc.name, "Setup: " + tc.name);
        }
        const std::size_t setup_count = plan.size();
        std::size_t test_cases = 0;
        if (dataset) {
            for (std::size_t r = 0; r < rows.size(); ++r) {
                for (const auto& tc : suite.tests) {
                    if (!selected_(ctx, tc)) continue;
                    add(tc, Phase::Test, rows[r], tc.name + " [row " + std::to_string(r + 1) + "]", tc.name);
                    if (r == 0) ++test_cases;
                }
            }
        }
        else {
            for (const auto& tc : suite.tests) {
                if (!selected_(ctx, tc)) continue;
                add(tc, Phase::Test, base, tc.name, tc.name);
                ++test_cases;
            }
        }
        const std::size_t main_count = plan.size() - setup_count;
        for (const auto& tc : suite.teardown) {
            if (selected_(ctx, tc)) add(tc, Phase::Teardown, base, "Teardown: " + tc.name, "Teardown: " + tc.name);
        }
        const std::size_t teardown_count = plan.size() - setup_count - main_count;

        if (test_cases == 0) {
            return reject_(suite.name, config::Error::EmptySuite,
                           ctx.filter.empty() ? "no test cases" : "no test case matches filter '" + ctx.filter + "'");
        }

        const std::uint32_t bound = (dataset && dataset->parallel != 0) ? dataset->parallel : ctx.concurrency;
        WC_INFO("[ENGINE] Running suite '" << suite.name << "': " << setup_count << " setup, "
                << main_count << " test, " << teardown_count << " teardown unit(s), concurrency " << bound
                << (ctx.bail ? ", bail" : ""));

        collate::ResultCollator collator(suite.name, std::move(infos));
        metrics::Aggregator aggregator;
        const auto started = metrics::Clock::now();

        // Setup and main phase share a token (bail in setup skips the tests);
        // teardown has its own so that a bail does not reach it.
        schedule::Cancellation run_cancel;
        schedule::Cancellation teardown_cancel;
        schedule::CancellationLink run_link(ctx.cancel, run_cancel);
        schedule::CancellationLink teardown_link(ctx.cancel, teardown_cancel);

        std::size_t max_in_flight = 0;
        auto run_phase = [&](schedule::Cancellation& cancel, std::size_t first, std::size_t count,
                             std::uint32_t phase_bound, bool bail) {
            if (count == 0) {
                return;
            }
            UnitExecutor<Transport> executor(transport_, ctx.redaction, &cancel, &aggregator);
            schedule::WorkerPool pool(cancel, phase_bound);
            pool.set_bail(bail);
            pool.run(count,
                [&](std::size_t i) {
                    const PlannedUnit& unit = plan[first + i];
                    return executor.execute(*unit.tc, *unit.resolver, ctx.retry, ctx.timeout);
                },
                [&](std::size_t i, Outcome outcome) {
                    if (collator.publish(first + i, std::move(outcome)) && ctx.on_outcome) {
                        notify_(ctx, collator, first + i);
                    }
                });
            max_in_flight = std::max(max_in_flight, pool.max_in_flight());
        };

        run_phase(run_cancel, 0, setup_count, 1, ctx.bail);
        run_phase(run_cancel, setup_count, main_count, bound, ctx.bail);
        run_phase(teardown_cancel, setup_count + main_count, teardown_count, 1, false);

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(metrics::Clock::now() - started);
        RunResult result = collator.finalize(elapsed);
        result.latency = aggregator.finalize(metrics::Clock::now()).latency;
        result.max_in_flight = max_in_flight;
        if (ctx.cancel && ctx.cancel->requested()) {
            result.cancelled = true;
            result.cancel_reason = ctx.cancel->reason();
        }
        if (ctx.catalog) {
            result.coverage = coverage::evaluate(coverage::collect_calls(result), *ctx.catalog);
        }
        WC_INFO("[ENGINE] " << result.summary());
        return result;
    }

    [[nodiscard]]
    PerformanceResult execute_performance(const load::LoadPlan& plan,
                                          const std::vector<TestCase>& units,
                                          const PerfContext& ctx,
                                          SnapshotCallback on_snapshot = {})
    {
        if (auto err = plan.validate(); err != config::Error::None) {
            WC_ERROR("[ENGINE] Load plan rejected: " << config::to_string(err));
            return PerformanceResult::config_failure(plan, err, "invalid load plan");
        }
        if (auto err = ctx.validate(); err != config::Error::None) {
            WC_ERROR("[ENGINE] Load run rejected: " << config::to_string(err));
            return PerformanceResult::config_failure(plan, err, "invalid performance context");
        }
        if (units.empty()) {
            WC_ERROR("[ENGINE] Load run rejected: no unit template");
            return PerformanceResult::config_failure(plan, config::Error::NoUnits, "no unit template");
        }
        for (const auto& tc : units) {
            if (tc.retry && tc.retry->validate() != config::Error::None) {
                return PerformanceResult::config_failure(plan, config::Error::InvalidRetryPolicy, "unit '" + tc.name + "'");
            }
        }

        const vars::Resolver resolver = make_resolver_(ctx.env, ctx.vars, ctx.environment);

        PerformanceResult result;
        result.plan = plan;

        schedule::Cancellation run_cancel;
        schedule::CancellationLink link(ctx.cancel, run_cancel);

        const auto started = metrics::Clock::now();
        metrics::Aggregator aggregator(ctx.metrics, started);
        load::Driver driver(plan);
        load::Pacer pacer(&run_cancel);
        UnitExecutor<Transport> executor(transport_, ctx.redaction, &run_cancel, &aggregator);

        WC_INFO("[ENGINE] Load run: " << load::to_string(plan.pattern) << ", target " << plan.target
                << ", cap " << plan.cap() << ", duration " << plan.duration.count() << " ms, "
                << units.size() << " unit template(s)");

        schedule::WorkerPool pool(run_cancel, 0, plan.cap());
        pool.start(
            [&](std::size_t index) {
                if (!pacer.acquire()) {
                    return Outcome::cancelled(run_cancel.reason());
                }
                return executor.execute(units[index % units.size()], resolver, ctx.retry, ctx.timeout);
            },
            [](std::size_t, Outcome) {});

        auto next_report = started + ctx.report_interval;
        while (true) {
            const auto now = metrics::Clock::now();
            const load::Tick tick = driver.tick(now - started);
            if (tick.state == load::State::Draining) {
                break;
            }
            pacer.set_rate(tick.rps);
            pool.set_bound(tick.target);
            result.peak_target = std::max(result.peak_target, tick.target);

            if (ctx.report_interval.count() > 0 && now >= next_report) {
                next_report += ctx.report_interval;
                ++result.snapshots;
                if (on_snapshot) {
                    on_snapshot(aggregator.snapshot(now), tick);
                }
            }
            if (run_cancel.requested()) {
                WC_INFO("[ENGINE] Load run cancelled: " << run_cancel.reason());
                break;
            }
            if (!run_cancel.wait_for(ctx.tick)) {
                break;
            }
        }

        // Drain: stop dispatch, in-flight units finish (or are abandoned).
        // Units still waiting on the pacer see the request and never send.
        pool.set_bound(0);
        pool.stop(schedule::CancelMode::GracefulDrain);
        driver.finish();

        const auto ended = metrics::Clock::now();
        result.stats = aggregator.finalize(ended);
        result.max_in_flight = pool.max_in_flight();
        if (ctx.cancel && ctx.cancel->requested()) {
            result.cancelled = true;
            result.cancel_reason = ctx.cancel->reason();
        }
        WC_INFO("[ENGINE] " << result.summary());
        return result;
    }

private:
    struct PlannedUnit {
        const TestCase* tc;
        const vars::Resolver* resolver;
    };

    [[nodiscard]]
    static vars::Resolver make_resolver_(const vars::EnvLookup& env, const Bindings& vars, const std::string& environment) {
        vars::Resolver resolver = env ? vars::Resolver(env) : vars::Resolver();
        if (!environment.empty()) {
            resolver.set("WIRECHECK_ENV", environment);
        }
        resolver.with_vars(vars);
        return resolver;
    }

    [[nodiscard]]
    static bool selected_(const RunContext& ctx, const TestCase& tc) noexcept {
        return ctx.filter.empty() || tc.name.find(ctx.filter) != std::string::npos;
    }

    [[nodiscard]]
    static RunResult reject_(const std::string& suite, config::Error err, std::string message) {
        WC_ERROR("[ENGINE] Suite '" << suite << "' rejected: " << config::to_string(err) << " (" << message << ")");
        return RunResult::config_failure(suite, err, std::move(message));
    }

    static void notify_(const RunContext& ctx, const collate::ResultCollator& collator, std::size_t index) {
        if (auto outcome = collator.outcome(index)) {
            ctx.on_outcome(*outcome);
        }
    }

private:
    Transport& transport_;
};

} // namespace wirecheck::core
