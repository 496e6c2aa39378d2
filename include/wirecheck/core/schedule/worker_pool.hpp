#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <vector>
#include <unordered_set>

#include "wirecheck/core/config/defaults.hpp"
#include "wirecheck/core/model/outcome.hpp"
#include "wirecheck/core/schedule/cancellation.hpp"


namespace wirecheck::core::schedule {

/*
===============================================================================
 WorkerPool
===============================================================================

Bounded-concurrency executor for execution units identified by a sequence
index.

Dispatch:
  - Units are dispatched in index order, at most `bound` in flight at any time.
    The bound is read under the pool lock by the dispatching worker, so the
    in-flight count never exceeds the bound in effect at dispatch time.
  - set_bound() may be called at any time. Raising it starts units at once;
    lowering it lets in-flight units finish without replacement.

Completion:
  - Every unit handed to the pool produces exactly one call to `complete`,
    from whichever thread finishes it (completion order is unconstrained).
  - Units never dispatched before a finite run ended are completed as
    skipped ("not started").

Cancellation (shared token):
  - Any request stops new dispatch.
  - GracefulDrain: in-flight units finish normally.
  - Abandon: every in-flight unit is completed as cancelled immediately; the
    real result, when it eventually arrives, is discarded.
  - Bail: when enabled, the first Failed outcome requests a graceful drain.

Worker threads block only inside `work`. The pool joins its threads before
run()/wait() return.
===============================================================================
*/
class WorkerPool {
public:
    using UnitIndex = std::size_t;
    using WorkFn = std::function<Outcome(UnitIndex)>;
    using CompleteFn = std::function<void(UnitIndex, Outcome)>;

    static constexpr UnitIndex UNBOUNDED = std::numeric_limits<UnitIndex>::max();

    WorkerPool(Cancellation& cancel, std::uint32_t bound, std::uint32_t max_workers = config::MAX_WORKERS);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Finite run over units [0, total). Blocks until every unit is completed.
    void run(UnitIndex total, WorkFn work, CompleteFn complete);

    // Open-ended run: dispatches units 0, 1, 2, ... until stopped.
    void start(WorkFn work, CompleteFn complete);

    // Requests cancellation and waits for the workers to exit
    void stop(CancelMode mode);

    // Waits for an open-ended run to end (after a cancellation request)
    void wait();

    void set_bound(std::uint32_t n);
    void set_bail(bool on);

    [[nodiscard]] std::uint32_t bound() const;
    [[nodiscard]] std::size_t in_flight() const;
    [[nodiscard]] std::size_t max_in_flight() const;
    [[nodiscard]] std::size_t dispatched() const;

private:
    void begin_(UnitIndex total, WorkFn work, CompleteFn complete);
    void spawn_workers_locked_(std::size_t wanted);
    void worker_loop_();
    [[nodiscard]] bool can_dispatch_locked_() const noexcept;
    [[nodiscard]] bool drained_locked_() const noexcept;
    void abandon_in_flight_(std::unique_lock<std::mutex>& lk);
    void finish_(std::unique_lock<std::mutex>& lk);
    void publish_(UnitIndex index, Outcome outcome);
    [[nodiscard]] Outcome execute_(UnitIndex index);

private:
    Cancellation& cancel_;
    Cancellation::ListenerId listener_id_{0};
    const std::uint32_t max_workers_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;

    std::uint32_t bound_;
    bool bail_{false};
    bool bail_tripped_{false};
    bool active_{false};
    bool closing_{false};
    bool abandon_pending_{false};

    UnitIndex total_{0};
    UnitIndex next_index_{0};
    std::size_t in_flight_{0};
    std::size_t max_in_flight_{0};
    std::size_t dispatched_{0};

    std::unordered_set<UnitIndex> running_;     // Dispatched, not yet completed
    std::unordered_set<UnitIndex> abandoned_;   // Completed as cancelled, result pending

    WorkFn work_;
    CompleteFn complete_;
    std::vector<std::thread> workers_;
};

} // namespace wirecheck::core::schedule
