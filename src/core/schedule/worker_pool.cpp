#include "wirecheck/core/schedule/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "lcr/log/logger.hpp"


namespace wirecheck::core::schedule {

WorkerPool::WorkerPool(Cancellation& cancel, std::uint32_t bound, std::uint32_t max_workers)
    : cancel_(cancel)
    , max_workers_(max_workers == 0 ? 1 : max_workers)
    , bound_(std::min(bound, max_workers_))
{
    listener_id_ = cancel_.subscribe([this](CancelMode mode, const std::string&) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (mode == CancelMode::Abandon && active_) {
            abandon_pending_ = true;
        }
        cv_.notify_all();
    });
}

WorkerPool::~WorkerPool() {
    bool active;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        active = active_;
    }
    if (active) {
        WC_WARN("[POOL] Destroyed while running; draining in-flight units");
        cancel_.request(CancelMode::GracefulDrain, "worker pool destroyed");
        wait();
    }
    cancel_.unsubscribe(listener_id_);
}

// -----------------------------------------------------------------------------
// Public API
// -----------------------------------------------------------------------------

void WorkerPool::run(UnitIndex total, WorkFn work, CompleteFn complete) {
    if (total == 0) {
        return;
    }
    begin_(total, std::move(work), std::move(complete));
    wait();
}

void WorkerPool::start(WorkFn work, CompleteFn complete) {
    begin_(UNBOUNDED, std::move(work), std::move(complete));
}

void WorkerPool::stop(CancelMode mode) {
    cancel_.request(mode, "stopped");
    wait();
}

void WorkerPool::wait() {
    std::unique_lock<std::mutex> lk(mtx_);
    if (!active_) {
        return;
    }
    while (true) {
        cv_.wait(lk, [this] { return abandon_pending_ || drained_locked_(); });
        if (abandon_pending_) {
            abandon_in_flight_(lk);
            continue;
        }
        break;
    }
    finish_(lk);
}

void WorkerPool::set_bound(std::uint32_t n) {
    n = std::min(n, max_workers_);
    std::lock_guard<std::mutex> lk(mtx_);
    if (n != bound_) {
        WC_TRACE("[POOL] Concurrency bound " << bound_ << " -> " << n);
    }
    bound_ = n;
    if (active_ && !closing_) {
        spawn_workers_locked_(std::min<std::size_t>(bound_, total_));
    }
    cv_.notify_all();
}

void WorkerPool::set_bail(bool on) {
    std::lock_guard<std::mutex> lk(mtx_);
    bail_ = on;
}

std::uint32_t WorkerPool::bound() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return bound_;
}

std::size_t WorkerPool::in_flight() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return in_flight_;
}

std::size_t WorkerPool::max_in_flight() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return max_in_flight_;
}

std::size_t WorkerPool::dispatched() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dispatched_;
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------

void WorkerPool::begin_(UnitIndex total, WorkFn work, CompleteFn complete) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (active_) {
        WC_ERROR("[POOL] begin ignored: a run is already active");
        return;
    }
    total_ = total;
    next_index_ = 0;
    in_flight_ = 0;
    max_in_flight_ = 0;
    dispatched_ = 0;
    running_.clear();
    abandoned_.clear();
    work_ = std::move(work);
    complete_ = std::move(complete);
    active_ = true;
    closing_ = false;
    bail_tripped_ = false;
    abandon_pending_ = false;
    if (total_ == UNBOUNDED) {
        WC_DEBUG("[POOL] Starting open-ended run (bound=" << bound_ << ")");
    }
    else {
        WC_DEBUG("[POOL] Starting run of " << total_ << " unit(s) (bound=" << bound_ << ")");
    }
    spawn_workers_locked_(std::min<std::size_t>(bound_, total_));
}

void WorkerPool::spawn_workers_locked_(std::size_t wanted) {
    wanted = std::min<std::size_t>(wanted, max_workers_);
    while (workers_.size() < wanted) {
        workers_.emplace_back(&WorkerPool::worker_loop_, this);
    }
}

bool WorkerPool::can_dispatch_locked_() const noexcept {
    return !closing_
        && !bail_tripped_
        && !cancel_.requested()
        && next_index_ < total_
        && in_flight_ < bound_;
}

bool WorkerPool::drained_locked_() const noexcept {
    if (in_flight_ != 0) {
        return false;
    }
    return next_index_ >= total_ || bail_tripped_ || cancel_.requested();
}

void WorkerPool::worker_loop_() {
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
        cv_.wait(lk, [this] { return closing_ || can_dispatch_locked_(); });
        if (!can_dispatch_locked_()) {
            return;
        }
        const UnitIndex index = next_index_++;
        ++in_flight_;
        ++dispatched_;
        max_in_flight_ = std::max(max_in_flight_, in_flight_);
        running_.insert(index);
        lk.unlock();

        Outcome outcome = execute_(index);

        lk.lock();
        running_.erase(index);
        --in_flight_;
        const bool discard = abandoned_.erase(index) > 0;
        bool trip = false;
        if (!discard && bail_ && !bail_tripped_ && outcome.status == OutcomeStatus::Failed) {
            bail_tripped_ = true;
            trip = true;
        }
        cv_.notify_all();
        lk.unlock();

        if (trip) {
            WC_INFO("[POOL] Bail: unit #" << index << " failed, no further units will start");
            cancel_.request(CancelMode::GracefulDrain, "bail after first failure");
        }
        if (discard) {
            WC_TRACE("[POOL] Discarding late result of abandoned unit #" << index);
        }
        else {
            publish_(index, std::move(outcome));
        }
        lk.lock();
    }
}

void WorkerPool::abandon_in_flight_(std::unique_lock<std::mutex>& lk) {
    abandon_pending_ = false;
    std::vector<UnitIndex> victims;
    victims.reserve(running_.size());
    for (UnitIndex index : running_) {
        if (abandoned_.insert(index).second) {
            victims.push_back(index);
        }
    }
    if (victims.empty()) {
        return;
    }
    std::sort(victims.begin(), victims.end());
    WC_INFO("[POOL] Abandoning " << victims.size() << " in-flight unit(s)");
    lk.unlock();
    const std::string reason = cancel_.reason();
    for (UnitIndex index : victims) {
        publish_(index, Outcome::cancelled(reason));
    }
    lk.lock();
}

void WorkerPool::finish_(std::unique_lock<std::mutex>& lk) {
    closing_ = true;
    cv_.notify_all();
    std::vector<std::thread> workers = std::move(workers_);
    workers_.clear();
    lk.unlock();

    for (auto& t : workers) {
        if (t.joinable()) {
            t.join();
        }
    }

    lk.lock();
    const UnitIndex first_skipped = next_index_;
    const UnitIndex total = total_;
    CompleteFn complete = std::move(complete_);
    work_ = nullptr;
    complete_ = nullptr;
    active_ = false;
    const std::size_t dispatched = dispatched_;
    const std::size_t peak = max_in_flight_;
    lk.unlock();

    if (total != UNBOUNDED) {
        if (first_skipped < total) {
            WC_DEBUG("[POOL] " << (total - first_skipped) << " unit(s) not started");
        }
        for (UnitIndex index = first_skipped; index < total; ++index) {
            complete(index, Outcome::skipped("not started"));
        }
    }
    WC_DEBUG("[POOL] Run finished (dispatched=" << dispatched << ", max in flight=" << peak << ")");

    lk.lock();
}

void WorkerPool::publish_(UnitIndex index, Outcome outcome) {
    complete_(index, std::move(outcome));
}

Outcome WorkerPool::execute_(UnitIndex index) {
    try {
        return work_(index);
    }
    catch (const std::exception& e) {
        WC_ERROR("[POOL] Unit #" << index << " raised: " << e.what());
        Outcome outcome;
        outcome.status = OutcomeStatus::Failed;
        outcome.reason = std::string("unit raised: ") + e.what();
        return outcome;
    }
    catch (...) {
        WC_ERROR("[POOL] Unit #" << index << " raised a non-standard exception");
        Outcome outcome;
        outcome.status = OutcomeStatus::Failed;
        outcome.reason = "unit raised a non-standard exception";
        return outcome;
    }
}

} // namespace wirecheck::core::schedule
