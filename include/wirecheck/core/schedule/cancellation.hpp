#pragma once

#include <cstdint>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <algorithm>

#include "lcr/log/logger.hpp"


namespace wirecheck::core::schedule {

enum class CancelMode : std::uint8_t {
    GracefulDrain, // Stop dispatching; in-flight units run to completion
    Abandon        // Stop dispatching; in-flight units are reported cancelled at once
};

[[nodiscard]]
inline constexpr std::string_view to_string(CancelMode m) noexcept {
    switch (m) {
        case CancelMode::GracefulDrain: return "graceful";
        case CancelMode::Abandon:       return "abandon";
        default:                        return "unknown";
    }
}

/*
===============================================================================
 Cancellation
===============================================================================

Run-scoped cancellation token shared by the caller, the worker pool and the
retry controller.

- The first request() wins its reason. A later Abandon request escalates a
  graceful drain; a graceful request never downgrades an abandon.
- requested() / abandoned() are lock-free and may be polled from any thread.
- wait_for() is an interruptible sleep: it returns early once the token is
  abandoned (retry backoff, pacing).
- Listeners are notified on every state change while the token lock is held;
  they must not call back into the same token.
===============================================================================
*/
class Cancellation {
public:
    using Listener = std::function<void(CancelMode, const std::string&)>;
    using ListenerId = std::uint64_t;

    Cancellation() = default;
    Cancellation(const Cancellation&) = delete;
    Cancellation& operator=(const Cancellation&) = delete;

    // Returns true when the call changed the token state
    bool request(CancelMode mode, std::string reason = "cancelled") {
        std::lock_guard<std::mutex> lk(mtx_);
        const bool was_requested = requested_.load(std::memory_order_relaxed);
        if (was_requested && (abandoned_.load(std::memory_order_relaxed) || mode == CancelMode::GracefulDrain)) {
            return false;
        }
        if (!was_requested) {
            reason_ = std::move(reason);
        }
        if (mode == CancelMode::Abandon) {
            abandoned_.store(true, std::memory_order_release);
        }
        requested_.store(true, std::memory_order_release);
        WC_DEBUG("[CANCEL] Cancellation requested (" << to_string(mode) << "): " << reason_);
        for (auto& [id, listener] : listeners_) {
            listener(mode, reason_);
        }
        cv_.notify_all();
        return true;
    }

    [[nodiscard]]
    bool requested() const noexcept {
        return requested_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    bool abandoned() const noexcept {
        return abandoned_.load(std::memory_order_acquire);
    }

    [[nodiscard]]
    CancelMode mode() const noexcept {
        return abandoned() ? CancelMode::Abandon : CancelMode::GracefulDrain;
    }

    [[nodiscard]]
    std::string reason() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return reason_;
    }

    // Sleeps for `d` unless abandoned first. Returns false when interrupted.
    template<class Rep, class Period>
    bool wait_for(std::chrono::duration<Rep, Period> d) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return !cv_.wait_for(lk, d, [this] { return abandoned(); });
    }

    // Sleeps until `deadline` unless abandoned first. Returns false when interrupted.
    template<class Clock, class Duration>
    bool wait_until(std::chrono::time_point<Clock, Duration> deadline) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return !cv_.wait_until(lk, deadline, [this] { return abandoned(); });
    }

    ListenerId subscribe(Listener listener) {
        std::lock_guard<std::mutex> lk(mtx_);
        const ListenerId id = ++next_listener_id_;
        listeners_.emplace_back(id, std::move(listener));
        return id;
    }

    void unsubscribe(ListenerId id) {
        std::lock_guard<std::mutex> lk(mtx_);
        listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
            [id](const auto& entry) { return entry.first == id; }), listeners_.end());
    }

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::atomic<bool> requested_{false};
    std::atomic<bool> abandoned_{false};
    std::string reason_;
    std::vector<std::pair<ListenerId, Listener>> listeners_;
    ListenerId next_listener_id_{0};
};

// -----------------------------------------------------------------------------
// CancellationLink: forwards requests from an outer token to an inner one for
// the lifetime of the link (run token -> phase token). A request already made
// on the outer token is forwarded at construction.
// -----------------------------------------------------------------------------
class CancellationLink {
public:
    CancellationLink(Cancellation* outer, Cancellation& inner)
        : outer_(outer)
    {
        if (!outer_) {
            return;
        }
        id_ = outer_->subscribe([&inner](CancelMode mode, const std::string& reason) {
            inner.request(mode, reason);
        });
        if (outer_->requested()) {
            inner.request(outer_->mode(), outer_->reason());
        }
    }

    ~CancellationLink() {
        if (outer_) {
            outer_->unsubscribe(id_);
        }
    }

    CancellationLink(const CancellationLink&) = delete;
    CancellationLink& operator=(const CancellationLink&) = delete;

private:
    Cancellation* outer_;
    Cancellation::ListenerId id_{0};
};

} // namespace wirecheck::core::schedule
