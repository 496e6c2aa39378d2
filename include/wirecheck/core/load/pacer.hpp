#pragma once

#include <chrono>
#include <mutex>
#include <thread>
#include <algorithm>

#include "wirecheck/core/schedule/cancellation.hpp"


namespace wirecheck::core::load {

// -----------------------------------------------------------------------------
// Pacer: global arrival spacing shared by all workers
// -----------------------------------------------------------------------------
//
// acquire() blocks the caller until at least 1/rate has passed since the
// previous arrival, then claims the arrival. A rate of zero disables pacing.
// Waiters re-read the rate at least every RECHECK, so a rate change applies
// to callers that are already waiting.
// -----------------------------------------------------------------------------
class Pacer {
    using Clock = std::chrono::steady_clock;

    static constexpr auto RECHECK = std::chrono::milliseconds(10);

public:
    explicit Pacer(const schedule::Cancellation* cancel = nullptr) noexcept
        : cancel_(cancel)
    {}

    void set_rate(double rps) {
        std::lock_guard<std::mutex> lk(mtx_);
        rate_ = rps > 0.0 ? rps : 0.0;
    }

    [[nodiscard]]
    double rate() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return rate_;
    }

    // Returns false when the run was cancelled before the arrival
    [[nodiscard]]
    bool acquire() {
        while (true) {
            Clock::time_point slot;
            {
                std::lock_guard<std::mutex> lk(mtx_);
                if (rate_ <= 0.0) {
                    return !cancelled_();
                }
                const auto now = Clock::now();
                const auto spacing = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / rate_));
                slot = started_ ? std::max(now, last_ + spacing) : now;
                if (slot <= now) {
                    started_ = true;
                    last_ = now;
                    return !cancelled_();
                }
            }
            if (cancelled_()) {
                return false;
            }
            const auto wake = std::min(slot, Clock::now() + RECHECK);
            if (cancel_) {
                if (!cancel_->wait_until(wake)) {
                    return false;
                }
            }
            else {
                std::this_thread::sleep_until(wake);
            }
        }
    }

private:
    [[nodiscard]]
    bool cancelled_() const noexcept {
        return cancel_ && cancel_->requested();
    }

private:
    const schedule::Cancellation* cancel_;
    mutable std::mutex mtx_;
    double rate_{0.0};
    bool started_{false};
    Clock::time_point last_{};
};

} // namespace wirecheck::core::load
