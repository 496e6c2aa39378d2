#include "wirecheck/core/load/driver.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "lcr/log/logger.hpp"


namespace wirecheck::core::load {

namespace {

using std::chrono::nanoseconds;

struct SpikePhase {
    bool active{false};
    double remaining_s{0.0};  // Until the spike ends (active) or starts (inactive)
};

// Spike k occupies [k*I + (I-D)/2, k*I + (I+D)/2)
[[nodiscard]]
SpikePhase spike_phase(const LoadPlan& plan, nanoseconds elapsed) noexcept {
    const double t = std::chrono::duration<double>(elapsed).count();
    const double interval = std::chrono::duration<double>(plan.spike.interval).count();
    const double width = std::chrono::duration<double>(plan.spike.duration).count();
    if (interval <= 0.0) {
        return {};
    }
    const double cycle = std::floor(t / interval);
    const double start = cycle * interval + (interval - width) / 2.0;
    const double end = start + width;
    const bool within_repeat = plan.spike.repeat == 0 || cycle < static_cast<double>(plan.spike.repeat);

    if (within_repeat && t >= start && t < end) {
        return {true, end - t};
    }
    // Next spike start
    double next = (t < start) ? start : start + interval;
    const double next_cycle = std::floor(next / interval);
    if (plan.spike.repeat != 0 && next_cycle >= static_cast<double>(plan.spike.repeat)) {
        return {false, -1.0}; // No further spike
    }
    return {false, next - t};
}

[[nodiscard]]
std::uint32_t clamp_target(double value, std::uint32_t cap) noexcept {
    if (!(value > 0.0)) return 0;
    const double floored = std::floor(value + 1e-9);
    if (floored >= static_cast<double>(cap)) return cap;
    return static_cast<std::uint32_t>(floored);
}

} // namespace

Tick Driver::evaluate(const LoadPlan& plan, nanoseconds elapsed) noexcept {
    if (elapsed.count() < 0) {
        elapsed = nanoseconds{0};
    }
    Tick out;
    if (elapsed >= plan.duration) {
        out.state = State::Draining;
        return out;
    }

    const std::uint32_t cap = plan.cap();
    const double base_rps = plan.target_rps.value_or(0.0);

    switch (plan.pattern) {
        case Pattern::Constant:
            out.state = State::Steady;
            out.target = clamp_target(plan.target, cap);
            out.rps = base_rps;
            break;

        case Pattern::RampUp: {
            if (plan.ramp.count() > 0 && elapsed < plan.ramp) {
                const double progress = std::chrono::duration<double>(elapsed).count()
                                      / std::chrono::duration<double>(plan.ramp).count();
                out.state = State::Ramping;
                out.target = clamp_target(static_cast<double>(plan.target) * progress, cap);
                out.rps = base_rps * progress;
            }
            else {
                out.state = State::Steady;
                out.target = clamp_target(plan.target, cap);
                out.rps = base_rps;
            }
            break;
        }

        case Pattern::Spike: {
            const SpikePhase phase = spike_phase(plan, elapsed);
            if (phase.active) {
                out.state = State::Spiking;
                out.target = clamp_target(plan.peak(), cap);
                out.rps = base_rps * static_cast<double>(plan.peak()) / static_cast<double>(plan.target);
            }
            else {
                out.state = State::Steady;
                out.target = clamp_target(plan.target, cap);
                out.rps = base_rps;
            }
            break;
        }
    }
    return out;
}

Tick Driver::tick(nanoseconds elapsed) {
    if (state_ == State::Done) {
        return Tick{State::Done, 0, 0.0};
    }
    Tick out = evaluate(plan_, elapsed);
    // Draining is terminal until finish()
    if (state_ == State::Draining) {
        out = Tick{State::Draining, 0, 0.0};
    }
    transition_(out.state);
    return out;
}

void Driver::finish() {
    transition_(State::Done);
}

void Driver::transition_(State next) {
    if (next == state_) {
        return;
    }
    WC_DEBUG("[LOAD] " << to_string(state_) << " -> " << to_string(next));
    state_ = next;
}

std::string describe(const LoadPlan& plan, nanoseconds elapsed) {
    if (elapsed.count() < 0) {
        elapsed = nanoseconds{0};
    }
    if (elapsed >= plan.duration) {
        return "Draining";
    }
    char buf[96];
    switch (plan.pattern) {
        case Pattern::Constant:
            return "Constant load";
        case Pattern::RampUp: {
            if (plan.ramp.count() > 0 && elapsed < plan.ramp) {
                const double progress = std::chrono::duration<double>(elapsed).count()
                                      / std::chrono::duration<double>(plan.ramp).count();
                std::snprintf(buf, sizeof(buf), "Ramping up (%u%%)", static_cast<unsigned>(progress * 100.0));
                return buf;
            }
            return "Full load";
        }
        case Pattern::Spike: {
            const SpikePhase phase = spike_phase(plan, elapsed);
            if (phase.active) {
                std::snprintf(buf, sizeof(buf), "Spike phase (%.1fs remaining)", phase.remaining_s);
                return buf;
            }
            if (phase.remaining_s < 0.0) {
                return "Normal phase";
            }
            std::snprintf(buf, sizeof(buf), "Normal phase (%.1fs to spike)", phase.remaining_s);
            return buf;
        }
    }
    return "Unknown";
}

} // namespace wirecheck::core::load
