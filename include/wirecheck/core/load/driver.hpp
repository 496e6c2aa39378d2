#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>

#include "wirecheck/core/load/plan.hpp"


namespace wirecheck::core::load {

enum class State : std::uint8_t {
    Idle,
    Ramping,
    Steady,
    Spiking,
    Draining,
    Done
};

[[nodiscard]]
inline constexpr std::string_view to_string(State s) noexcept {
    switch (s) {
        case State::Idle:     return "idle";
        case State::Ramping:  return "ramping";
        case State::Steady:   return "steady";
        case State::Spiking:  return "spiking";
        case State::Draining: return "draining";
        case State::Done:     return "done";
        default:              return "unknown";
    }
}

// Scheduling decision for one tick
struct Tick {
    State state{State::Idle};
    std::uint32_t target{0};   // Concurrency, clamped to [0, plan.cap()]
    double rps{0.0};           // Arrival rate; 0 = unpaced
};

/*
===============================================================================
 load::Driver
===============================================================================

Turns elapsed wall-clock time into a target concurrency (and arrival rate)
following the plan's pattern:

  constant  idle -> steady -> draining -> done
  ramp-up   idle -> ramping (0 -> target, linear) -> steady -> draining -> done
  spike     idle -> steady -> spiking -> steady ... -> draining -> done

Transitions depend on elapsed time only, never on completed work. Negative
elapsed time counts as zero. At or past the plan duration the driver reports
draining with a zero target; finish() marks the run done once in-flight
units are gone.
===============================================================================
*/
class Driver {
public:
    explicit Driver(const LoadPlan& plan) noexcept
        : plan_(plan)
    {}

    // Pure curve evaluation
    [[nodiscard]]
    static Tick evaluate(const LoadPlan& plan, std::chrono::nanoseconds elapsed) noexcept;

    // Evaluates the curve and records the state transition
    Tick tick(std::chrono::nanoseconds elapsed);

    // Draining complete
    void finish();

    [[nodiscard]] State state() const noexcept { return state_; }
    [[nodiscard]] const LoadPlan& plan() const noexcept { return plan_; }

private:
    void transition_(State next);

private:
    const LoadPlan& plan_;
    State state_{State::Idle};
};

// Human-readable phase for live display ("Ramping up (40%)", "Spike phase
// (2.5s remaining)", ...)
[[nodiscard]]
std::string describe(const LoadPlan& plan, std::chrono::nanoseconds elapsed);

} // namespace wirecheck::core::load
