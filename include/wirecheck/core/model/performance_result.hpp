#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "wirecheck/core/config/error.hpp"
#include "wirecheck/core/load/plan.hpp"
#include "wirecheck/core/metrics/aggregator.hpp"


namespace wirecheck::core {

// -----------------------------------------------------------------------------
// PerformanceResult: final record of a load run
// -----------------------------------------------------------------------------
struct PerformanceResult {
    // Set when the plan or context was rejected; nothing ran
    config::Error config_error{config::Error::None};
    std::string config_message;

    load::LoadPlan plan;
    metrics::FinalStats stats;

    std::size_t snapshots{0};        // Live snapshots delivered
    std::size_t max_in_flight{0};    // Peak concurrency observed by the pool
    std::uint32_t peak_target{0};    // Highest target issued by the driver

    bool cancelled{false};
    std::string cancel_reason;

    [[nodiscard]]
    bool ok() const noexcept { return config_error == config::Error::None; }

    [[nodiscard]]
    static PerformanceResult config_failure(const load::LoadPlan& plan, config::Error err, std::string message) {
        PerformanceResult r;
        r.plan = plan;
        r.config_error = err;
        r.config_message = std::move(message);
        return r;
    }

    [[nodiscard]] std::string summary() const;
};

} // namespace wirecheck::core
