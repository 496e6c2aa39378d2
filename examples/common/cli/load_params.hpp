#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"
#include "wirecheck/core/load/plan.hpp"
#include "wirecheck/core/util/parse.hpp"


namespace wirecheck::examples::cli::load {

struct Params {
    std::string base_url             = "https://api.example.test";
    std::string pattern              = "ramp-up";
    std::uint32_t target             = 20;
    std::string duration             = "20s";
    std::string ramp                 = "5s";
    std::uint32_t peak               = 0;
    std::string spike_interval       = "10s";
    std::string spike_duration       = "2s";
    std::uint32_t max_concurrency    = 0;
    double rps                       = 0.0;
    std::string report               = "1s";
    std::string timeout              = "5s";
    double failure_rate              = 0.02;
    std::string latency              = "25ms";
    std::string log_level            = "warn";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Base URL     : " << base_url << "\n"
           << "  Pattern      : " << pattern << "\n"
           << "  Target       : " << target << (rps > 0.0 ? " (" + std::to_string(rps) + " rps)" : std::string()) << "\n"
           << "  Duration     : " << duration << "\n";
        if (pattern == "ramp-up") {
            os << "  Ramp         : " << ramp << "\n";
        }
        if (pattern == "spike") {
            os << "  Spike        : peak " << (peak ? std::to_string(peak) : std::string("2x target"))
               << ", " << spike_duration << " every " << spike_interval << "\n";
        }
        os << "  Report       : every " << report << "\n"
           << "  Failure rate : " << failure_rate << "\n"
           << "  Latency      : " << latency << "\n"
           << "  Log Level    : " << log_level << "\n";
    }

    // Options are validated by configure()
    [[nodiscard]]
    core::load::LoadPlan plan() const {
        using core::util::parse_duration;
        core::load::LoadPlan p;
        p.pattern = core::load::parse_pattern(pattern).value_or(core::load::Pattern::Constant);
        p.target = target;
        p.duration = parse_duration(duration).value_or(std::chrono::milliseconds(0));
        p.ramp = parse_duration(ramp).value_or(std::chrono::milliseconds(0));
        p.spike.peak = peak;
        p.spike.interval = parse_duration(spike_interval).value_or(p.spike.interval);
        p.spike.duration = parse_duration(spike_duration).value_or(p.spike.duration);
        p.max_concurrency = max_concurrency;
        if (rps > 0.0) {
            p.target_rps = rps;
        }
        return p;
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.base_url, "Base URL of the service under test")->check(http_url_validator)->default_val(params.base_url);
    app.add_option("-p,--pattern", params.pattern, "Load pattern: constant | ramp-up | spike")->check(pattern_validator)->default_val(params.pattern);
    app.add_option("-u,--users", params.target, "Target concurrency (virtual users)")->check(CLI::Range(1u, 4096u))->default_val(params.target);
    app.add_option("-d,--duration", params.duration, "Run duration (e.g. 30s)")->check(duration_validator)->default_val(params.duration);
    app.add_option("--ramp", params.ramp, "Ramp-up duration")->check(duration_validator)->default_val(params.ramp);
    app.add_option("--peak", params.peak, "Spike concurrency (0 = twice the target)")->default_val(params.peak);
    app.add_option("--spike-interval", params.spike_interval, "Spike period")->check(duration_validator)->default_val(params.spike_interval);
    app.add_option("--spike-duration", params.spike_duration, "Spike length")->check(duration_validator)->default_val(params.spike_duration);
    app.add_option("--max-concurrency", params.max_concurrency, "Hard concurrency cap (0 = derived from the plan)")->default_val(params.max_concurrency);
    app.add_option("--rps", params.rps, "Arrival rate at the target level (0 = unpaced)")->check(CLI::NonNegativeNumber)->default_val(params.rps);
    app.add_option("--report", params.report, "Live report interval (0 disables)")->check(duration_validator)->default_val(params.report);
    app.add_option("-t,--timeout", params.timeout, "Per-attempt timeout")->check(duration_validator)->default_val(params.timeout);
    app.add_option("--failure-rate", params.failure_rate, "Simulated 503 probability")->check(ratio_validator)->default_val(params.failure_rate);
    app.add_option("--latency", params.latency, "Simulated mean latency")->check(duration_validator)->default_val(params.latency);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);

    app.footer(
        "The load runs against an in-process simulated service.\n"
        "Press Ctrl+C to stop dispatching and drain in-flight requests."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e, std::cout, std::cerr);
        std::exit(EXIT_FAILURE);
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace wirecheck::examples::cli::load
