#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace wirecheck::examples::cli::suite {

struct Params {
    std::string base_url             = "https://api.example.test";
    std::uint32_t concurrency        = 4;
    std::uint32_t rows               = 3;
    bool bail                        = false;
    std::uint32_t attempts           = 3;
    std::string backoff              = "50ms";
    std::string timeout              = "2s";
    std::string filter;
    std::string environment          = "local";
    std::vector<std::string> headers;
    bool coverage                    = true;
    double failure_rate              = 0.05;
    std::string latency              = "40ms";
    std::string log_level            = "info";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Base URL     : " << base_url << "\n"
           << "  Concurrency  : " << concurrency << "\n"
           << "  Dataset rows : " << rows << "\n"
           << "  Bail         : " << (bail ? "yes" : "no") << "\n"
           << "  Attempts     : " << attempts << " (backoff " << backoff << ")\n"
           << "  Timeout      : " << timeout << "\n"
           << "  Filter       : " << (filter.empty() ? "<none>" : filter) << "\n"
           << "  Environment  : " << environment << "\n"
           << "  Failure rate : " << failure_rate << "\n"
           << "  Latency      : " << latency << "\n"
           << "  Log Level    : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.base_url, "Base URL of the service under test")->check(http_url_validator)->default_val(params.base_url);
    app.add_option("-c,--concurrency", params.concurrency, "Maximum units in flight")->check(CLI::Range(1u, 1024u))->default_val(params.concurrency);
    app.add_option("--rows", params.rows, "Dataset rows driving the test cases")->check(CLI::Range(1u, 10000u))->default_val(params.rows);
    app.add_flag("--bail", params.bail, "Stop dispatching after the first failed unit");
    app.add_option("--attempts", params.attempts, "Attempts per unit (retries + 1)")->check(CLI::Range(1u, 20u))->default_val(params.attempts);
    app.add_option("--backoff", params.backoff, "Base retry backoff (e.g. 50ms)")->check(duration_validator)->default_val(params.backoff);
    app.add_option("-t,--timeout", params.timeout, "Per-attempt timeout (e.g. 2s)")->check(duration_validator)->default_val(params.timeout);
    app.add_option("-f,--filter", params.filter, "Only run steps whose name contains this text");
    app.add_option("-e,--env", params.environment, "Environment name bound as {{WIRECHECK_ENV}}")->default_val(params.environment);
    app.add_option("-H,--header", params.headers, "Extra request header, repeatable (e.g. -H 'X-Trace: 1')")->check(header_validator);
    app.add_option("--coverage", params.coverage, "Compute coverage against the demo catalog")->check(CLI::IsMember({true, false}))->default_val(params.coverage);
    app.add_option("--failure-rate", params.failure_rate, "Simulated 503 probability")->check(ratio_validator)->default_val(params.failure_rate);
    app.add_option("--latency", params.latency, "Simulated mean latency")->check(duration_validator)->default_val(params.latency);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->default_val(params.log_level);

    app.footer(
        "The suite runs against an in-process simulated service.\n"
        "Press Ctrl+C to abandon the run; in-flight units are reported cancelled."
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

} // namespace wirecheck::examples::cli::suite
