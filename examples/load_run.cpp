#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "wirecheck.hpp"
#include "common/cli/load_params.hpp"
#include "common/simulated_transport.hpp"

using namespace wirecheck;
using namespace wirecheck::core;

// -----------------------------------------------------------------------------
// Ctrl+C handling
// -----------------------------------------------------------------------------
std::atomic<bool> running{true};

void on_signal(int) {
    running.store(false);
}

// -----------------------------------------------------------------------------
// Unit templates (round-robin)
// -----------------------------------------------------------------------------
std::vector<TestCase> unit_templates() {
    std::vector<TestCase> units(3);

    units[0].name = "get user";
    units[0].request.url = "{{base}}/users/{{id}}";
    units[0].expect.checks.push_back(StatusCheck{"200"});

    units[1].name = "list users";
    units[1].request.url = "{{base}}/users";
    units[1].expect.checks.push_back(StatusCheck{"2xx"});

    units[2].name = "login";
    units[2].request.method = "POST";
    units[2].request.url = "{{base}}/login";
    units[2].request.body = R"({"user":"load","password":"${API_PASSWORD:demo}"})";
    return units;
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::load::configure(argc, argv,
        "wirecheck - Load Test Example\n"
        "Drives constant, ramp-up or spike load and reports live and final latency statistics.\n");
    params.dump("=== wirecheck Load Run ===", std::cout);

    std::signal(SIGINT, on_signal);

    examples::SimulatedTransport transport(util::parse_duration(params.latency).value_or(std::chrono::milliseconds(25)),
                                           params.failure_rate);

    const load::LoadPlan plan = params.plan();

    schedule::Cancellation cancel;

    PerfContext ctx;
    ctx.cancel = &cancel;
    ctx.vars = {{"base", params.base_url}, {"id", "42"}};
    ctx.report_interval = util::parse_duration(params.report).value_or(ctx.report_interval);
    ctx.timeout = util::parse_duration(params.timeout).value_or(ctx.timeout);
    ctx.metrics.expected_samples = static_cast<std::size_t>(plan.cap()) * 64;

    // Ctrl+C stops dispatch, in-flight requests drain
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (!running.load()) {
                cancel.request(schedule::CancelMode::GracefulDrain, "interrupted by user");
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });

    const auto started = std::chrono::steady_clock::now();
    Engine<examples::SimulatedTransport> engine(transport);
    const PerformanceResult result = engine.execute_performance(plan, unit_templates(), ctx,
        [&](const metrics::Snapshot& snap, const load::Tick& tick) {
            const auto elapsed = std::chrono::steady_clock::now() - started;
            std::cout << " -> " << std::setw(32) << std::left << load::describe(plan, elapsed)
                      << " users=" << std::setw(4) << tick.target << " " << snap.str() << std::endl;
        });

    done.store(true);
    watcher.join();

    if (!result.ok()) {
        std::cerr << result.summary() << std::endl;
        return 2;
    }

    std::cout << "\n" << result.summary() << "\n";
    std::cout << "=== Done ===\n";
    return result.cancelled ? 1 : 0;
}
