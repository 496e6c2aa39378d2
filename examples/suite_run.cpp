#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "wirecheck.hpp"
#include "common/cli/suite_params.hpp"
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
// Demo suite
// -----------------------------------------------------------------------------
static constexpr const char* USER_SCHEMA = R"({
    "type": "object",
    "required": ["id", "name", "email"],
    "properties": {
        "id":     {"type": "integer", "minimum": 1},
        "name":   {"type": "string", "minLength": 1},
        "email":  {"type": "string"},
        "active": {"type": "boolean"}
    }
})";

TestCase make_step(std::string name, std::string method, std::string url, std::string status) {
    TestCase tc;
    tc.name = std::move(name);
    tc.request.method = std::move(method);
    tc.request.url = std::move(url);
    tc.request.headers = {{"Authorization", "Bearer {{token}}"}, {"X-Environment", "{{WIRECHECK_ENV}}"}};
    tc.expect.checks.push_back(StatusCheck{std::move(status)});
    return tc;
}

Suite demo_suite(const examples::cli::suite::Params& params) {
    Suite suite;
    suite.name = "users-api";
    suite.dataset_ref = "user-ids";
    suite.vars = {{"base", params.base_url}, {"token", "${API_TOKEN:demo-token}"}};

    TestCase login = make_step("login", "POST", "{{base}}/login", "200");
    login.request.body = R"({"user":"demo","password":"${API_PASSWORD:demo}"})";
    login.expect.checks.push_back(SchemaCheck{R"({"type":"object","required":["token"],"properties":{"token":{"type":"string"}}})", ""});
    suite.setup.push_back(login);

    TestCase get_user = make_step("get user", "GET", "{{base}}/users/{{id}}", "200");
    get_user.expect.checks.push_back(HeaderCheck{"Content-Type", std::string("application/json")});
    get_user.expect.checks.push_back(PathCheck{"$.id", "{{id}}"});
    get_user.expect.checks.push_back(SchemaCheck{USER_SCHEMA, ""});
    suite.tests.push_back(get_user);

    TestCase list_users = make_step("list users", "GET", "{{base}}/users?page=1", "2xx");
    list_users.expect.checks.push_back(PathCheck{"$[0].active", "true"});
    list_users.expect.checks.push_back(SchemaCheck{USER_SCHEMA, "$[1]"});
    suite.tests.push_back(list_users);

    TestCase missing = make_step("missing user", "GET", "{{base}}/users/99999", "404");
    missing.expect.checks.push_back(PathCheck{"$.error", R"("not found")"});
    suite.tests.push_back(missing);

    suite.teardown.push_back(make_step("logout", "POST", "{{base}}/logout", "204"));

    for (const auto& line : params.headers) {
        if (auto header = util::parse_header(line)) {
            for (auto* phase : {&suite.setup, &suite.tests, &suite.teardown}) {
                for (auto& tc : *phase) tc.request.headers.push_back(*header);
            }
        }
    }
    return suite;
}

Dataset demo_dataset(std::uint32_t rows) {
    Dataset ds;
    ds.name = "user-ids";
    for (std::uint32_t i = 1; i <= rows; ++i) {
        ds.rows.push_back({{"id", std::to_string(i)}});
    }
    return ds;
}

coverage::Catalog demo_catalog() {
    return {
        {"POST",   "/login",      {200, 401}},
        {"GET",    "/users",      {200}},
        {"GET",    "/users/{id}", {200, 404}},
        {"DELETE", "/users/{id}", {204, 404}},
        {"POST",   "/logout",     {204}},
    };
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = examples::cli::suite::configure(argc, argv,
        "wirecheck - Functional Suite Example\n"
        "Runs a dataset-driven API suite (setup, tests, teardown) with retries, assertions and coverage.\n");
    params.dump("=== wirecheck Suite Run ===", std::cout);

    std::signal(SIGINT, on_signal);

    examples::SimulatedTransport transport(util::parse_duration(params.latency).value_or(std::chrono::milliseconds(40)),
                                           params.failure_rate);

    schedule::Cancellation cancel;

    RunContext ctx;
    ctx.concurrency = params.concurrency;
    ctx.bail = params.bail;
    ctx.cancel = &cancel;
    ctx.retry.max_attempts = params.attempts;
    ctx.retry.base_backoff = util::parse_duration(params.backoff).value_or(ctx.retry.base_backoff);
    ctx.retry.retryable_statuses = retry::Policy::gateway_statuses();
    ctx.timeout = util::parse_duration(params.timeout).value_or(ctx.timeout);
    ctx.filter = params.filter;
    ctx.environment = params.environment;
    if (params.coverage) {
        ctx.catalog = demo_catalog();
    }

    std::mutex out_mtx;
    ctx.on_outcome = [&](const Outcome& o) {
        std::lock_guard<std::mutex> lk(out_mtx);
        std::cout << " -> " << o.name << ": " << to_string(o.status);
        if (o.attempts > 1) std::cout << " (" << o.attempts << " attempts)";
        std::cout << std::endl;
    };

    // Ctrl+C abandons the run
    std::atomic<bool> done{false};
    std::thread watcher([&] {
        while (!done.load()) {
            if (!running.load()) {
                cancel.request(schedule::CancelMode::Abandon, "interrupted by user");
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });

    const Suite suite = demo_suite(params);
    const Dataset dataset = demo_dataset(params.rows);

    Engine<examples::SimulatedTransport> engine(transport);
    const RunResult result = engine.execute(suite, &dataset, ctx);

    done.store(true);
    watcher.join();

    if (!result.ok()) {
        std::cerr << result.summary() << std::endl;
        return 2;
    }

    std::cout << "\n=== Outcomes ===\n";
    for (const auto& o : result.outcomes) {
        std::cout << "  [" << to_string(o.status) << "] " << o.name;
        if (!o.reason.empty()) std::cout << " - " << o.reason;
        std::cout << "\n";
        for (const auto& m : o.failures) {
            std::cout << "      " << m.str() << "\n";
        }
    }

    std::cout << "\n=== Cases ===\n";
    for (const auto& c : result.cases) {
        std::cout << "  " << c.name << " (" << to_string(c.phase) << "): " << to_string(c.verdict)
                  << "  passed=" << c.passed << " failed=" << c.failed << " flaky=" << c.flaky
                  << " skipped=" << c.skipped << "\n";
    }

    std::cout << "\n" << result.summary() << "\n"
              << "Latency: " << result.latency.str() << "\n"
              << "Max in flight: " << result.max_in_flight << "\n";
    if (result.coverage) {
        std::cout << "\n=== Coverage ===\n" << result.coverage->str();
    }

    std::cout << "=== Done (" << transport.calls() << " requests) ===\n";
    return result.passed && result.executed() ? 0 : 1;
}
