#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <string_view>
#include <thread>

#include "wirecheck/core/coverage/calculator.hpp"
#include "wirecheck/core/transport/concepts.hpp"
#include "lcr/log/logger.hpp"


namespace wirecheck::examples {

/*
===============================================================================
 SimulatedTransport
===============================================================================

In-process stand-in for a small user service, so the examples run without a
network:

  POST   /login          200 {"token": "..."}
  GET    /users          200 [ {user}, ... ]
  GET    /users/{id}     200 {user} (404 for ids above 1000)
  DELETE /users/{id}     204
  POST   /logout         204
  anything else          404

Latency is drawn around a configurable mean; a configurable share of calls
answers 503. Safe for concurrent send().
===============================================================================
*/
class SimulatedTransport {
public:
    SimulatedTransport(std::chrono::milliseconds mean_latency, double failure_rate, std::uint32_t seed = 42)
        : mean_latency_(mean_latency)
        , failure_rate_(failure_rate)
        , rng_(seed)
    {}

    core::transport::Reply send(const core::Request& request, std::chrono::milliseconds timeout) {
        ++calls_;
        const auto [latency, fail] = draw_();

        if (latency > timeout) {
            std::this_thread::sleep_for(timeout);
            core::transport::Reply reply;
            reply.error = core::transport::Error::Timeout;
            reply.detail = "simulated service did not answer";
            return reply;
        }
        std::this_thread::sleep_for(latency);

        core::transport::Reply reply;
        if (fail) {
            reply.response.status = 503;
            reply.response.headers = {{"Retry-After", "1"}};
            reply.response.body = R"({"error":"service unavailable"})";
            return reply;
        }
        reply.response = route_(request);
        WC_TRACE("[SIM] " << request.method << " " << request.url << " -> " << reply.response.status);
        return reply;
    }

    [[nodiscard]] std::uint64_t calls() const noexcept { return calls_.load(); }

private:
    struct Draw {
        std::chrono::milliseconds latency;
        bool fail;
    };

    Draw draw_() {
        std::lock_guard<std::mutex> lk(mtx_);
        std::exponential_distribution<double> jitter(1.0);
        std::bernoulli_distribution failure(failure_rate_);
        // Half fixed, half exponential tail
        const double ms = static_cast<double>(mean_latency_.count()) * (0.5 + 0.5 * jitter(rng_));
        return Draw{std::chrono::milliseconds(static_cast<std::int64_t>(ms)), failure(rng_)};
    }

    static core::Response route_(const core::Request& request) {
        core::Response resp;
        const std::string path = core::coverage::normalize_path(request.url);
        const std::string& method = request.method;

        if (method == "POST" && path == "/login") {
            resp.status = 200;
            resp.headers = {{"Content-Type", "application/json"}};
            resp.body = R"({"token":"sim-7f3a9c","expires_in":3600})";
            return resp;
        }
        if (method == "POST" && path == "/logout") {
            resp.status = 204;
            return resp;
        }
        if (method == "GET" && path == "/users") {
            resp.status = 200;
            resp.headers = {{"Content-Type", "application/json"}};
            resp.body = "[" + user_json_(1) + "," + user_json_(2) + "," + user_json_(3) + "]";
            return resp;
        }
        constexpr std::string_view users_prefix = "/users/";
        if (path.rfind(users_prefix, 0) == 0) {
            const std::string id_text = path.substr(users_prefix.size());
            const bool numeric = !id_text.empty() && id_text.size() < 10
                && std::all_of(id_text.begin(), id_text.end(), [](char c) { return c >= '0' && c <= '9'; });
            if (!numeric || std::stoul(id_text) > 1000) {
                resp.status = 404;
                resp.headers = {{"Content-Type", "application/json"}};
                resp.body = R"({"error":"not found"})";
                return resp;
            }
            const unsigned long id = std::stoul(id_text);
            if (method == "GET") {
                resp.status = 200;
                resp.headers = {{"Content-Type", "application/json"}};
                resp.body = user_json_(id);
                return resp;
            }
            if (method == "DELETE") {
                resp.status = 204;
                return resp;
            }
        }
        resp.status = 404;
        return resp;
    }

    static std::string user_json_(unsigned long id) {
        const std::string n = std::to_string(id);
        return R"({"id":)" + n + R"(,"name":"user )" + n + R"(","email":"user)" + n
             + R"(@example.test","active":true})";
    }

private:
    const std::chrono::milliseconds mean_latency_;
    const double failure_rate_;

    std::mutex mtx_;
    std::mt19937 rng_;
    std::atomic<std::uint64_t> calls_{0};
};

static_assert(core::transport::TransportConcept<SimulatedTransport>);

} // namespace wirecheck::examples
