#include "wirecheck/core/metrics/aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

#include "lcr/log/logger.hpp"


namespace wirecheck::core::metrics {

namespace {

constexpr double US_PER_MS = 1000.0;

[[nodiscard]]
double seconds_of(std::chrono::nanoseconds d) noexcept {
    return std::chrono::duration<double>(d).count();
}

} // namespace

double percentile(const std::vector<std::uint64_t>& sorted, double q) noexcept {
    if (sorted.empty()) return 0.0;
    q = std::clamp(q, 0.0, 1.0);
    const double rank = q * static_cast<double>(sorted.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(rank));
    const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = rank - static_cast<double>(lo);
    const double a = static_cast<double>(sorted[lo]);
    const double b = static_cast<double>(sorted[hi]);
    return a + (b - a) * frac;
}

// -----------------------------------------------------------------------------
// Text forms
// -----------------------------------------------------------------------------

std::string LatencyStats::str() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "mean=" << mean << "ms"
        << " min=" << min << "ms"
        << " max=" << max << "ms"
        << " p50=" << p50 << "ms"
        << " p95=" << p95 << "ms"
        << " p99=" << p99 << "ms";
    if (approximate) oss << " (approx)";
    return oss.str();
}

std::string Snapshot::str() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1)
        << "[" << elapsed.count() / 1000.0 << "s] "
        << count << " ops, " << errors << " errors, "
        << throughput << " ops/s, " << latency.str();
    return oss.str();
}

std::string FinalStats::str() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "Requests     : " << count << " (" << errors << " errors, " << (error_rate * 100.0) << "%)\n"
        << "Duration     : " << duration.count() / 1000.0 << "s\n"
        << "Throughput   : " << throughput << " req/s\n"
        << "Latency      : " << latency.str() << "\n"
        << "Transfer     : " << bytes_sent_per_sec << " B/s sent, " << bytes_received_per_sec << " B/s received\n"
        << "Conn. errors : " << connection_errors << "\n"
        << "Status codes :";
    for (const auto& [code, n] : status_codes) {
        oss << " " << code << "=" << n;
    }
    return oss.str();
}

// -----------------------------------------------------------------------------
// Aggregator
// -----------------------------------------------------------------------------

Aggregator::Aggregator(Config cfg, Clock::time_point start)
    : cfg_(cfg)
    , start_(start)
    , bucket_width_(std::max<std::chrono::nanoseconds>(
          std::chrono::nanoseconds(1),
          std::chrono::duration_cast<std::chrono::nanoseconds>(cfg.window) / static_cast<std::int64_t>(std::max<std::size_t>(cfg.buckets, 1))))
    , window_(std::max<std::size_t>(cfg.buckets, 1))
{
    const std::size_t reserve_bytes = cfg_.expected_samples * sizeof(std::uint64_t);
    if (reserve_bytes <= cfg_.memory_cap) {
        exact_us_.reserve(cfg_.expected_samples);
    }
    else {
        exact_us_.reserve(cfg_.memory_cap / sizeof(std::uint64_t));
    }
}

std::int64_t Aggregator::epoch_of_(Clock::time_point t) const noexcept {
    const auto since = t - start_;
    if (since.count() < 0) return 0;
    return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(since) / bucket_width_);
}

void Aggregator::record(const Sample& sample) {
    const std::uint64_t us = sample.latency.count() > 0 ? static_cast<std::uint64_t>(sample.latency.count()) : 0;

    std::lock_guard<std::mutex> lk(mtx_);
    count_.inc();
    if (!sample.success) errors_.inc();
    if (sample.transport_error) connection_errors_.inc();
    if (sample.status > 0) ++status_codes_[sample.status];
    bytes_sent_.inc(sample.bytes_sent);
    bytes_received_.inc(sample.bytes_received);

    histogram_.record(us);
    if (!approximate_) {
        if ((exact_us_.size() + 1) * sizeof(std::uint64_t) > cfg_.memory_cap) {
            approximate_ = true;
            std::vector<std::uint64_t>().swap(exact_us_);
            WC_INFO("[METRICS] Exact latency retention exceeded " << cfg_.memory_cap
                    << " bytes, switching to approximate percentiles");
        }
        else {
            exact_us_.push_back(us);
        }
    }

    const std::int64_t epoch = epoch_of_(sample.timestamp);
    WindowBucket& bucket = window_[static_cast<std::size_t>(epoch) % window_.size()];
    if (bucket.epoch != epoch) {
        if (bucket.epoch > epoch) {
            return; // Late sample older than the window
        }
        bucket.epoch = epoch;
        bucket.count = 0;
    }
    ++bucket.count;
}

LatencyStats Aggregator::latency_locked_(bool exact) const {
    LatencyStats stats;
    stats.count = count_.load();
    stats.approximate = approximate_;
    if (stats.count == 0) {
        return stats;
    }
    stats.mean = histogram_.mean() / US_PER_MS;
    stats.min = static_cast<double>(histogram_.min()) / US_PER_MS;
    stats.max = static_cast<double>(histogram_.max()) / US_PER_MS;

    if (approximate_ || !exact) {
        stats.p50 = histogram_.percentile(0.50) / US_PER_MS;
        stats.p95 = histogram_.percentile(0.95) / US_PER_MS;
        stats.p99 = histogram_.percentile(0.99) / US_PER_MS;
        return stats;
    }
    std::vector<std::uint64_t> sorted(exact_us_);
    std::sort(sorted.begin(), sorted.end());
    stats.p50 = percentile(sorted, 0.50) / US_PER_MS;
    stats.p95 = percentile(sorted, 0.95) / US_PER_MS;
    stats.p99 = percentile(sorted, 0.99) / US_PER_MS;
    return stats;
}

double Aggregator::window_throughput_locked_(Clock::time_point now) const {
    const std::int64_t current = epoch_of_(now);
    const std::int64_t n = static_cast<std::int64_t>(window_.size());
    std::uint64_t total = 0;
    for (const auto& bucket : window_) {
        if (bucket.epoch >= 0 && bucket.epoch > current - n && bucket.epoch <= current) {
            total += bucket.count;
        }
    }
    // Early in the run the window is only partially covered
    const auto elapsed = now - start_;
    const auto window = std::chrono::duration_cast<std::chrono::nanoseconds>(cfg_.window);
    const auto covered = std::clamp<std::chrono::nanoseconds>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed), bucket_width_, window);
    const double secs = seconds_of(covered);
    return secs > 0.0 ? static_cast<double>(total) / secs : 0.0;
}

Snapshot Aggregator::snapshot(Clock::time_point now) const {
    std::lock_guard<std::mutex> lk(mtx_);
    Snapshot snap;
    snap.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_);
    if (snap.elapsed.count() < 0) snap.elapsed = std::chrono::milliseconds{0};
    snap.count = count_.load();
    snap.errors = errors_.load();
    snap.throughput = window_throughput_locked_(now);
    snap.latency = latency_locked_(false);
    snap.partial = true;
    return snap;
}

FinalStats Aggregator::finalize(Clock::time_point end) const {
    std::lock_guard<std::mutex> lk(mtx_);
    FinalStats out;
    auto duration = end - start_;
    if (duration.count() < 0) duration = Clock::duration::zero();
    out.duration = std::chrono::duration_cast<std::chrono::milliseconds>(duration);
    out.count = count_.load();
    out.errors = errors_.load();
    out.error_rate = out.count ? static_cast<double>(out.errors) / static_cast<double>(out.count) : 0.0;
    out.latency = latency_locked_(true);
    out.status_codes = status_codes_;
    out.bytes_sent = bytes_sent_.load();
    out.bytes_received = bytes_received_.load();
    out.connection_errors = connection_errors_.load();
    out.approximate = approximate_;

    const double secs = seconds_of(duration);
    if (secs > 0.0) {
        out.throughput = static_cast<double>(out.count) / secs;
        out.bytes_sent_per_sec = static_cast<double>(out.bytes_sent) / secs;
        out.bytes_received_per_sec = static_cast<double>(out.bytes_received) / secs;
    }
    return out;
}

bool Aggregator::approximate() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return approximate_;
}

std::uint64_t Aggregator::count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return count_.load();
}

} // namespace wirecheck::core::metrics
