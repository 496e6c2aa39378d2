#pragma once

#include <array>
#include <string>
#include <sstream>
#include <limits>
#include <algorithm>
#include <cstdint>
#include <bit>


namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// latency_percentiles
// ---------------------------------------------------------------------------
// Simple struct to hold latency percentiles (same unit as recorded values)
// ---------------------------------------------------------------------------
struct latency_percentiles {
    double p50{0.0};
    double p90{0.0};
    double p95{0.0};
    double p99{0.0};
    double p999{0.0};

    std::string str(const char* unit = "us") const {
        std::ostringstream oss;
        oss << "Latency Percentiles:"
            << " p50="   << p50  << unit
            << " p90="   << p90  << unit
            << " p95="   << p95  << unit
            << " p99="   << p99  << unit
            << " p99.9=" << p999 << unit;
        return oss.str();
    }
};

// ---------------------------------------------------------------------------
// latency_histogram
// ---------------------------------------------------------------------------
//
// Log-linear histogram with bounded memory, used when retaining every sample
// is too expensive. Each power of two is split into 2^kSubBits linear
// sub-buckets, so values below 2^kSubBits are exact and larger values carry a
// relative error below 1 / 2^kSubBits (~3%).
//
// Memory footprint is fixed (kNumBuckets_ * 8 bytes) regardless of the number
// of recorded values.
//
// No multithreading guarantees — use only from single thread or under the
// owner's lock.
// ---------------------------------------------------------------------------
class latency_histogram {
public:
    static constexpr int kSubBits = 5;
    static constexpr std::uint64_t kSubCount = 1ULL << kSubBits;

    latency_histogram() noexcept { reset(); }
    // Disable copy/move semantics
    latency_histogram(const latency_histogram&) = delete;
    latency_histogram& operator=(const latency_histogram&) = delete;
    latency_histogram(latency_histogram&&) = delete;
    latency_histogram& operator=(latency_histogram&&) = delete;

    // Specialized copy method
    inline void copy_to(latency_histogram& dst) const noexcept {
        dst.buckets_ = buckets_;
        dst.count_ = count_;
        dst.sum_ = sum_;
        dst.min_ = min_;
        dst.max_ = max_;
    }

    // record() – hot path, O(1)
    inline void record(std::uint64_t value) noexcept {
        ++buckets_[bucket_index(value)];
        ++count_;
        sum_ += static_cast<double>(value);
        if (value < min_) min_ = value;
        if (value > max_) max_ = value;
    }

    inline void merge(const latency_histogram& other) noexcept {
        if (other.count_ == 0) return;
        for (std::size_t i = 0; i < kNumBuckets_; ++i)
            buckets_[i] += other.buckets_[i];
        count_ += other.count_;
        sum_ += other.sum_;
        min_ = std::min(min_, other.min_);
        max_ = std::max(max_, other.max_);
    }

    [[nodiscard]] inline std::uint64_t count() const noexcept { return count_; }
    [[nodiscard]] inline std::uint64_t min() const noexcept { return count_ ? min_ : 0; }
    [[nodiscard]] inline std::uint64_t max() const noexcept { return max_; }

    [[nodiscard]]
    inline double mean() const noexcept {
        return count_ ? sum_ / static_cast<double>(count_) : 0.0;
    }

    // Estimates the q-quantile (q in [0,1]) using the same rank convention as
    // the exact path: rank = q * (count - 1), interpolated inside the bucket.
    [[nodiscard]]
    double percentile(double q) const noexcept {
        if (count_ == 0) return 0.0;
        q = std::clamp(q, 0.0, 1.0);
        const double rank = q * static_cast<double>(count_ - 1);

        std::uint64_t cumulative = 0;
        for (std::size_t i = 0; i < kNumBuckets_; ++i) {
            const std::uint64_t n = buckets_[i];
            if (n == 0) continue;
            if (rank < static_cast<double>(cumulative + n)) {
                const double within = (rank - static_cast<double>(cumulative) + 0.5) / static_cast<double>(n);
                const double lower = static_cast<double>(bucket_lower(i));
                const double width = static_cast<double>(bucket_width(i));
                const double estimate = lower + width * within;
                return std::clamp(estimate, static_cast<double>(min_), static_cast<double>(max_));
            }
            cumulative += n;
        }
        return static_cast<double>(max_);
    }

    // Computes the usual percentile set offline
    [[nodiscard]]
    latency_percentiles compute_percentiles() const noexcept {
        latency_percentiles result{};
        result.p50  = percentile(0.50);
        result.p90  = percentile(0.90);
        result.p95  = percentile(0.95);
        result.p99  = percentile(0.99);
        result.p999 = percentile(0.999);
        return result;
    }

    // Reset
    inline void reset() noexcept {
        buckets_.fill(0);
        count_ = 0;
        sum_ = 0.0;
        min_ = std::numeric_limits<std::uint64_t>::max();
        max_ = 0;
    }

    // Bucket geometry (exposed for tests)
    [[nodiscard]]
    static constexpr std::size_t bucket_index(std::uint64_t value) noexcept {
        if (value < kSubCount) {
            return static_cast<std::size_t>(value);
        }
        const int msb = 63 - std::countl_zero(value);
        const int shift = msb - kSubBits;
        const std::uint64_t sub = value >> shift; // in [kSubCount, 2*kSubCount)
        return static_cast<std::size_t>((shift + 1) * kSubCount + (sub - kSubCount));
    }

    [[nodiscard]]
    static constexpr std::uint64_t bucket_lower(std::size_t index) noexcept {
        if (index < 2 * kSubCount) {
            return index;
        }
        const std::size_t block = index / kSubCount;
        const std::uint64_t sub = (index % kSubCount) + kSubCount;
        return sub << (block - 1);
    }

    [[nodiscard]]
    static constexpr std::uint64_t bucket_width(std::size_t index) noexcept {
        if (index < 2 * kSubCount) {
            return 1;
        }
        return 1ULL << (index / kSubCount - 1);
    }

    // Fixed memory footprint in bytes
    [[nodiscard]]
    static constexpr std::size_t footprint() noexcept {
        return sizeof(latency_histogram);
    }

private:
    static constexpr std::size_t kNumBuckets_ = (64 - kSubBits + 1) * kSubCount;

    std::array<std::uint64_t, kNumBuckets_> buckets_{};
    std::uint64_t count_{0};
    double sum_{0.0};
    std::uint64_t min_{std::numeric_limits<std::uint64_t>::max()};
    std::uint64_t max_{0};
};

} // namespace metrics
} // namespace lcr
