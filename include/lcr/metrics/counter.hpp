#pragma once

#include <type_traits>
#include <cstdint>

namespace lcr {
namespace metrics {

// ---------------------------------------------------------------------------
// counter - monotonically increasing total (requests, errors, bytes)
// ---------------------------------------------------------------------------
//
// Plain value, no atomics: owners update it under their own lock and hand
// out values through load().
// ---------------------------------------------------------------------------
template<typename T = std::uint64_t>
struct counter {
public:
    constexpr counter() noexcept = default;
    constexpr explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    inline void copy_to(counter& dst) const noexcept {
        dst.value_ = value_;
    }

    inline constexpr T load() const noexcept { return value_; }
    inline constexpr void inc(T n = 1) noexcept { value_ += n; }
    inline constexpr void reset() noexcept { value_ = 0; }

private:
    T value_{0};
};

using counter32 = counter<std::uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<std::uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace metrics
} // namespace lcr
