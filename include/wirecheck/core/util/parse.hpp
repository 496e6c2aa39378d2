#pragma once

#include <chrono>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <cctype>


namespace wirecheck::core::util {

namespace detail {

[[nodiscard]]
inline std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

[[nodiscard]]
inline std::optional<std::uint64_t> parse_u64(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

} // namespace detail

// "500ms", "30s", "2m", or a bare number of seconds ("15")
[[nodiscard]]
inline std::optional<std::chrono::milliseconds> parse_duration(std::string_view text) noexcept {
    text = detail::trim(text);
    if (text.size() > 2 && text.substr(text.size() - 2) == "ms") {
        auto n = detail::parse_u64(text.substr(0, text.size() - 2));
        if (!n) return std::nullopt;
        return std::chrono::milliseconds(static_cast<std::int64_t>(*n));
    }
    if (text.size() > 1 && text.back() == 's') {
        auto n = detail::parse_u64(text.substr(0, text.size() - 1));
        if (!n) return std::nullopt;
        return std::chrono::seconds(static_cast<std::int64_t>(*n));
    }
    if (text.size() > 1 && text.back() == 'm') {
        auto n = detail::parse_u64(text.substr(0, text.size() - 1));
        if (!n) return std::nullopt;
        return std::chrono::minutes(static_cast<std::int64_t>(*n));
    }
    auto n = detail::parse_u64(text);
    if (!n) return std::nullopt;
    return std::chrono::seconds(static_cast<std::int64_t>(*n));
}

// "Key: Value" -> {"Key", "Value"} (both trimmed, key non-empty)
[[nodiscard]]
inline std::optional<std::pair<std::string, std::string>> parse_header(std::string_view text) {
    const std::size_t colon = text.find(':');
    if (colon == std::string_view::npos) return std::nullopt;
    const std::string_view key = detail::trim(text.substr(0, colon));
    if (key.empty()) return std::nullopt;
    return std::make_pair(std::string(key), std::string(detail::trim(text.substr(colon + 1))));
}

} // namespace wirecheck::core::util
