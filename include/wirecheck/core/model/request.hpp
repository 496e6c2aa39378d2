#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <utility>
#include <optional>
#include <algorithm>
#include <cctype>


namespace wirecheck::core {

// Ordered (name, value) pairs. Order is preserved because both requests and
// snapshots are shown to users in declaration order.
using Headers = std::vector<std::pair<std::string, std::string>>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// ASCII case-insensitive comparison (HTTP header names)
[[nodiscard]]
inline bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// Returns the first header matching `name` (case-insensitive)
[[nodiscard]]
inline const std::string* find_header(const Headers& headers, std::string_view name) noexcept {
    auto it = std::find_if(headers.begin(), headers.end(), [&](const auto& h) {
        return iequals(h.first, name);
    });
    return it == headers.end() ? nullptr : &it->second;
}

// -----------------------------------------------------------------------------
// Request (template or resolved)
// -----------------------------------------------------------------------------
struct Request {
    std::string method{"GET"};
    std::string url;
    Headers headers;
    QueryParams params;
    std::optional<std::string> body;
};

// -----------------------------------------------------------------------------
// Response (as received by the transport)
// -----------------------------------------------------------------------------
struct Response {
    int status{0};
    Headers headers;
    std::string body;
};

} // namespace wirecheck::core
