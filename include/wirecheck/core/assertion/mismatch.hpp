#pragma once

#include <cstdint>
#include <string>
#include <string_view>


namespace wirecheck::core::assertion {

// ===============================================
// MISMATCH KIND
// ===============================================
enum class MismatchKind : std::uint8_t {
    Status,              // Status code differs from the expected code / class
    HeaderMissing,       // Expected header absent
    HeaderValue,         // Header present with a different value
    PathMissing,         // Path expression resolves to "does not exist"
    PathValue,           // Path exists but the value is unequal
    Schema,              // First structural schema violation
    BodyNotJson,         // Structured check against a non-JSON body
    InvalidExpectation   // The declaration itself cannot be evaluated
};

[[nodiscard]]
inline constexpr std::string_view to_string(MismatchKind k) noexcept {
    switch (k) {
        case MismatchKind::Status:             return "Status";
        case MismatchKind::HeaderMissing:      return "HeaderMissing";
        case MismatchKind::HeaderValue:        return "HeaderValue";
        case MismatchKind::PathMissing:        return "PathMissing";
        case MismatchKind::PathValue:          return "PathValue";
        case MismatchKind::Schema:             return "Schema";
        case MismatchKind::BodyNotJson:        return "BodyNotJson";
        case MismatchKind::InvalidExpectation: return "InvalidExpectation";
        default:                               return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Mismatch: one failed check
// -----------------------------------------------------------------------------
//
// locator names what was checked:
//   "status" | "header:<name>" | "<path expression>" | "schema:<location>"
// -----------------------------------------------------------------------------
struct Mismatch {
    MismatchKind kind{MismatchKind::Status};
    std::string locator;
    std::string expected;
    std::string actual;

    [[nodiscard]]
    std::string str() const {
        std::string out;
        out.reserve(locator.size() + expected.size() + actual.size() + 48);
        out += '[';
        out += to_string(kind);
        out += "] ";
        out += locator;
        out += ": expected ";
        out += expected;
        out += " but got ";
        out += actual;
        return out;
    }
};

} // namespace wirecheck::core::assertion
