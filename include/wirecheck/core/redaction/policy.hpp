#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "wirecheck/core/model/request.hpp"
#include "wirecheck/core/assertion/mismatch.hpp"


namespace wirecheck::core::redaction {

inline constexpr std::string_view MASK = "[REDACTED]";

/*
===============================================================================
 redaction::Policy
===============================================================================

Masks secrets in request/response snapshots and failure details before they
leave the engine.

  - Header values whose name is listed (case-insensitive) are replaced.
  - JSON members whose key is listed have their value replaced, at any depth.
  - Query parameters whose name is listed, in the URL or in the parameter
    list, have their value replaced.
  - "Bearer <token>" sequences in free text are masked.
  - Failure details are masked whole when the locator names a listed header
    or a path with a listed key.

Names and keys are configurable; the defaults cover the usual credentials.
===============================================================================
*/
class Policy {
public:
    Policy();
    Policy(std::vector<std::string> headers, std::vector<std::string> keys);

    // No-op policy
    [[nodiscard]]
    static Policy none() { return Policy({}, {}); }

    [[nodiscard]] Request redact(const Request& request) const;
    [[nodiscard]] Response redact(const Response& response) const;
    void redact(std::vector<assertion::Mismatch>& failures) const;

    // Free text: JSON members, query secrets, bearer tokens
    [[nodiscard]] std::string redact_text(std::string_view text) const;

    [[nodiscard]] bool is_sensitive_header(std::string_view name) const noexcept;
    [[nodiscard]] bool is_sensitive_key(std::string_view key) const noexcept;

    [[nodiscard]] bool enabled() const noexcept { return !headers_.empty() || !keys_.empty(); }

private:
    [[nodiscard]] bool names_sensitive_path_(std::string_view locator) const;
    [[nodiscard]] std::string redact_url_(std::string_view url) const;
    [[nodiscard]] std::string redact_json_members_(std::string_view text) const;
    [[nodiscard]] std::string redact_bearer_(std::string_view text) const;

private:
    std::vector<std::string> headers_;
    std::vector<std::string> keys_;
};

} // namespace wirecheck::core::redaction
