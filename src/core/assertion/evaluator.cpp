#include "wirecheck/core/assertion/evaluator.hpp"

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

#include "wirecheck/core/assertion/path.hpp"
#include "wirecheck/core/assertion/schema.hpp"
#include "wirecheck/core/assertion/json.hpp"

#include "simdjson.h"


namespace wirecheck::core::assertion {

namespace {

constexpr std::string_view NON_JSON_BODY = "non-JSON body";
constexpr std::string_view MISSING = "<missing>";

[[nodiscard]]
std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Lazily parsed response body (parsed at most once per evaluation)
class Body {
public:
    explicit Body(const std::string& text) noexcept
        : text_(text)
    {}

    // Returns nullptr when the body is not valid JSON
    [[nodiscard]]
    const simdjson::dom::element* root() {
        if (!parsed_) {
            parsed_ = true;
            valid_ = !parser_.parse(text_).get(root_);
        }
        return valid_ ? &root_ : nullptr;
    }

private:
    const std::string& text_;
    simdjson::dom::parser parser_;
    simdjson::dom::element root_;
    bool parsed_{false};
    bool valid_{false};
};

// -----------------------------------------------------------------------------
// Status
// -----------------------------------------------------------------------------
void check_status(const Response& response, const StatusCheck& check, Verdict& verdict) {
    const std::string_view expected = trim(check.expected);
    const std::string actual = std::to_string(response.status);

    // Class form: "2xx"
    if (expected.size() == 3 && expected[0] >= '1' && expected[0] <= '5'
        && (expected[1] == 'x' || expected[1] == 'X') && (expected[2] == 'x' || expected[2] == 'X')) {
        const int klass = expected[0] - '0';
        if (response.status / 100 != klass) {
            verdict.mismatches.push_back({MismatchKind::Status, "status", std::string(expected), actual});
        }
        return;
    }

    int code = 0;
    const char* first = expected.data();
    const char* last = expected.data() + expected.size();
    auto [ptr, ec] = std::from_chars(first, last, code);
    if (expected.empty() || ec != std::errc{} || ptr != last || code < 100 || code > 599) {
        verdict.mismatches.push_back({MismatchKind::InvalidExpectation, "status",
                                      "a status code or class, got '" + std::string(expected) + "'", actual});
        return;
    }
    if (response.status != code) {
        verdict.mismatches.push_back({MismatchKind::Status, "status", std::string(expected), actual});
    }
}

// -----------------------------------------------------------------------------
// Header
// -----------------------------------------------------------------------------
void check_header(const Response& response, const HeaderCheck& check, Verdict& verdict) {
    std::string locator = "header:" + check.name;
    const std::string* value = find_header(response.headers, check.name);
    if (!value) {
        verdict.mismatches.push_back({MismatchKind::HeaderMissing, std::move(locator),
                                      check.expected ? *check.expected : std::string("present"), "absent"});
        return;
    }
    if (check.expected && trim(*value) != trim(*check.expected)) {
        verdict.mismatches.push_back({MismatchKind::HeaderValue, std::move(locator), *check.expected, *value});
    }
}

// -----------------------------------------------------------------------------
// Path
// -----------------------------------------------------------------------------
void check_path(Body& body, const PathCheck& check, simdjson::dom::parser& scratch, Verdict& verdict) {
    PathSegments segments;
    if (!parse_path(check.path, segments)) {
        verdict.mismatches.push_back({MismatchKind::InvalidExpectation, check.path, "a valid path expression", "malformed path"});
        return;
    }
    const std::string locator = format_path(segments);
    const simdjson::dom::element* root = body.root();
    if (!root) {
        verdict.mismatches.push_back({MismatchKind::BodyNotJson, locator, check.expected_json, std::string(NON_JSON_BODY)});
        return;
    }
    simdjson::dom::element actual;
    if (!find_path(*root, segments, actual)) {
        verdict.mismatches.push_back({MismatchKind::PathMissing, locator, check.expected_json, std::string(MISSING)});
        return;
    }

    simdjson::dom::element expected;
    if (scratch.parse(check.expected_json).get(expected)) {
        // Not a JSON literal: compare as a string
        std::string_view text;
        if (actual.get_string().get(text) || text != check.expected_json) {
            verdict.mismatches.push_back({MismatchKind::PathValue, locator, json::quote(check.expected_json), json::display(actual)});
        }
        return;
    }
    if (!json::equal(expected, actual)) {
        verdict.mismatches.push_back({MismatchKind::PathValue, locator, json::display(expected), json::display(actual)});
    }
}

// -----------------------------------------------------------------------------
// Schema
// -----------------------------------------------------------------------------
void check_schema(Body& body, const SchemaCheck& check, simdjson::dom::parser& scratch, Verdict& verdict) {
    const std::string base = check.path.empty() ? std::string("$") : check.path;

    simdjson::dom::element schema;
    if (scratch.parse(check.schema_json).get(schema)) {
        verdict.mismatches.push_back({MismatchKind::InvalidExpectation, "schema", "a JSON schema document", "unparsable schema"});
        return;
    }
    const simdjson::dom::element* root = body.root();
    if (!root) {
        verdict.mismatches.push_back({MismatchKind::BodyNotJson, "schema:" + base, "JSON body", std::string(NON_JSON_BODY)});
        return;
    }

    simdjson::dom::element target = *root;
    if (!check.path.empty()) {
        PathSegments segments;
        if (!parse_path(check.path, segments)) {
            verdict.mismatches.push_back({MismatchKind::InvalidExpectation, check.path, "a valid path expression", "malformed path"});
            return;
        }
        if (!find_path(*root, segments, target)) {
            verdict.mismatches.push_back({MismatchKind::PathMissing, check.path, "value matching schema", std::string(MISSING)});
            return;
        }
    }

    SchemaResult result = validate_schema(schema, target, base);
    switch (result.status) {
        case SchemaStatus::Valid:
            break;
        case SchemaStatus::Violation:
            verdict.mismatches.push_back({MismatchKind::Schema, "schema:" + result.location + " (" + result.rule + ")",
                                          std::move(result.expected), std::move(result.actual)});
            break;
        case SchemaStatus::BadSchema:
            verdict.mismatches.push_back({MismatchKind::InvalidExpectation, "schema:" + result.location + " (" + result.rule + ")",
                                          std::move(result.expected), "invalid schema"});
            break;
    }
}

} // namespace

Verdict evaluate(const Response& response, const Expectation& expectation) {
    Verdict verdict;

    if (expectation.empty()) {
        if (response.status >= 400) {
            verdict.mismatches.push_back({MismatchKind::Status, "status", "< 400", std::to_string(response.status)});
        }
        return verdict;
    }

    Body body(response.body);
    simdjson::dom::parser scratch; // expected literals and schema documents

    for (const auto& check : expectation.checks) {
        std::visit([&](const auto& c) {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, StatusCheck>) {
                check_status(response, c, verdict);
            }
            else if constexpr (std::is_same_v<T, HeaderCheck>) {
                check_header(response, c, verdict);
            }
            else if constexpr (std::is_same_v<T, PathCheck>) {
                check_path(body, c, scratch, verdict);
            }
            else {
                check_schema(body, c, scratch, verdict);
            }
        }, check);
    }
    return verdict;
}

} // namespace wirecheck::core::assertion
