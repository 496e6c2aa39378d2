#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "wirecheck/core/load/plan.hpp"
#include "wirecheck/core/util/parse.hpp"


namespace wirecheck::examples::cli {

// -------------------------------------------------------------
// HTTP URL validator
// -------------------------------------------------------------
inline auto http_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.rfind("http://", 0) == 0 || value.rfind("https://", 0) == 0) {
            return {};
        }
        return "URL must start with http:// or https://";
    },
    "HTTP URL validator"
);


// -------------------------------------------------------------
// Duration validator ("500ms", "30s", "2m", "15")
// -------------------------------------------------------------
inline auto duration_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (core::util::parse_duration(value)) {
            return {};
        }
        return "Duration must look like 500ms, 30s, 2m or a number of seconds";
    },
    "Duration validator"
);


// -------------------------------------------------------------
// Load pattern validator
// -------------------------------------------------------------
inline auto pattern_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (core::load::parse_pattern(value)) {
            return {};
        }
        return "Pattern must be one of: constant, ramp-up, spike";
    },
    "Load pattern validator"
);


// -------------------------------------------------------------
// Header validator ("Key: Value")
// -------------------------------------------------------------
inline auto header_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (core::util::parse_header(value)) {
            return {};
        }
        return "Header must be in format 'Key: Value'";
    },
    "Header validator"
);


// -------------------------------------------------------------
// Probability validator
// -------------------------------------------------------------
inline auto ratio_validator = CLI::Range(0.0, 1.0);

} // namespace wirecheck::examples::cli
