#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "simdjson.h"

/*
================================================================================
JSON Path Expressions (subset)
================================================================================

Supported forms:
  $                 whole document
  $.a.b             object members
  a.b               same, leading "$." optional
  $.items[0].id     array index
  $[2]              index on a root array
  $['odd key']      quoted member name (single or double quotes)

Lookup distinguishes "does not exist" (missing member, index out of range,
member access on a non-object) from a successful resolution; comparing the
resolved value is the caller's business.

Helpers here never log and never throw.
================================================================================
*/


namespace wirecheck::core::assertion {

struct PathSegment {
    enum class Kind : std::uint8_t { Key, Index };

    Kind kind{Kind::Key};
    std::string key;
    std::size_t index{0};
};

using PathSegments = std::vector<PathSegment>;

// Parses `expr` into segments. Returns false on malformed syntax.
[[nodiscard]]
bool parse_path(std::string_view expr, PathSegments& out);

// Walks `root` along `segments`. Returns false when the path does not exist.
[[nodiscard]]
bool find_path(const simdjson::dom::element& root, const PathSegments& segments, simdjson::dom::element& out) noexcept;

// Renders segments in canonical form: "$.a[0]", "$['odd.key']".
// Path mismatches are located by this form whatever the declared spelling.
[[nodiscard]]
std::string format_path(const PathSegments& segments);

} // namespace wirecheck::core::assertion
