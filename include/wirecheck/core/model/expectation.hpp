#pragma once

#include <string>
#include <vector>
#include <variant>
#include <optional>


namespace wirecheck::core {

/*
===============================================================================
 Expectation model
===============================================================================

Each declared check is one alternative of a closed variant and carries only
the fields it needs. The assertion evaluator dispatches on the alternative.

Expected values may contain template placeholders ({{name}}, ${VAR:default});
they are substituted by the template resolver before evaluation.

  StatusCheck   exact code ("201") or class ("2xx")
  HeaderCheck   header presence, or exact value when `expected` is set
  PathCheck     JSON literal expected at a path expression ($.data.id)
  SchemaCheck   JSON-Schema document validated against the body or a sub-path
===============================================================================
*/

struct StatusCheck {
    std::string expected;
};

struct HeaderCheck {
    std::string name;
    std::optional<std::string> expected;
};

struct PathCheck {
    std::string path;
    std::string expected_json;
};

struct SchemaCheck {
    std::string schema_json;
    std::string path; // empty = whole body
};

using Check = std::variant<StatusCheck, HeaderCheck, PathCheck, SchemaCheck>;

struct Expectation {
    std::vector<Check> checks;

    [[nodiscard]] bool empty() const noexcept { return checks.empty(); }
};

} // namespace wirecheck::core
