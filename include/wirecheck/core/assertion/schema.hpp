#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "simdjson.h"


namespace wirecheck::core::assertion {

/*
===============================================================================
 JSON-Schema subset validator
===============================================================================

Keywords:
  type (string or list; "integer" accepts integral numbers)
  enum, const
  minimum, maximum
  minLength, maxLength (UTF-8 code points)
  required, properties, additionalProperties (false or a schema)
  items (schema, or list of positional schemas), minItems, maxItems

Unknown keywords are ignored. Validation stops at the first violation.
===============================================================================
*/

enum class SchemaStatus : std::uint8_t {
    Valid,
    Violation,   // Value does not conform
    BadSchema    // The schema document itself is malformed
};

struct SchemaResult {
    SchemaStatus status{SchemaStatus::Valid};
    std::string location;  // "$.items[2].id"
    std::string rule;      // Offending keyword
    std::string expected;
    std::string actual;

    [[nodiscard]] bool valid() const noexcept { return status == SchemaStatus::Valid; }
};

// Validates `value` against `schema`. `base` is the location prefix of `value`.
[[nodiscard]]
SchemaResult validate_schema(const simdjson::dom::element& schema,
                             const simdjson::dom::element& value,
                             std::string base = "$");

} // namespace wirecheck::core::assertion
