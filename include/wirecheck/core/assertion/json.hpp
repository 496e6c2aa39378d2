#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "simdjson.h"


namespace wirecheck::core::assertion::json {

// Deep JSON equality. Numbers compare by value across integer and double
// representations; object member order is irrelevant.
[[nodiscard]]
bool equal(const simdjson::dom::element& a, const simdjson::dom::element& b) noexcept;

[[nodiscard]]
bool is_number(const simdjson::dom::element& e) noexcept;

// Integral value (int64, uint64, or a double without fractional part)
[[nodiscard]]
bool is_integer(const simdjson::dom::element& e) noexcept;

// JSON-Schema type name of `e` ("object", "array", "string", "integer",
// "number", "boolean", "null")
[[nodiscard]]
std::string_view type_name(const simdjson::dom::element& e) noexcept;

// Compact JSON text, shortened to `max_len` characters
[[nodiscard]]
std::string display(const simdjson::dom::element& e, std::size_t max_len = 256);

// Quotes `text` as a JSON string literal
[[nodiscard]]
std::string quote(std::string_view text);

} // namespace wirecheck::core::assertion::json
