#include "wirecheck/core/assertion/schema.hpp"

#include <cmath>
#include <utility>

#include "wirecheck/core/assertion/json.hpp"


namespace wirecheck::core::assertion {

using simdjson::dom::element;
using simdjson::dom::element_type;

namespace {

[[nodiscard]]
SchemaResult violation(std::string location, std::string rule, std::string expected, std::string actual) {
    return SchemaResult{SchemaStatus::Violation, std::move(location), std::move(rule), std::move(expected), std::move(actual)};
}

[[nodiscard]]
SchemaResult bad_schema(std::string location, std::string rule, std::string why) {
    return SchemaResult{SchemaStatus::BadSchema, std::move(location), std::move(rule), std::move(why), {}};
}

[[nodiscard]]
std::size_t utf8_length(std::string_view s) noexcept {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

[[nodiscard]]
bool read_count(const element& e, std::uint64_t& out) noexcept {
    double d = 0.0;
    if (!json::is_number(e) || e.get_double().get(d)) return false;
    if (d < 0.0 || std::floor(d) != d) return false;
    out = static_cast<std::uint64_t>(d);
    return true;
}

[[nodiscard]]
bool type_matches(std::string_view name, const element& v, bool& known) noexcept {
    known = true;
    if (name == "object")  return v.type() == element_type::OBJECT;
    if (name == "array")   return v.type() == element_type::ARRAY;
    if (name == "string")  return v.type() == element_type::STRING;
    if (name == "boolean") return v.type() == element_type::BOOL;
    if (name == "null")    return v.type() == element_type::NULL_VALUE;
    if (name == "number")  return json::is_number(v);
    if (name == "integer") return json::is_integer(v);
    known = false;
    return false;
}

class Validator {
public:
    SchemaResult run(const element& schema, const element& value, const std::string& loc) {
        // Boolean schemas
        if (schema.type() == element_type::BOOL) {
            if (schema.get_bool().value_unsafe()) {
                return {};
            }
            return violation(loc, "false", "nothing", json::display(value, 64));
        }
        simdjson::dom::object s;
        if (schema.get_object().get(s)) {
            return bad_schema(loc, "schema", "schema must be an object or a boolean");
        }

        if (auto r = check_type_(s, value, loc); !r.valid()) return r;
        if (auto r = check_enum_(s, value, loc); !r.valid()) return r;
        if (json::is_number(value)) {
            if (auto r = check_range_(s, value, loc); !r.valid()) return r;
        }
        if (value.type() == element_type::STRING) {
            if (auto r = check_length_(s, value, loc); !r.valid()) return r;
        }
        if (value.type() == element_type::OBJECT) {
            if (auto r = check_object_(s, value, loc); !r.valid()) return r;
        }
        if (value.type() == element_type::ARRAY) {
            if (auto r = check_array_(s, value, loc); !r.valid()) return r;
        }
        return {};
    }

private:
    SchemaResult check_type_(const simdjson::dom::object& s, const element& v, const std::string& loc) {
        element type;
        if (s.at_key("type").get(type)) {
            return {};
        }
        bool known = true;
        std::string_view name;
        if (!type.get_string().get(name)) {
            const bool ok = type_matches(name, v, known);
            if (!known) return bad_schema(loc, "type", "unknown type '" + std::string(name) + "'");
            if (!ok) return violation(loc, "type", std::string(name), std::string(json::type_name(v)));
            return {};
        }
        simdjson::dom::array names;
        if (type.get_array().get(names)) {
            return bad_schema(loc, "type", "type must be a string or a list of strings");
        }
        std::string expected;
        for (auto entry : names) {
            if (entry.get_string().get(name)) {
                return bad_schema(loc, "type", "type list must hold strings");
            }
            const bool ok = type_matches(name, v, known);
            if (!known) return bad_schema(loc, "type", "unknown type '" + std::string(name) + "'");
            if (ok) return {};
            if (!expected.empty()) expected += " | ";
            expected += name;
        }
        return violation(loc, "type", expected, std::string(json::type_name(v)));
    }

    SchemaResult check_enum_(const simdjson::dom::object& s, const element& v, const std::string& loc) {
        element konst;
        if (!s.at_key("const").get(konst) && !json::equal(konst, v)) {
            return violation(loc, "const", json::display(konst, 64), json::display(v, 64));
        }
        element choices;
        if (s.at_key("enum").get(choices)) {
            return {};
        }
        simdjson::dom::array list;
        if (choices.get_array().get(list)) {
            return bad_schema(loc, "enum", "enum must be a list");
        }
        for (auto candidate : list) {
            if (json::equal(candidate, v)) return {};
        }
        return violation(loc, "enum", "one of " + json::display(choices, 64), json::display(v, 64));
    }

    SchemaResult check_range_(const simdjson::dom::object& s, const element& v, const std::string& loc) {
        double actual = 0.0;
        if (v.get_double().get(actual)) {
            return {};
        }
        element bound;
        if (!s.at_key("minimum").get(bound)) {
            double min = 0.0;
            if (!json::is_number(bound) || bound.get_double().get(min)) {
                return bad_schema(loc, "minimum", "minimum must be a number");
            }
            if (actual < min) {
                return violation(loc, "minimum", ">= " + json::display(bound), json::display(v));
            }
        }
        if (!s.at_key("maximum").get(bound)) {
            double max = 0.0;
            if (!json::is_number(bound) || bound.get_double().get(max)) {
                return bad_schema(loc, "maximum", "maximum must be a number");
            }
            if (actual > max) {
                return violation(loc, "maximum", "<= " + json::display(bound), json::display(v));
            }
        }
        return {};
    }

    SchemaResult check_length_(const simdjson::dom::object& s, const element& v, const std::string& loc) {
        const std::size_t len = utf8_length(v.get_string().value_unsafe());
        element bound;
        std::uint64_t n = 0;
        if (!s.at_key("minLength").get(bound)) {
            if (!read_count(bound, n)) return bad_schema(loc, "minLength", "minLength must be a non-negative integer");
            if (len < n) return violation(loc, "minLength", "length >= " + std::to_string(n), "length " + std::to_string(len));
        }
        if (!s.at_key("maxLength").get(bound)) {
            if (!read_count(bound, n)) return bad_schema(loc, "maxLength", "maxLength must be a non-negative integer");
            if (len > n) return violation(loc, "maxLength", "length <= " + std::to_string(n), "length " + std::to_string(len));
        }
        return {};
    }

    SchemaResult check_object_(const simdjson::dom::object& s, const element& v, const std::string& loc) {
        simdjson::dom::object obj = v.get_object().value_unsafe();

        element required;
        if (!s.at_key("required").get(required)) {
            simdjson::dom::array keys;
            if (required.get_array().get(keys)) {
                return bad_schema(loc, "required", "required must be a list");
            }
            for (auto key : keys) {
                std::string_view name;
                if (key.get_string().get(name)) {
                    return bad_schema(loc, "required", "required must list strings");
                }
                element ignored;
                if (obj.at_key(name).get(ignored)) {
                    return violation(loc, "required", json::quote(name), "missing");
                }
            }
        }

        simdjson::dom::object props;
        bool has_props = false;
        element props_el;
        if (!s.at_key("properties").get(props_el)) {
            if (props_el.get_object().get(props)) {
                return bad_schema(loc, "properties", "properties must be an object");
            }
            has_props = true;
            for (auto prop : props) {
                element member;
                if (obj.at_key(prop.key).get(member)) {
                    continue;
                }
                auto r = run(prop.value, member, loc + "." + std::string(prop.key));
                if (!r.valid()) return r;
            }
        }

        element additional;
        if (!s.at_key("additionalProperties").get(additional)) {
            const bool closed = additional.type() == element_type::BOOL && !additional.get_bool().value_unsafe();
            const bool typed = additional.type() == element_type::OBJECT;
            if (!closed && !typed && additional.type() != element_type::BOOL) {
                return bad_schema(loc, "additionalProperties", "additionalProperties must be a boolean or a schema");
            }
            for (auto field : obj) {
                element ignored;
                if (has_props && !props.at_key(field.key).get(ignored)) {
                    continue;
                }
                if (closed) {
                    return violation(loc, "additionalProperties", "no additional properties", json::quote(field.key));
                }
                if (typed) {
                    auto r = run(additional, field.value, loc + "." + std::string(field.key));
                    if (!r.valid()) return r;
                }
            }
        }
        return {};
    }

    SchemaResult check_array_(const simdjson::dom::object& s, const element& v, const std::string& loc) {
        simdjson::dom::array arr = v.get_array().value_unsafe();
        const std::size_t size = arr.size();
        element bound;
        std::uint64_t n = 0;
        if (!s.at_key("minItems").get(bound)) {
            if (!read_count(bound, n)) return bad_schema(loc, "minItems", "minItems must be a non-negative integer");
            if (size < n) return violation(loc, "minItems", ">= " + std::to_string(n) + " item(s)", std::to_string(size) + " item(s)");
        }
        if (!s.at_key("maxItems").get(bound)) {
            if (!read_count(bound, n)) return bad_schema(loc, "maxItems", "maxItems must be a non-negative integer");
            if (size > n) return violation(loc, "maxItems", "<= " + std::to_string(n) + " item(s)", std::to_string(size) + " item(s)");
        }

        element items;
        if (s.at_key("items").get(items)) {
            return {};
        }
        simdjson::dom::array positional;
        if (!items.get_array().get(positional)) {
            std::size_t i = 0;
            auto it = arr.begin();
            for (auto sub : positional) {
                if (it == arr.end()) break;
                auto r = run(sub, *it, loc + "[" + std::to_string(i) + "]");
                if (!r.valid()) return r;
                ++it;
                ++i;
            }
            return {};
        }
        std::size_t i = 0;
        for (auto item : arr) {
            auto r = run(items, item, loc + "[" + std::to_string(i) + "]");
            if (!r.valid()) return r;
            ++i;
        }
        return {};
    }
};

} // namespace

SchemaResult validate_schema(const element& schema, const element& value, std::string base) {
    Validator validator;
    return validator.run(schema, value, base);
}

} // namespace wirecheck::core::assertion
