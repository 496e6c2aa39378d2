#include "wirecheck/core/assertion/json.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>


namespace wirecheck::core::assertion::json {

using simdjson::dom::element;
using simdjson::dom::element_type;

namespace {

bool numbers_equal(const element& a, const element& b) noexcept {
    const element_type ta = a.type();
    const element_type tb = b.type();

    if (ta == element_type::DOUBLE || tb == element_type::DOUBLE) {
        double da = 0.0, db = 0.0;
        if (a.get_double().get(da) || b.get_double().get(db)) {
            return false;
        }
        return da == db;
    }
    if (ta == tb) {
        if (ta == element_type::INT64) {
            return a.get_int64().value_unsafe() == b.get_int64().value_unsafe();
        }
        return a.get_uint64().value_unsafe() == b.get_uint64().value_unsafe();
    }
    // INT64 vs UINT64
    const element& signed_side = (ta == element_type::INT64) ? a : b;
    const element& unsigned_side = (ta == element_type::INT64) ? b : a;
    const std::int64_t s = signed_side.get_int64().value_unsafe();
    if (s < 0) {
        return false;
    }
    return static_cast<std::uint64_t>(s) == unsigned_side.get_uint64().value_unsafe();
}

} // namespace

bool is_number(const element& e) noexcept {
    switch (e.type()) {
        case element_type::INT64:
        case element_type::UINT64:
        case element_type::DOUBLE:
            return true;
        default:
            return false;
    }
}

bool is_integer(const element& e) noexcept {
    switch (e.type()) {
        case element_type::INT64:
        case element_type::UINT64:
            return true;
        case element_type::DOUBLE: {
            double d = 0.0;
            if (e.get_double().get(d)) return false;
            return std::isfinite(d) && std::floor(d) == d;
        }
        default:
            return false;
    }
}

bool equal(const element& a, const element& b) noexcept {
    if (is_number(a) && is_number(b)) {
        return numbers_equal(a, b);
    }
    if (a.type() != b.type()) {
        return false;
    }
    switch (a.type()) {
        case element_type::NULL_VALUE:
            return true;
        case element_type::BOOL:
            return a.get_bool().value_unsafe() == b.get_bool().value_unsafe();
        case element_type::STRING:
            return a.get_string().value_unsafe() == b.get_string().value_unsafe();
        case element_type::ARRAY: {
            simdjson::dom::array xa = a.get_array().value_unsafe();
            simdjson::dom::array xb = b.get_array().value_unsafe();
            if (xa.size() != xb.size()) {
                return false;
            }
            auto ib = xb.begin();
            for (auto ia = xa.begin(); ia != xa.end(); ++ia, ++ib) {
                if (!equal(*ia, *ib)) {
                    return false;
                }
            }
            return true;
        }
        case element_type::OBJECT: {
            simdjson::dom::object oa = a.get_object().value_unsafe();
            simdjson::dom::object ob = b.get_object().value_unsafe();
            if (oa.size() != ob.size()) {
                return false;
            }
            for (auto field : oa) {
                element other;
                if (ob.at_key(field.key).get(other)) {
                    return false;
                }
                if (!equal(field.value, other)) {
                    return false;
                }
            }
            return true;
        }
        default:
            return false;
    }
}

std::string_view type_name(const element& e) noexcept {
    switch (e.type()) {
        case element_type::OBJECT:     return "object";
        case element_type::ARRAY:      return "array";
        case element_type::STRING:     return "string";
        case element_type::INT64:
        case element_type::UINT64:     return "integer";
        case element_type::DOUBLE:     return "number";
        case element_type::BOOL:       return "boolean";
        case element_type::NULL_VALUE: return "null";
        default:                       return "unknown";
    }
}

std::string display(const element& e, std::size_t max_len) {
    std::string text = simdjson::minify(e);
    if (text.size() > max_len) {
        text.resize(max_len);
        text += "...";
    }
    return text;
}

std::string quote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                }
                else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

} // namespace wirecheck::core::assertion::json
