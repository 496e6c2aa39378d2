#include "wirecheck/core/assertion/path.hpp"

#include <charconv>


namespace wirecheck::core::assertion {

namespace {

inline bool is_name_terminator(char c) noexcept {
    return c == '.' || c == '[';
}

// Keys that cannot be written in dotted form
[[nodiscard]]
bool needs_quotes(std::string_view key) noexcept {
    return key.empty() || key.find_first_of(".[]'\"") != std::string_view::npos;
}

} // namespace

bool parse_path(std::string_view expr, PathSegments& out) {
    out.clear();
    std::size_t pos = 0;
    const std::size_t n = expr.size();

    if (n == 0) {
        return false;
    }
    if (expr[0] == '$') {
        pos = 1;
    }
    else if (expr[0] != '.' && expr[0] != '[') {
        // Bare leading member: "a.b"
        std::size_t end = pos;
        while (end < n && !is_name_terminator(expr[end])) ++end;
        out.push_back(PathSegment{PathSegment::Kind::Key, std::string(expr.substr(pos, end - pos)), 0});
        pos = end;
    }
    else {
        return false;
    }

    while (pos < n) {
        const char c = expr[pos];
        if (c == '.') {
            ++pos;
            std::size_t end = pos;
            while (end < n && !is_name_terminator(expr[end])) ++end;
            if (end == pos) {
                return false; // "a..b" or trailing dot
            }
            out.push_back(PathSegment{PathSegment::Kind::Key, std::string(expr.substr(pos, end - pos)), 0});
            pos = end;
        }
        else if (c == '[') {
            ++pos;
            if (pos >= n) return false;
            const char q = expr[pos];
            if (q == '\'' || q == '"') {
                const std::size_t close = expr.find(q, pos + 1);
                if (close == std::string_view::npos || close + 1 >= n || expr[close + 1] != ']') {
                    return false;
                }
                out.push_back(PathSegment{PathSegment::Kind::Key, std::string(expr.substr(pos + 1, close - pos - 1)), 0});
                pos = close + 2;
            }
            else {
                const std::size_t close = expr.find(']', pos);
                if (close == std::string_view::npos || close == pos) {
                    return false;
                }
                std::size_t index = 0;
                const char* first = expr.data() + pos;
                const char* last = expr.data() + close;
                auto [ptr, ec] = std::from_chars(first, last, index);
                if (ec != std::errc{} || ptr != last) {
                    return false;
                }
                out.push_back(PathSegment{PathSegment::Kind::Index, {}, index});
                pos = close + 1;
            }
        }
        else {
            return false;
        }
    }
    return true;
}

bool find_path(const simdjson::dom::element& root, const PathSegments& segments, simdjson::dom::element& out) noexcept {
    simdjson::dom::element current = root;
    for (const auto& seg : segments) {
        if (seg.kind == PathSegment::Kind::Key) {
            simdjson::dom::object obj;
            if (current.get_object().get(obj)) {
                return false;
            }
            if (obj.at_key(seg.key).get(current)) {
                return false;
            }
        }
        else {
            simdjson::dom::array arr;
            if (current.get_array().get(arr)) {
                return false;
            }
            if (arr.at(seg.index).get(current)) {
                return false;
            }
        }
    }
    out = current;
    return true;
}

std::string format_path(const PathSegments& segments) {
    std::string out = "$";
    for (const auto& seg : segments) {
        if (seg.kind == PathSegment::Kind::Index) {
            out += '[';
            out += std::to_string(seg.index);
            out += ']';
        }
        else if (needs_quotes(seg.key)) {
            const char q = seg.key.find('\'') == std::string::npos ? '\'' : '"';
            out += '[';
            out += q;
            out += seg.key;
            out += q;
            out += ']';
        }
        else {
            out += '.';
            out += seg.key;
        }
    }
    return out;
}

} // namespace wirecheck::core::assertion
