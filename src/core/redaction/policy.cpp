#include "wirecheck/core/redaction/policy.hpp"
#include "wirecheck/core/assertion/path.hpp"

#include <algorithm>
#include <cctype>
#include <utility>


namespace wirecheck::core::redaction {

namespace {

const std::vector<std::string>& default_headers() {
    static const std::vector<std::string> headers = {
        "authorization", "proxy-authorization", "cookie", "set-cookie", "x-api-key", "x-auth-token"
    };
    return headers;
}

const std::vector<std::string>& default_keys() {
    static const std::vector<std::string> keys = {
        "password", "token", "secret", "api_key", "apikey", "access_token", "refresh_token", "client_secret"
    };
    return keys;
}

[[nodiscard]]
bool listed(const std::vector<std::string>& names, std::string_view name) noexcept {
    return std::any_of(names.begin(), names.end(), [&](const std::string& n) { return iequals(n, name); });
}

[[nodiscard]]
inline bool is_space(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Index one past the closing quote of the string starting at `open`
[[nodiscard]]
std::size_t string_end(std::string_view text, std::size_t open) noexcept {
    std::size_t i = open + 1;
    while (i < text.size()) {
        if (text[i] == '\\') {
            i += 2;
            continue;
        }
        if (text[i] == '"') {
            return i + 1;
        }
        ++i;
    }
    return text.size();
}

} // namespace

Policy::Policy()
    : headers_(default_headers())
    , keys_(default_keys())
{}

Policy::Policy(std::vector<std::string> headers, std::vector<std::string> keys)
    : headers_(std::move(headers))
    , keys_(std::move(keys))
{}

bool Policy::is_sensitive_header(std::string_view name) const noexcept {
    return listed(headers_, name);
}

bool Policy::is_sensitive_key(std::string_view key) const noexcept {
    return listed(keys_, key);
}

Request Policy::redact(const Request& request) const {
    Request out = request;
    if (!enabled()) {
        return out;
    }
    out.url = redact_url_(request.url);
    for (auto& [name, value] : out.headers) {
        if (is_sensitive_header(name)) {
            value = std::string(MASK);
        }
        else {
            value = redact_bearer_(value);
        }
    }
    for (auto& [name, value] : out.params) {
        if (is_sensitive_key(name)) {
            value = std::string(MASK);
        }
    }
    if (out.body) {
        out.body = redact_text(*out.body);
    }
    return out;
}

Response Policy::redact(const Response& response) const {
    Response out = response;
    if (!enabled()) {
        return out;
    }
    for (auto& [name, value] : out.headers) {
        if (is_sensitive_header(name)) {
            value = std::string(MASK);
        }
    }
    out.body = redact_text(response.body);
    return out;
}

void Policy::redact(std::vector<assertion::Mismatch>& failures) const {
    if (!enabled()) {
        return;
    }
    constexpr std::string_view header_prefix = "header:";
    for (auto& m : failures) {
        const std::string_view locator = m.locator;
        if (locator.substr(0, header_prefix.size()) == header_prefix) {
            if (is_sensitive_header(locator.substr(header_prefix.size()))) {
                if (m.expected != "present") {
                    m.expected = std::string(MASK);
                }
                if (m.kind == assertion::MismatchKind::HeaderValue) {
                    m.actual = std::string(MASK);
                }
                continue;
            }
        }
        else if (names_sensitive_path_(locator)) {
            m.expected = std::string(MASK);
            m.actual = std::string(MASK);
            continue;
        }
        m.expected = redact_text(m.expected);
        m.actual = redact_text(m.actual);
    }
}

std::string Policy::redact_text(std::string_view text) const {
    if (!enabled() || text.empty()) {
        return std::string(text);
    }
    return redact_bearer_(redact_json_members_(text));
}

// -----------------------------------------------------------------------------
// Internals
// -----------------------------------------------------------------------------

// Path and schema locators: "$.a.token", "schema:$.a.token (type)"
bool Policy::names_sensitive_path_(std::string_view locator) const {
    constexpr std::string_view schema_prefix = "schema:";
    if (locator.substr(0, schema_prefix.size()) == schema_prefix) {
        locator.remove_prefix(schema_prefix.size());
        const std::size_t rule = locator.rfind(" (");
        if (rule != std::string_view::npos) {
            locator = locator.substr(0, rule);
        }
    }
    assertion::PathSegments segments;
    if (!assertion::parse_path(locator, segments)) {
        return false;
    }
    return std::any_of(segments.begin(), segments.end(), [&](const assertion::PathSegment& seg) {
        return seg.kind == assertion::PathSegment::Kind::Key && is_sensitive_key(seg.key);
    });
}

std::string Policy::redact_url_(std::string_view url) const {
    const std::size_t q = url.find('?');
    if (q == std::string_view::npos) {
        return std::string(url);
    }
    const std::size_t hash = url.find('#', q);
    const std::string_view query = url.substr(q + 1, (hash == std::string_view::npos ? url.size() : hash) - q - 1);

    std::string out(url.substr(0, q + 1));
    std::size_t pos = 0;
    bool first = true;
    while (pos <= query.size()) {
        const std::size_t amp = query.find('&', pos);
        const std::size_t stop = amp == std::string_view::npos ? query.size() : amp;
        const std::string_view pair = query.substr(pos, stop - pos);
        if (!first) out += '&';
        first = false;
        const std::size_t eq = pair.find('=');
        if (eq != std::string_view::npos && is_sensitive_key(pair.substr(0, eq))) {
            out.append(pair.substr(0, eq + 1));
            out.append(MASK);
        }
        else {
            out.append(pair);
        }
        if (amp == std::string_view::npos) break;
        pos = amp + 1;
    }
    if (hash != std::string_view::npos) {
        out.append(url.substr(hash));
    }
    return out;
}

std::string Policy::redact_json_members_(std::string_view text) const {
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '"') {
            out += text[i++];
            continue;
        }
        const std::size_t end = string_end(text, i);
        const std::string_view token = text.substr(i, end - i);
        out.append(token);
        i = end;

        // Member key?
        std::size_t j = i;
        while (j < text.size() && is_space(text[j])) ++j;
        if (j >= text.size() || text[j] != ':' || token.size() < 2) {
            continue;
        }
        const std::string_view key = token.substr(1, token.size() - 2);
        if (!is_sensitive_key(key)) {
            continue;
        }
        // Copy up to the value
        ++j;
        while (j < text.size() && is_space(text[j])) ++j;
        out.append(text.substr(i, j - i));
        i = j;
        if (i >= text.size()) {
            break;
        }
        if (text[i] == '{' || text[i] == '[') {
            continue; // Nested members are visited in turn
        }
        std::size_t value_end = i;
        if (text[i] == '"') {
            value_end = string_end(text, i);
        }
        else {
            while (value_end < text.size() && text[value_end] != ',' && text[value_end] != '}'
                   && text[value_end] != ']' && !is_space(text[value_end])) {
                ++value_end;
            }
        }
        out += '"';
        out.append(MASK);
        out += '"';
        i = value_end;
    }
    return out;
}

std::string Policy::redact_bearer_(std::string_view text) const {
    constexpr std::string_view bearer = "bearer ";
    std::string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (i + bearer.size() < text.size() && iequals(text.substr(i, bearer.size()), bearer)) {
            out.append(text.substr(i, bearer.size()));
            i += bearer.size();
            std::size_t end = i;
            while (end < text.size() && !is_space(text[end]) && text[end] != '"' && text[end] != ',') ++end;
            if (end > i) {
                out.append(MASK);
            }
            i = end;
            continue;
        }
        out += text[i++];
    }
    return out;
}

} // namespace wirecheck::core::redaction
