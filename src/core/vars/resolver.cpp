#include "wirecheck/core/vars/resolver.hpp"

#include <cstdlib>
#include <type_traits>
#include <variant>


namespace wirecheck::core::vars {

namespace {

inline bool is_name_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

} // namespace

std::optional<std::string> process_env(const std::string& name) {
    if (const char* value = std::getenv(name.c_str())) {
        return std::string(value);
    }
    return std::nullopt;
}

Resolver::Resolver()
    : env_lookup_(&process_env)
{}

Resolver::Resolver(EnvLookup env)
    : env_lookup_(std::move(env))
{}

Resolver& Resolver::set(std::string key, std::string value) {
    vars_.insert_or_assign(std::move(key), std::move(value));
    return *this;
}

Resolver& Resolver::with_vars(const Bindings& vars) {
    for (const auto& [key, value] : vars) {
        std::string expanded = substitute(value);
        vars_.insert_or_assign(key, std::move(expanded));
    }
    return *this;
}

Resolver& Resolver::with_row(const DatasetRow& row) {
    for (const auto& [key, value] : row) {
        vars_.insert_or_assign(key, value);
    }
    return *this;
}

const std::string* Resolver::find(const std::string& name) const noexcept {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

std::string Resolver::substitute(std::string_view text) const {
    if (text.find("{{") == std::string_view::npos && text.find("${") == std::string_view::npos) {
        return std::string(text);
    }
    return substitute_env_(substitute_vars_(text));
}

Request Resolver::resolve(const Request& tmpl) const {
    Request out;
    out.method = substitute(tmpl.method);
    out.url = substitute(tmpl.url);
    out.headers.reserve(tmpl.headers.size());
    for (const auto& [name, value] : tmpl.headers) {
        out.headers.emplace_back(substitute(name), substitute(value));
    }
    out.params.reserve(tmpl.params.size());
    for (const auto& [name, value] : tmpl.params) {
        out.params.emplace_back(substitute(name), substitute(value));
    }
    if (tmpl.body) {
        out.body = substitute(*tmpl.body);
    }
    return out;
}

Expectation Resolver::resolve(const Expectation& tmpl) const {
    Expectation out;
    out.checks.reserve(tmpl.checks.size());
    for (const auto& check : tmpl.checks) {
        out.checks.push_back(std::visit([this](const auto& c) -> Check {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, StatusCheck>) {
                return StatusCheck{substitute(c.expected)};
            }
            else if constexpr (std::is_same_v<T, HeaderCheck>) {
                HeaderCheck h{substitute(c.name), std::nullopt};
                if (c.expected) h.expected = substitute(*c.expected);
                return h;
            }
            else if constexpr (std::is_same_v<T, PathCheck>) {
                return PathCheck{substitute(c.path), substitute(c.expected_json)};
            }
            else {
                return SchemaCheck{c.schema_json, substitute(c.path)};
            }
        }, check));
    }
    return out;
}

// -----------------------------------------------------------------------------
// {{name}} pass
// -----------------------------------------------------------------------------
std::string Resolver::substitute_vars_(std::string_view text) const {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t open = text.find("{{", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        std::size_t i = open + 2;
        while (i < text.size() && is_name_char(text[i])) {
            ++i;
        }
        const bool well_formed = i > open + 2 && i + 1 < text.size() && text[i] == '}' && text[i + 1] == '}';
        if (!well_formed) {
            // Not a placeholder: keep the first brace and rescan after it
            out.push_back('{');
            pos = open + 1;
            continue;
        }
        const std::string name(text.substr(open + 2, i - open - 2));
        if (const std::string* value = find(name)) {
            out.append(*value);
        }
        else if (auto env = env_(name)) {
            out.append(*env);
        }
        else {
            out.append(text.substr(open, i + 2 - open)); // unknown: left verbatim
        }
        pos = i + 2;
    }
    return out;
}

// -----------------------------------------------------------------------------
// ${NAME:default} pass
// -----------------------------------------------------------------------------
std::string Resolver::substitute_env_(std::string_view text) const {
    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t open = text.find("${", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }
        out.append(text.substr(pos, open - pos));
        const std::size_t close = text.find('}', open + 2);
        if (close == std::string_view::npos) {
            out.append(text.substr(open));
            break;
        }
        const std::string_view inner = text.substr(open + 2, close - open - 2);
        const std::size_t colon = inner.find(':');
        const std::string name(inner.substr(0, colon));
        if (name.empty()) {
            out.append(text.substr(open, close + 1 - open));
            pos = close + 1;
            continue;
        }
        if (auto env = env_(name)) {
            out.append(*env);
        }
        else if (const std::string* value = find(name)) {
            out.append(*value);
        }
        else if (colon != std::string_view::npos) {
            out.append(inner.substr(colon + 1));
        }
        pos = close + 1;
    }
    return out;
}

std::optional<std::string> Resolver::env_(const std::string& name) const {
    if (!env_lookup_) return std::nullopt;
    return env_lookup_(name);
}

} // namespace wirecheck::core::vars
