#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <functional>

#include "wirecheck/core/model/request.hpp"
#include "wirecheck/core/model/expectation.hpp"
#include "wirecheck/core/model/suite.hpp"


namespace wirecheck::core::vars {

/*
===============================================================================
 Template Resolver
===============================================================================

Substitutes placeholders into request templates and expectation values.

Syntax:
  {{name}}            variable lookup (bindings, then environment);
                      left verbatim when unknown
  ${NAME}             environment lookup, then bindings, else empty
  ${NAME:default}     environment lookup, then bindings, else `default`

`name` is made of [A-Za-z0-9_]. Substituted text is not re-scanned for
{{...}} placeholders; the ${...} pass runs after the {{...}} pass.

The resolver is a value type: copying it is how per-row contexts are derived
from the suite context. It never mutates shared state, so a single instance
can be used from several workers.
===============================================================================
*/

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment
[[nodiscard]]
std::optional<std::string> process_env(const std::string& name);

class Resolver {
public:
    Resolver();
    explicit Resolver(EnvLookup env);

    // Raw binding (value stored as-is)
    Resolver& set(std::string key, std::string value);

    // Suite-level bindings: values are expanded against the bindings known so
    // far, so a binding may reference environment variables.
    Resolver& with_vars(const Bindings& vars);

    // Dataset row bindings (values stored as-is, overriding suite bindings)
    Resolver& with_row(const DatasetRow& row);

    [[nodiscard]]
    const std::string* find(const std::string& name) const noexcept;

    [[nodiscard]]
    std::string substitute(std::string_view text) const;

    [[nodiscard]]
    Request resolve(const Request& tmpl) const;

    [[nodiscard]]
    Expectation resolve(const Expectation& tmpl) const;

private:
    [[nodiscard]] std::string substitute_vars_(std::string_view text) const;
    [[nodiscard]] std::string substitute_env_(std::string_view text) const;
    [[nodiscard]] std::optional<std::string> env_(const std::string& name) const;

private:
    Bindings vars_;
    EnvLookup env_lookup_;
};

} // namespace wirecheck::core::vars
