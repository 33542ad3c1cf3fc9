//! # Program Tree Patterns
//!
//! Patterns appear only in match arms. The backend needs four shapes:
//!
//! | Pattern           | Source        | Matches                          |
//! |-------------------|---------------|----------------------------------|
//! | `WildcardPattern` | `_`, `else`   | anything (catch-all)             |
//! | `BindingPattern`  | `x`           | anything, binding the scrutinee  |
//! | `VariantPattern`  | `Int(i)`      | one variant of a tag type        |
//! | `LiteralPattern`  | `3`           | one integer or char value        |
//!
//! Variant bindings are positional over the variant's payload fields; an
//! empty name or `_` skips the field.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace a2c::tree {

/// Wildcard pattern: `_`
struct WildcardPattern {};

/// Binding pattern: binds the whole scrutinee to a name.
struct BindingPattern {
    std::string name;
};

/// Variant pattern: `Variant(a, b)`
struct VariantPattern {
    std::string variant;
    std::vector<std::string> bindings;
};

/// Literal pattern over integer-like scrutinees.
struct LiteralPattern {
    int64_t value;
};

/// A match-arm pattern.
struct Pattern {
    std::variant<WildcardPattern, BindingPattern, VariantPattern, LiteralPattern> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }

    /// Wildcards and bindings accept every value.
    [[nodiscard]] auto is_catch_all() const -> bool {
        return is<WildcardPattern>() || is<BindingPattern>();
    }
};

// ============================================================================
// Pattern Factory Functions
// ============================================================================

auto make_wildcard_pattern(SourceSpan span = {}) -> Pattern;
auto make_binding_pattern(std::string name, SourceSpan span = {}) -> Pattern;
auto make_variant_pattern(std::string variant, std::vector<std::string> bindings = {},
                          SourceSpan span = {}) -> Pattern;
auto make_literal_pattern(int64_t value, SourceSpan span = {}) -> Pattern;

} // namespace a2c::tree
