//! # Common Definitions
//!
//! This module provides the common types and utilities used throughout the
//! a2c backend. Every other component depends on it.
//!
//! ## Overview
//!
//! - **Version Information**: Backend version constants
//! - **Source Locations**: Positions carried over from the Program Tree
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: All errors are returned via `Result<T, E>`
//! - **Explicit Ownership**: Use `Box<T>` for unique ownership, `Rc<T>` for shared
//! - **Explicit Context**: Per-run tables are passed around, never kept in globals

#ifndef A2C_COMMON_HPP
#define A2C_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace a2c {

// ============================================================================
// Version Information
// ============================================================================

/// The backend version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// Locations are produced by the front end and copied verbatim into the
/// Program Tree; the backend only ever reads them for diagnostics.
///
/// # Fields
///
/// - `file`: Path of the fragment the node came from
/// - `line`: 1-based line number
/// - `column`: 1-based column number
struct SourceLocation {
    /// Path to the source fragment.
    std::string file;

    /// Line number (1-based, 0 = unknown).
    uint32_t line = 0;

    /// Column number (1-based, 0 = unknown).
    uint32_t column = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span.
    SourceLocation end;

    /// Returns true if the span points at a real location.
    [[nodiscard]] auto is_known() const -> bool {
        return start.line != 0;
    }

    /// Creates a span covering a single position.
    [[nodiscard]] static auto at(std::string file, uint32_t line, uint32_t column) -> SourceSpan {
        SourceLocation loc{std::move(file), line, column};
        return {loc, loc};
    }

    /// Merges two spans into one that covers both.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

/// Formats a span as `file:line:column`.
[[nodiscard]] inline auto span_to_string(const SourceSpan& span) -> std::string {
    if (!span.is_known()) {
        return "<unknown>";
    }
    return span.start.file + ":" + std::to_string(span.start.line) + ":" +
           std::to_string(span.start.column);
}

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// `Result<T, E>` is used for operations that can fail, allowing error
/// handling without exceptions.
///
/// # Example
///
/// ```cpp
/// Result<LoweredModule, diag::Diagnostic> result = mono.run();
/// if (is_err(result)) {
///     return unwrap_err(result);
/// }
/// auto& module = unwrap(result);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

/// Placeholder success value for operations that only report failure.
struct Unit {};

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

/// Creates a new Rc containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace a2c

#endif // A2C_COMMON_HPP
