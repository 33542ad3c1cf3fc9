//! # Resolved Types
//!
//! Every type reference in the Program Tree is a `TypePtr`. The front end
//! resolves names before the tree reaches the backend, so the only open
//! positions left are generic parameters (`GenericType`), which the
//! monomorphizer substitutes away.
//!
//! ## Kinds
//!
//! | Kind            | Source form        | C form                 |
//! |-----------------|--------------------|------------------------|
//! | `PrimitiveType` | `int`, `bool`, ... | `int`, `bool`, ...     |
//! | `NamedType`     | `Point`, `List<T>` | `struct Point`         |
//! | `PtrType`       | `*T`               | `T*`                   |
//! | `ArrayType`     | `[N]T`             | `T name[N]`            |
//! | `GenericType`   | `T`                | (never emitted)        |
//! | `IndirectType`  | `ref Node`         | `struct Node*`         |
//!
//! `IndirectType` is the indirection marker: a record may refer to itself
//! through it, and slots of that type are always passed as pointers.

#ifndef A2C_TYPES_TYPE_HPP
#define A2C_TYPES_TYPE_HPP

#include "common.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace a2c::types {

struct Type;
using TypePtr = std::shared_ptr<Type>;

// Primitive types
enum class PrimitiveKind {
    // Integers
    I8,
    I16,
    I32,
    I64,
    U8,
    U16,
    U32,
    U64,
    // Floats
    F32,
    F64,
    // Other primitives
    Bool,
    Char,
    Str,  // C string
    Unit, // void
};

struct PrimitiveType {
    PrimitiveKind kind;
};

// Named type (record or tag), possibly applied to type arguments
struct NamedType {
    std::string name;
    std::vector<TypePtr> type_args;
};

// Raw pointer: *T, *mut T
struct PtrType {
    bool is_mut;
    TypePtr inner;
};

// Fixed-size array: [N]T
struct ArrayType {
    TypePtr element;
    size_t size;
};

// Generic parameter, bound by a TypeDecl or FuncDecl
struct GenericType {
    std::string name;
};

// Indirection marker: the value lives behind a pointer
struct IndirectType {
    TypePtr inner;
};

struct Type {
    std::variant<PrimitiveType, NamedType, PtrType, ArrayType, GenericType, IndirectType> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// Helper functions
[[nodiscard]] auto make_primitive(PrimitiveKind kind) -> TypePtr;
[[nodiscard]] auto make_unit() -> TypePtr;
[[nodiscard]] auto make_bool() -> TypePtr;
[[nodiscard]] auto make_i32() -> TypePtr;
[[nodiscard]] auto make_i64() -> TypePtr;
[[nodiscard]] auto make_u32() -> TypePtr;
[[nodiscard]] auto make_f64() -> TypePtr;
[[nodiscard]] auto make_char() -> TypePtr;
[[nodiscard]] auto make_str() -> TypePtr;
[[nodiscard]] auto make_named(std::string name, std::vector<TypePtr> type_args = {}) -> TypePtr;
[[nodiscard]] auto make_ptr(TypePtr inner, bool is_mut = false) -> TypePtr;
[[nodiscard]] auto make_array(TypePtr element, size_t size) -> TypePtr;
[[nodiscard]] auto make_generic(std::string name) -> TypePtr;
[[nodiscard]] auto make_indirect(TypePtr inner) -> TypePtr;

// Type comparison (structural)
[[nodiscard]] auto types_equal(const TypePtr& a, const TypePtr& b) -> bool;

// Source-like rendering for diagnostics and logs, e.g. `List<int>`
[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;

[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string;

[[nodiscard]] auto is_unit(const TypePtr& type) -> bool;

[[nodiscard]] auto is_integer(const TypePtr& type) -> bool;

/// Returns true if any generic parameter occurs inside `type`.
[[nodiscard]] auto contains_generic(const TypePtr& type) -> bool;

/// Generic type substitution.
///
/// Replaces GenericType instances with concrete types from the substitution
/// map, e.g. `substitute_type(List<T>, {T -> int})` returns `List<int>`.
/// Parameters missing from the map are left in place.
[[nodiscard]] auto substitute_type(const TypePtr& type,
                                   const std::unordered_map<std::string, TypePtr>& substitutions)
    -> TypePtr;

} // namespace a2c::types

#endif // A2C_TYPES_TYPE_HPP
