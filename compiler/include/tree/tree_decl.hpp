//! # Program Tree Declarations
//!
//! Top-level declarations of a module: record and tag types owning their
//! methods, and free functions.
//!
//! ## Slot Annotations
//!
//! Parameter, receiver and return slots start unclassified
//! (`std::nullopt`). The ownership classifier assigns exactly one
//! `PassingMode` to each before method lowering; later passes only read it.
//!
//! | Mode           | C form     | Meaning                                |
//! |----------------|------------|----------------------------------------|
//! | `Copy`         | `T x`      | Passed by value                        |
//! | `RefImmutable` | `const T* x` | Borrowed, read only                  |
//! | `RefMutable`   | `T* x`     | Borrowed, callee may mutate            |
//! | `Pointer`      | `T* x`     | Raw address (low-level, indirection)   |
//!
//! ## Stubs
//!
//! A type with `is_opaque` set, or a function or method without a body, is
//! a stub: its structure or code lives in another fragment or is provided
//! externally.

#pragma once

#include "tree/tree_expr.hpp"

namespace a2c::tree {

/// Back end a module is assembled for.
enum class Scenario {
    Interp,    ///< The interpreter / VM
    TransC,    ///< Translation to C
    TransRust, ///< Translation to Rust
};

[[nodiscard]] auto scenario_name(Scenario scenario) -> const char*;

enum class Visibility { Public, Private };

struct FieldDecl {
    std::string name;
    TypePtr type;
    Visibility vis = Visibility::Public;
    SourceSpan span;
};

/// One alternative of a tag type. `discriminant` is set when pinned in
/// source; the layout compiler assigns the rest.
struct VariantDecl {
    std::string name;
    std::vector<FieldDecl> fields;
    std::optional<int64_t> discriminant;
    SourceSpan span;
};

/// How a parameter is used by the function body, stated by the front end.
enum class ParamIntent {
    Read,      ///< Only read
    Mutate,    ///< Modified in place, visible to the caller
    Transfer,  ///< Ownership moves into the callee
    AddressOf, ///< Raw address taken (low-level code only)
};

enum class PassingMode {
    Copy,
    RefImmutable,
    RefMutable,
    Pointer,
};

[[nodiscard]] auto passing_mode_name(PassingMode mode) -> const char*;

[[nodiscard]] auto param_intent_name(ParamIntent intent) -> const char*;

/// Name of the free function a method lowers to: `Type_method`.
[[nodiscard]] auto lowered_method_name(const std::string& type_name, const std::string& method)
    -> std::string;

struct ParamDecl {
    std::string name;
    TypePtr type;
    ParamIntent intent = ParamIntent::Read;
    std::optional<PassingMode> passing;
    SourceSpan span;
};

enum class MethodKind { Static, Instance };

struct MethodDecl {
    std::string name;
    MethodKind kind = MethodKind::Instance;
    std::vector<ParamDecl> params;
    TypePtr return_type;
    bool mutates_receiver = false;
    std::optional<PassingMode> receiver_passing;
    std::optional<PassingMode> return_passing;
    ExprPtr body; ///< Null when externally provided
    bool is_lowlevel = false;
    std::optional<Scenario> only_for;
    SourceSpan span;

    [[nodiscard]] auto is_stub() const -> bool {
        return body == nullptr;
    }
};

struct FuncDecl {
    std::string name;
    std::vector<std::string> generic_params;
    std::vector<ParamDecl> params;
    TypePtr return_type;
    std::optional<PassingMode> return_passing;
    ExprPtr body; ///< Null when externally provided
    bool is_lowlevel = false;
    std::optional<Scenario> only_for;

    /// Type a lowered method belongs to (empty for free functions).
    std::string owner_type;

    /// Source form of the generic this function instantiates, e.g. `identity<int>`.
    std::string generic_origin;

    SourceSpan span;

    [[nodiscard]] auto is_stub() const -> bool {
        return body == nullptr;
    }

    [[nodiscard]] auto is_generic() const -> bool {
        return !generic_params.empty();
    }

    [[nodiscard]] auto is_instance() const -> bool {
        return !generic_origin.empty();
    }
};

/// A record (`type`) or tag (`tag`) declaration.
struct TypeDecl {
    std::string name;
    std::vector<std::string> generic_params;
    std::vector<FieldDecl> fields;
    std::vector<VariantDecl> variants;
    bool is_tag = false;
    bool is_opaque = false;
    bool is_heap_backed = false;
    std::vector<MethodDecl> methods;
    std::optional<Scenario> only_for;

    /// Source form of the generic this type instantiates, e.g. `List<int>`.
    std::string generic_origin;

    SourceSpan span;

    [[nodiscard]] auto is_generic() const -> bool {
        return !generic_params.empty();
    }

    [[nodiscard]] auto is_instance() const -> bool {
        return !generic_origin.empty();
    }

    [[nodiscard]] auto find_field(const std::string& field) const -> const FieldDecl*;
    [[nodiscard]] auto find_variant(const std::string& variant) const -> const VariantDecl*;
    [[nodiscard]] auto find_method(const std::string& method) const -> const MethodDecl*;
    [[nodiscard]] auto find_method(const std::string& method) -> MethodDecl*;
};

// ============================================================================
// Declaration Builders
// ============================================================================

auto make_field_decl(std::string name, TypePtr type, Visibility vis = Visibility::Public)
    -> FieldDecl;
auto make_param(std::string name, TypePtr type, ParamIntent intent = ParamIntent::Read)
    -> ParamDecl;
auto make_variant_decl(std::string name, std::vector<FieldDecl> fields = {},
                       std::optional<int64_t> discriminant = std::nullopt) -> VariantDecl;

auto make_record(std::string name, std::vector<FieldDecl> fields,
                 std::vector<std::string> generic_params = {}) -> TypeDecl;
auto make_tag(std::string name, std::vector<VariantDecl> variants,
              std::vector<std::string> generic_params = {}) -> TypeDecl;

/// A type whose structure is stated by another fragment.
auto make_opaque(std::string name) -> TypeDecl;

auto make_function(std::string name, std::vector<ParamDecl> params, TypePtr return_type,
                   ExprPtr body, std::vector<std::string> generic_params = {}) -> FuncDecl;
auto make_method(std::string name, std::vector<ParamDecl> params, TypePtr return_type,
                 ExprPtr body, bool mutates_receiver = false) -> MethodDecl;
auto make_static_method(std::string name, std::vector<ParamDecl> params, TypePtr return_type,
                        ExprPtr body) -> MethodDecl;

} // namespace a2c::tree
