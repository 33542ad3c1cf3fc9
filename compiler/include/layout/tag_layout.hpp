//! # Tag Layout
//!
//! A tag type lowers to a discriminant enum plus a record holding the
//! discriminant and a payload union:
//!
//! ```c
//! enum AtomKind { ATOM_INT = 0, ATOM_PAIR = 1, ATOM_NIL = 2 };
//! struct Atom {
//!     enum AtomKind tag;
//!     union {
//!         int Int;
//!         struct { int x; int y; } Pair;
//!     } as;
//! };
//! ```
//!
//! ## Payload Storage
//!
//! | Variant fields | Storage                              | Access        |
//! |----------------|--------------------------------------|---------------|
//! | none           | nothing                              |               |
//! | one            | the field itself, named by variant   | `as.Int`      |
//! | several        | anonymous struct, named by variant   | `as.Pair.x`   |
//!
//! A tag without any payload has no union at all.
//!
//! ## Discriminants
//!
//! Assigned in declaration order starting at 0. Pinned values keep their
//! value; automatic values continue above the highest value assigned so far
//! and skip every value pinned anywhere in the tag. Two variants with the
//! same value are an `InvalidLayout` error.

#pragma once

#include "diag/diagnostic.hpp"
#include "tree/tree.hpp"

namespace a2c::layout {

enum class PayloadStorage { None, Direct, Struct };

struct VariantLayout {
    std::string name;
    std::string constant; ///< Enum constant, e.g. `ATOM_INT`
    int64_t discriminant = 0;
    PayloadStorage storage = PayloadStorage::None;
    std::vector<tree::FieldDecl> fields;

    /// Access path of payload field `index` relative to the tag value,
    /// e.g. `as.Int` or `as.Pair.x`.
    [[nodiscard]] auto access_path(size_t index) const -> std::string;
};

struct TagLayout {
    std::string tag_name;  ///< Record name, e.g. `Atom`
    std::string enum_name; ///< Discriminant enum, e.g. `AtomKind`
    std::vector<VariantLayout> variants;
    bool has_payload = false;

    [[nodiscard]] auto find_variant(const std::string& variant) const -> const VariantLayout*;
};

/// Enum constant for a variant: `<TAG>_<VARIANT>` in upper case.
[[nodiscard]] auto variant_constant(const std::string& tag, const std::string& variant)
    -> std::string;

/// Computes the layout of a concrete tag declaration.
[[nodiscard]] auto compute_tag_layout(const tree::TypeDecl& decl, const std::string& module)
    -> Result<TagLayout, diag::Diagnostic>;

} // namespace a2c::layout
