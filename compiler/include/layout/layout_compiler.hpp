//! # ADT Layout Compiler
//!
//! Runs over a monomorphized module and produces its `LayoutTable`:
//!
//! 1. Tag layouts (discriminants, payload storage) for every tag type
//! 2. Sizes of every type declared in the module
//! 3. A match plan for every match in every body, which is where
//!    non-exhaustive matches are rejected
//!
//! Tags declared by imported modules are laid out on demand when a local
//! match inspects them or a local expression constructs one.

#pragma once

#include "layout/match_plan.hpp"
#include "layout/size_oracle.hpp"
#include "layout/tag_layout.hpp"

#include <map>

namespace a2c::layout {

struct LayoutTable {
    std::map<std::string, TagLayout> tags;
    std::map<std::string, SizeInfo> sizes;

    [[nodiscard]] auto find_tag(const std::string& name) const -> const TagLayout*;

    /// Tag layout of a scrutinee type (a tag or an indirection to one).
    [[nodiscard]] auto tag_of(const types::TypePtr& type) const -> const TagLayout*;
};

/// Name of the record a type refers to, looking through indirection.
[[nodiscard]] auto record_name(const types::TypePtr& type) -> std::optional<std::string>;

class LayoutCompiler {
public:
    explicit LayoutCompiler(const tree::DeclIndex& index)
        : index_(index), oracle_(index, index.local().name) {}

    [[nodiscard]] auto run() -> Result<LayoutTable, diag::Diagnostic>;

private:
    const tree::DeclIndex& index_;
    SizeOracle oracle_;
    LayoutTable table_;

    /// Lays out the named tag if it is one and not done yet.
    [[nodiscard]] auto ensure_tag(const std::string& name) -> Result<Unit, diag::Diagnostic>;

    [[nodiscard]] auto check_body(const tree::Expr& body) -> Result<Unit, diag::Diagnostic>;
};

} // namespace a2c::layout
