//! # Ownership Classifier
//!
//! Assigns a `PassingMode` to every parameter, receiver and return slot of
//! a lowered module, then checks bodies for mutations through bindings
//! that were declared immutable.
//!
//! ## Classification
//!
//! | Slot type                         | Intent             | Mode           |
//! |-----------------------------------|--------------------|----------------|
//! | `ref T`                           | any                | `Pointer`      |
//! | any                               | address-of         | `Pointer` (low-level only) |
//! | small, not heap-backed            | read/mutate/transfer | `Copy`       |
//! | large or heap-backed              | read               | `RefImmutable` |
//! | large or heap-backed              | mutate             | `RefMutable`   |
//! | large or heap-backed              | transfer           | `Copy`         |
//!
//! "Small" means at most `small_aggregate_limit` bytes (16 by default).
//! Fixed arrays are never small: they are `RefMutable` for mutate intent
//! and `RefImmutable` otherwise. Returning an array is `InvalidLayout`.
//! Receivers are `RefImmutable`, or `RefMutable` for mutating methods.
//! Returns are `Copy`, or `Pointer` for `ref T`.
//!
//! ## Mutability Checks
//!
//! | Violation                                   | Example                     |
//! |---------------------------------------------|-----------------------------|
//! | Mutable-reference argument, immutable root  | `let v = ...; grow(v)`      |
//! | Mutating method on immutable receiver       | `let c = ...; c.inc()`      |
//! | Assignment through an immutable root        | `let p = ...; p.x = 1`      |
//! | Address-of outside low-level code           | `&x` in a normal function   |
//!
//! The root of a place is the variable a chain of field and index accesses
//! starts from. Places rooted at a pointer dereference or a temporary are
//! not checked.

#pragma once

#include "diag/diagnostic.hpp"
#include "layout/size_oracle.hpp"
#include "tree/tree.hpp"

#include <map>

namespace a2c::ownership {

struct OwnershipOptions {
    /// Largest aggregate (in bytes) still passed by value.
    size_t small_aggregate_limit = 16;
};

/// Tracks which bindings are mutable, with lexical scoping and shadowing.
class BindingEnv {
public:
    void push_scope();
    void pop_scope();

    void define(const std::string& name, bool is_mut);

    /// Mutability of the innermost binding named `name`, if any.
    [[nodiscard]] auto is_mutable(const std::string& name) const -> std::optional<bool>;

    [[nodiscard]] auto depth() const -> size_t {
        return scopes_.size();
    }

private:
    std::vector<std::map<std::string, bool>> scopes_;
};

/// Variable a place expression is rooted at. `std::nullopt` for places
/// reached through a dereference and for temporaries.
[[nodiscard]] auto place_root(const tree::Expr& expr) -> std::optional<std::string>;

class OwnershipClassifier {
public:
    OwnershipClassifier(tree::LoweredModule& module, const tree::DeclIndex& index,
                        OwnershipOptions options = {})
        : module_(module), index_(index), options_(options), oracle_(index, module.name) {}

    /// Classifies every slot in place, then checks every body.
    [[nodiscard]] auto run() -> Result<Unit, diag::Diagnostic>;

    /// Passing mode for one parameter slot.
    [[nodiscard]] auto classify_param(const tree::ParamDecl& param, bool is_lowlevel,
                                      const std::string& owner)
        -> Result<tree::PassingMode, diag::Diagnostic>;

    [[nodiscard]] static auto classify_receiver(const tree::MethodDecl& method)
        -> tree::PassingMode;

    [[nodiscard]] static auto classify_return(const types::TypePtr& type) -> tree::PassingMode;

private:
    tree::LoweredModule& module_;
    const tree::DeclIndex& index_;
    OwnershipOptions options_;
    layout::SizeOracle oracle_;

    [[nodiscard]] auto check_return(const types::TypePtr& type, const std::string& owner,
                                    const SourceSpan& span) -> Result<Unit, diag::Diagnostic>;
    [[nodiscard]] auto classify_function(tree::FuncDecl& func) -> Result<Unit, diag::Diagnostic>;
    [[nodiscard]] auto classify_method(tree::TypeDecl& owner, tree::MethodDecl& method)
        -> Result<Unit, diag::Diagnostic>;
};

/// Fails with an `Internal` diagnostic if any slot of `module` is still
/// unclassified. Run by later passes before they rely on passing modes.
[[nodiscard]] auto verify_classified(const tree::LoweredModule& module)
    -> Result<Unit, diag::Diagnostic>;

/// Body checks of one function or method, run after classification so
/// that callee slots are known.
class MutabilityChecker {
public:
    MutabilityChecker(const tree::DeclIndex& index, std::string module)
        : index_(index), module_(std::move(module)) {}

    [[nodiscard]] auto check_function(const tree::FuncDecl& func)
        -> Result<Unit, diag::Diagnostic>;

    [[nodiscard]] auto check_method(const tree::TypeDecl& owner, const tree::MethodDecl& method)
        -> Result<Unit, diag::Diagnostic>;

private:
    const tree::DeclIndex& index_;
    std::string module_;
    std::string symbol_;
    BindingEnv env_;
    int lowlevel_depth_ = 0;
    std::optional<diag::Diagnostic> error_;

    void check_expr(const tree::Expr& expr);
    void check_block(const tree::BlockExpr& block);
    void check_method_call(const tree::MethodCallExpr& call);
    void check_call_args(const std::vector<tree::ParamDecl>& params,
                         const std::vector<tree::ExprPtr>& args, const std::string& callee);
    void require_mutable(const tree::Expr& place, const std::string& what);
    void fail(std::string message, const SourceSpan& span);

    void define_params(const std::vector<tree::ParamDecl>& params);
};

} // namespace a2c::ownership
