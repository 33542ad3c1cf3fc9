//! # Program Tree Traversal and Cloning
//!
//! Passes that only inspect bodies use `for_each_expr`; passes that rewrite
//! them use `for_each_expr_mut` and `rewrite_types`. Monomorphization copies
//! generic bodies with `clone_expr`, substituting types on the way.
//!
//! Traversal is pre-order and follows source order, so every pass sees
//! nodes in the same sequence.

#pragma once

#include "tree/tree_decl.hpp"

#include <functional>

namespace a2c::tree {

/// Maps a type to its replacement. Must return a non-null type for a
/// non-null input.
using TypeMapper = std::function<TypePtr(const TypePtr&)>;

/// Deep copy of an expression with every type passed through `map`.
[[nodiscard]] auto clone_expr(const Expr& expr, const TypeMapper& map) -> ExprPtr;

[[nodiscard]] auto clone_stmt(const Stmt& stmt, const TypeMapper& map) -> StmtPtr;

[[nodiscard]] auto clone_function(const FuncDecl& func, const TypeMapper& map) -> FuncDecl;

[[nodiscard]] auto clone_method(const MethodDecl& method, const TypeMapper& map) -> MethodDecl;

[[nodiscard]] auto clone_type_decl(const TypeDecl& decl, const TypeMapper& map) -> TypeDecl;

/// Identity mapper.
[[nodiscard]] auto keep_types() -> TypeMapper;

/// Visits the direct children of `expr` in source order. `let`
/// initializers of a block count as children of the block.
void for_each_child(const Expr& expr, const std::function<void(const Expr&)>& visit);

/// Visits every expression below (and including) `expr`, pre-order.
void for_each_expr(const Expr& expr, const std::function<void(const Expr&)>& visit);

/// Mutable pre-order traversal. The callback may replace the node's
/// contents; children are visited after the callback returns.
void for_each_expr_mut(Expr& expr, const std::function<void(Expr&)>& visit);

/// Rewrites every type slot reachable from `expr` (expression types, `let`
/// annotations, call type arguments, method owners).
void rewrite_types(Expr& expr, const TypeMapper& map);

} // namespace a2c::tree
