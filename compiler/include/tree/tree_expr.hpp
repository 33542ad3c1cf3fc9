//! # Program Tree Expressions and Statements
//!
//! This module defines the expression and statement nodes of the resolved
//! Program Tree handed to the backend by the front end.
//!
//! ## Overview
//!
//! Every expression:
//! - Carries its resolved type (`TypePtr`), possibly mentioning generic
//!   parameters until monomorphization
//! - Has a `SourceSpan` pointing back to the original fragment
//!
//! ## Expression Categories
//!
//! | Category | Kinds | Description |
//! |----------|-------|-------------|
//! | **Atoms** | `LiteralExpr`, `VarExpr`, `SelfFieldExpr` | Values and names |
//! | **Operations** | `BinaryExpr`, `UnaryExpr` | Arithmetic, logical, address-of |
//! | **Calls** | `CallExpr`, `MethodCallExpr` | Function and method invocation |
//! | **Access** | `FieldExpr`, `IndexExpr` | Field and element access |
//! | **Constructors** | `StructExpr`, `VariantExpr` | Record and tag values |
//! | **Control Flow** | `BlockExpr`, `IfExpr`, `MatchExpr`, `LoopExpr`, `ForExpr` | Branching and iteration |
//! | **Jumps** | `ReturnExpr`, `BreakExpr`, `ContinueExpr` | Control transfer |
//! | **Mutation** | `AssignExpr` | Plain and compound assignment |
//!
//! `SelfFieldExpr` is the implicit field shorthand inside method bodies
//! (`.x` for `self.x`). Method lowering rewrites it away, together with
//! `MethodCallExpr`; neither reaches the emitter.
//!
//! Statements are either `let` bindings or expressions evaluated for their
//! effect.

#pragma once

#include "tree/tree_pattern.hpp"
#include "types/type.hpp"

#include <optional>

namespace a2c::tree {

using types::TypePtr;

struct Expr;
using ExprPtr = Box<Expr>;

struct Stmt;
using StmtPtr = Box<Stmt>;

// ============================================================================
// Binary and Unary Operations
// ============================================================================

/// Binary operation kinds.
enum class BinOp {
    // Arithmetic
    Add, ///< `a + b`
    Sub, ///< `a - b`
    Mul, ///< `a * b`
    Div, ///< `a / b`
    Mod, ///< `a % b`
    // Comparison
    Eq, ///< `a == b`
    Ne, ///< `a != b`
    Lt, ///< `a < b`
    Le, ///< `a <= b`
    Gt, ///< `a > b`
    Ge, ///< `a >= b`
    // Logical
    And, ///< `a && b`
    Or,  ///< `a || b`
    // Bitwise
    BitAnd, ///< `a & b`
    BitOr,  ///< `a | b`
    BitXor, ///< `a ^ b`
    Shl,    ///< `a << b`
    Shr,    ///< `a >> b`
};

/// Unary operation kinds.
enum class UnaryOp {
    Neg,    ///< `-x`
    Not,    ///< `!x`
    BitNot, ///< `~x`
    AddrOf, ///< `&x`, only inside low-level code
    Deref,  ///< `*p`
};

/// Returns the C spelling of a binary operator.
[[nodiscard]] auto binop_to_string(BinOp op) -> const char*;

/// Returns the C spelling of a unary operator.
[[nodiscard]] auto unaryop_to_string(UnaryOp op) -> const char*;

// ============================================================================
// Expression Definitions
// ============================================================================

/// Literal value: `42`, `3.5`, `true`, `'c'`, `"text"`.
struct LiteralExpr {
    std::variant<int64_t, double, bool, char, std::string> value;
    TypePtr type;
    SourceSpan span;
};

/// Reference to a local, parameter or `self`.
struct VarExpr {
    std::string name;
    TypePtr type;
    SourceSpan span;
};

/// Implicit field shorthand inside a method body: `.x`.
struct SelfFieldExpr {
    std::string field;
    TypePtr type;
    SourceSpan span;
};

/// Field access: `object.field`.
struct FieldExpr {
    ExprPtr object;
    std::string field;
    TypePtr type;
    SourceSpan span;
};

/// Array indexing: `object[index]`.
struct IndexExpr {
    ExprPtr object;
    ExprPtr index;
    TypePtr type;
    SourceSpan span;
};

struct BinaryExpr {
    BinOp op;
    ExprPtr left;
    ExprPtr right;
    TypePtr type;
    SourceSpan span;
};

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
    TypePtr type;
    SourceSpan span;
};

/// Free function call: `callee<type_args>(args)`.
///
/// `type_args` is non-empty only for calls of generic functions; the
/// monomorphizer renames `callee` to the instance and clears it.
struct CallExpr {
    std::string callee;
    std::vector<TypePtr> type_args;
    std::vector<ExprPtr> args;
    TypePtr type;
    SourceSpan span;
};

/// Method call: `receiver.method(args)` or, with a null receiver, the static
/// call `Owner.method(args)`. `owner` is the receiver's declared type.
struct MethodCallExpr {
    ExprPtr receiver;
    TypePtr owner;
    std::string method;
    std::vector<ExprPtr> args;
    TypePtr type;
    SourceSpan span;
};

/// One `name: value` entry of a struct literal.
struct FieldInit {
    std::string name;
    ExprPtr value;
};

/// Struct literal: `Point { x: 1, y: 2 }`. `type` names the record.
struct StructExpr {
    std::vector<FieldInit> fields;
    TypePtr type;
    SourceSpan span;
};

/// Tag construction: `Atom.Int(42)`. `type` names the tag type; `args` are
/// positional over the variant's payload fields.
struct VariantExpr {
    std::string variant;
    std::vector<ExprPtr> args;
    TypePtr type;
    SourceSpan span;
};

/// Block with an optional tail value. `is_lowlevel` marks a block where
/// address-of is permitted.
struct BlockExpr {
    std::vector<StmtPtr> stmts;
    ExprPtr tail;
    bool is_lowlevel = false;
    TypePtr type;
    SourceSpan span;
};

/// `if cond { ... } else { ... }`; `else_branch` may be null.
struct IfExpr {
    ExprPtr condition;
    ExprPtr then_branch;
    ExprPtr else_branch;
    TypePtr type;
    SourceSpan span;
};

struct MatchArm {
    Pattern pattern;
    ExprPtr body;
};

/// Match over a tag value or an integer scalar.
struct MatchExpr {
    ExprPtr scrutinee;
    std::vector<MatchArm> arms;
    TypePtr type;
    SourceSpan span;
};

/// Unbounded loop. A null condition is `loop { }`, otherwise `while cond { }`.
struct LoopExpr {
    ExprPtr condition;
    ExprPtr body;
    TypePtr type;
    SourceSpan span;
};

/// Bounded loop over an integer range: `for i in start..end { }`.
struct ForExpr {
    std::string var;
    ExprPtr start;
    ExprPtr end;
    bool inclusive = false;
    ExprPtr body;
    TypePtr type;
    SourceSpan span;
};

struct ReturnExpr {
    ExprPtr value;
    TypePtr type;
    SourceSpan span;
};

struct BreakExpr {
    TypePtr type;
    SourceSpan span;
};

struct ContinueExpr {
    TypePtr type;
    SourceSpan span;
};

/// Assignment `target = value`, or `target op= value` when `op` is set.
struct AssignExpr {
    std::optional<BinOp> op;
    ExprPtr target;
    ExprPtr value;
    TypePtr type;
    SourceSpan span;
};

/// An expression node.
struct Expr {
    std::variant<LiteralExpr, VarExpr, SelfFieldExpr, FieldExpr, IndexExpr, BinaryExpr, UnaryExpr,
                 CallExpr, MethodCallExpr, StructExpr, VariantExpr, BlockExpr, IfExpr, MatchExpr,
                 LoopExpr, ForExpr, ReturnExpr, BreakExpr, ContinueExpr, AssignExpr>
        kind;

    /// The resolved type of this expression (unit for statement-like kinds).
    [[nodiscard]] auto type() const -> TypePtr;

    /// Mutable access to the type slot, used by type rewriting passes.
    [[nodiscard]] auto type_slot() -> TypePtr&;

    [[nodiscard]] auto span() const -> SourceSpan;

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

// ============================================================================
// Statement Definitions
// ============================================================================

/// `let name: type = init` (`var` when `is_mut`). `init` may be null.
struct LetStmt {
    std::string name;
    TypePtr type;
    bool is_mut = false;
    ExprPtr init;
    SourceSpan span;
};

/// Expression evaluated for its effect.
struct ExprStmt {
    ExprPtr expr;
    SourceSpan span;
};

struct Stmt {
    std::variant<LetStmt, ExprStmt> kind;

    [[nodiscard]] auto span() const -> SourceSpan;

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

// ============================================================================
// Factory Functions
// ============================================================================

auto make_int_literal(int64_t value, TypePtr type = types::make_i32(), SourceSpan span = {})
    -> ExprPtr;
auto make_float_literal(double value, TypePtr type = types::make_f64(), SourceSpan span = {})
    -> ExprPtr;
auto make_bool_literal(bool value, SourceSpan span = {}) -> ExprPtr;
auto make_char_literal(char value, SourceSpan span = {}) -> ExprPtr;
auto make_str_literal(std::string value, SourceSpan span = {}) -> ExprPtr;

auto make_var(std::string name, TypePtr type, SourceSpan span = {}) -> ExprPtr;
auto make_self_field(std::string field, TypePtr type, SourceSpan span = {}) -> ExprPtr;
auto make_field(ExprPtr object, std::string field, TypePtr type, SourceSpan span = {}) -> ExprPtr;
auto make_index(ExprPtr object, ExprPtr index, TypePtr type, SourceSpan span = {}) -> ExprPtr;
auto make_binary(BinOp op, ExprPtr left, ExprPtr right, TypePtr type, SourceSpan span = {})
    -> ExprPtr;
auto make_unary(UnaryOp op, ExprPtr operand, TypePtr type, SourceSpan span = {}) -> ExprPtr;

auto make_call(std::string callee, std::vector<ExprPtr> args, TypePtr type,
               std::vector<TypePtr> type_args = {}, SourceSpan span = {}) -> ExprPtr;

/// Instance method call on `receiver`.
auto make_method_call(ExprPtr receiver, TypePtr owner, std::string method,
                      std::vector<ExprPtr> args, TypePtr type, SourceSpan span = {}) -> ExprPtr;

/// Static method call `Owner.method(args)`.
auto make_static_call(TypePtr owner, std::string method, std::vector<ExprPtr> args, TypePtr type,
                      SourceSpan span = {}) -> ExprPtr;

auto make_struct(TypePtr type, std::vector<FieldInit> fields, SourceSpan span = {}) -> ExprPtr;
auto make_variant(TypePtr type, std::string variant, std::vector<ExprPtr> args = {},
                  SourceSpan span = {}) -> ExprPtr;

auto make_block(std::vector<StmtPtr> stmts, ExprPtr tail = nullptr, TypePtr type = nullptr,
                SourceSpan span = {}) -> ExprPtr;

/// Block in which address-of is permitted.
auto make_lowlevel_block(std::vector<StmtPtr> stmts, ExprPtr tail = nullptr,
                         TypePtr type = nullptr, SourceSpan span = {}) -> ExprPtr;

auto make_if(ExprPtr condition, ExprPtr then_branch, ExprPtr else_branch = nullptr,
             TypePtr type = nullptr, SourceSpan span = {}) -> ExprPtr;
auto make_match(ExprPtr scrutinee, std::vector<MatchArm> arms, TypePtr type = nullptr,
                SourceSpan span = {}) -> ExprPtr;
auto make_loop(ExprPtr body, SourceSpan span = {}) -> ExprPtr;
auto make_while(ExprPtr condition, ExprPtr body, SourceSpan span = {}) -> ExprPtr;
auto make_for(std::string var, ExprPtr start, ExprPtr end, ExprPtr body, bool inclusive = false,
              SourceSpan span = {}) -> ExprPtr;
auto make_return(ExprPtr value = nullptr, SourceSpan span = {}) -> ExprPtr;
auto make_break(SourceSpan span = {}) -> ExprPtr;
auto make_continue(SourceSpan span = {}) -> ExprPtr;
auto make_assign(ExprPtr target, ExprPtr value, std::optional<BinOp> op = std::nullopt,
                 SourceSpan span = {}) -> ExprPtr;

auto make_let(std::string name, TypePtr type, ExprPtr init, bool is_mut = false,
              SourceSpan span = {}) -> StmtPtr;
auto make_expr_stmt(ExprPtr expr, SourceSpan span = {}) -> StmtPtr;

/// Builds a match arm.
auto make_arm(Pattern pattern, ExprPtr body) -> MatchArm;

/// Collects move-only nodes into a vector, since `std::initializer_list`
/// cannot hold them: `move_list<ExprPtr>(make_var(...), make_int_literal(1))`.
template <typename T, typename... Args> auto move_list(Args&&... items) -> std::vector<T> {
    std::vector<T> list;
    list.reserve(sizeof...(items));
    (list.push_back(std::forward<Args>(items)), ...);
    return list;
}

} // namespace a2c::tree
