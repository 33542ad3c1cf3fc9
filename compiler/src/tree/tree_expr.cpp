//! # Program Tree Expression Implementation
//!
//! Accessors and factory functions for expressions, statements and patterns.
//!
//! ## Factory Functions
//!
//! Factory functions (`make_*`) provide a consistent API for building tree
//! nodes, mostly used by tests and by passes that synthesize code. They
//! handle allocation, variant initialization, and default unit types for
//! statement-like expressions.

#include "tree/tree_expr.hpp"

namespace a2c::tree {

// ============================================================================
// Operators
// ============================================================================

auto binop_to_string(BinOp op) -> const char* {
    switch (op) {
    case BinOp::Add:
        return "+";
    case BinOp::Sub:
        return "-";
    case BinOp::Mul:
        return "*";
    case BinOp::Div:
        return "/";
    case BinOp::Mod:
        return "%";
    case BinOp::Eq:
        return "==";
    case BinOp::Ne:
        return "!=";
    case BinOp::Lt:
        return "<";
    case BinOp::Le:
        return "<=";
    case BinOp::Gt:
        return ">";
    case BinOp::Ge:
        return ">=";
    case BinOp::And:
        return "&&";
    case BinOp::Or:
        return "||";
    case BinOp::BitAnd:
        return "&";
    case BinOp::BitOr:
        return "|";
    case BinOp::BitXor:
        return "^";
    case BinOp::Shl:
        return "<<";
    case BinOp::Shr:
        return ">>";
    }
    return "?";
}

auto unaryop_to_string(UnaryOp op) -> const char* {
    switch (op) {
    case UnaryOp::Neg:
        return "-";
    case UnaryOp::Not:
        return "!";
    case UnaryOp::BitNot:
        return "~";
    case UnaryOp::AddrOf:
        return "&";
    case UnaryOp::Deref:
        return "*";
    }
    return "?";
}

// ============================================================================
// Accessors
// ============================================================================

auto Expr::type() const -> TypePtr {
    return std::visit([](const auto& e) -> TypePtr { return e.type; }, kind);
}

auto Expr::type_slot() -> TypePtr& {
    return std::visit([](auto& e) -> TypePtr& { return e.type; }, kind);
}

auto Expr::span() const -> SourceSpan {
    return std::visit([](const auto& e) { return e.span; }, kind);
}

auto Stmt::span() const -> SourceSpan {
    return std::visit([](const auto& s) { return s.span; }, kind);
}

// ============================================================================
// Pattern Factories
// ============================================================================

auto make_wildcard_pattern(SourceSpan span) -> Pattern {
    return Pattern{WildcardPattern{}, std::move(span)};
}

auto make_binding_pattern(std::string name, SourceSpan span) -> Pattern {
    return Pattern{BindingPattern{std::move(name)}, std::move(span)};
}

auto make_variant_pattern(std::string variant, std::vector<std::string> bindings,
                          SourceSpan span) -> Pattern {
    return Pattern{VariantPattern{std::move(variant), std::move(bindings)}, std::move(span)};
}

auto make_literal_pattern(int64_t value, SourceSpan span) -> Pattern {
    return Pattern{LiteralPattern{value}, std::move(span)};
}

// ============================================================================
// Expression Factories
// ============================================================================

namespace {

template <typename T> auto wrap(T node) -> ExprPtr {
    auto expr = make_box<Expr>();
    expr->kind = std::move(node);
    return expr;
}

auto or_unit(TypePtr type) -> TypePtr {
    return type ? std::move(type) : types::make_unit();
}

} // namespace

auto make_int_literal(int64_t value, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(LiteralExpr{value, std::move(type), std::move(span)});
}

auto make_float_literal(double value, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(LiteralExpr{value, std::move(type), std::move(span)});
}

auto make_bool_literal(bool value, SourceSpan span) -> ExprPtr {
    return wrap(LiteralExpr{value, types::make_bool(), std::move(span)});
}

auto make_char_literal(char value, SourceSpan span) -> ExprPtr {
    return wrap(LiteralExpr{value, types::make_char(), std::move(span)});
}

auto make_str_literal(std::string value, SourceSpan span) -> ExprPtr {
    return wrap(LiteralExpr{std::move(value), types::make_str(), std::move(span)});
}

auto make_var(std::string name, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(VarExpr{std::move(name), std::move(type), std::move(span)});
}

auto make_self_field(std::string field, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(SelfFieldExpr{std::move(field), std::move(type), std::move(span)});
}

auto make_field(ExprPtr object, std::string field, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(FieldExpr{std::move(object), std::move(field), std::move(type), std::move(span)});
}

auto make_index(ExprPtr object, ExprPtr index, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(IndexExpr{std::move(object), std::move(index), std::move(type), std::move(span)});
}

auto make_binary(BinOp op, ExprPtr left, ExprPtr right, TypePtr type, SourceSpan span)
    -> ExprPtr {
    return wrap(
        BinaryExpr{op, std::move(left), std::move(right), std::move(type), std::move(span)});
}

auto make_unary(UnaryOp op, ExprPtr operand, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(UnaryExpr{op, std::move(operand), std::move(type), std::move(span)});
}

auto make_call(std::string callee, std::vector<ExprPtr> args, TypePtr type,
               std::vector<TypePtr> type_args, SourceSpan span) -> ExprPtr {
    return wrap(CallExpr{std::move(callee), std::move(type_args), std::move(args),
                         or_unit(std::move(type)), std::move(span)});
}

auto make_method_call(ExprPtr receiver, TypePtr owner, std::string method,
                      std::vector<ExprPtr> args, TypePtr type, SourceSpan span) -> ExprPtr {
    return wrap(MethodCallExpr{std::move(receiver), std::move(owner), std::move(method),
                               std::move(args), or_unit(std::move(type)), std::move(span)});
}

auto make_static_call(TypePtr owner, std::string method, std::vector<ExprPtr> args, TypePtr type,
                      SourceSpan span) -> ExprPtr {
    return wrap(MethodCallExpr{nullptr, std::move(owner), std::move(method), std::move(args),
                               or_unit(std::move(type)), std::move(span)});
}

auto make_struct(TypePtr type, std::vector<FieldInit> fields, SourceSpan span) -> ExprPtr {
    return wrap(StructExpr{std::move(fields), std::move(type), std::move(span)});
}

auto make_variant(TypePtr type, std::string variant, std::vector<ExprPtr> args, SourceSpan span)
    -> ExprPtr {
    return wrap(VariantExpr{std::move(variant), std::move(args), std::move(type), std::move(span)});
}

auto make_block(std::vector<StmtPtr> stmts, ExprPtr tail, TypePtr type, SourceSpan span)
    -> ExprPtr {
    if (!type) {
        type = tail ? tail->type() : types::make_unit();
    }
    return wrap(BlockExpr{std::move(stmts), std::move(tail), false, std::move(type),
                          std::move(span)});
}

auto make_lowlevel_block(std::vector<StmtPtr> stmts, ExprPtr tail, TypePtr type, SourceSpan span)
    -> ExprPtr {
    auto block = make_block(std::move(stmts), std::move(tail), std::move(type), std::move(span));
    block->as<BlockExpr>().is_lowlevel = true;
    return block;
}

auto make_if(ExprPtr condition, ExprPtr then_branch, ExprPtr else_branch, TypePtr type,
             SourceSpan span) -> ExprPtr {
    return wrap(IfExpr{std::move(condition), std::move(then_branch), std::move(else_branch),
                       or_unit(std::move(type)), std::move(span)});
}

auto make_match(ExprPtr scrutinee, std::vector<MatchArm> arms, TypePtr type, SourceSpan span)
    -> ExprPtr {
    return wrap(
        MatchExpr{std::move(scrutinee), std::move(arms), or_unit(std::move(type)), std::move(span)});
}

auto make_loop(ExprPtr body, SourceSpan span) -> ExprPtr {
    return wrap(LoopExpr{nullptr, std::move(body), types::make_unit(), std::move(span)});
}

auto make_while(ExprPtr condition, ExprPtr body, SourceSpan span) -> ExprPtr {
    return wrap(
        LoopExpr{std::move(condition), std::move(body), types::make_unit(), std::move(span)});
}

auto make_for(std::string var, ExprPtr start, ExprPtr end, ExprPtr body, bool inclusive,
              SourceSpan span) -> ExprPtr {
    return wrap(ForExpr{std::move(var), std::move(start), std::move(end), inclusive,
                        std::move(body), types::make_unit(), std::move(span)});
}

auto make_return(ExprPtr value, SourceSpan span) -> ExprPtr {
    return wrap(ReturnExpr{std::move(value), types::make_unit(), std::move(span)});
}

auto make_break(SourceSpan span) -> ExprPtr {
    return wrap(BreakExpr{types::make_unit(), std::move(span)});
}

auto make_continue(SourceSpan span) -> ExprPtr {
    return wrap(ContinueExpr{types::make_unit(), std::move(span)});
}

auto make_assign(ExprPtr target, ExprPtr value, std::optional<BinOp> op, SourceSpan span)
    -> ExprPtr {
    return wrap(AssignExpr{op, std::move(target), std::move(value), types::make_unit(),
                           std::move(span)});
}

// ============================================================================
// Statement Factories
// ============================================================================

auto make_let(std::string name, TypePtr type, ExprPtr init, bool is_mut, SourceSpan span)
    -> StmtPtr {
    auto stmt = make_box<Stmt>();
    if (!type && init) {
        type = init->type();
    }
    stmt->kind = LetStmt{std::move(name), std::move(type), is_mut, std::move(init), std::move(span)};
    return stmt;
}

auto make_expr_stmt(ExprPtr expr, SourceSpan span) -> StmtPtr {
    auto stmt = make_box<Stmt>();
    stmt->kind = ExprStmt{std::move(expr), std::move(span)};
    return stmt;
}

auto make_arm(Pattern pattern, ExprPtr body) -> MatchArm {
    return MatchArm{std::move(pattern), std::move(body)};
}

} // namespace a2c::tree
