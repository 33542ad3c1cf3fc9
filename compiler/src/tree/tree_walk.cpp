//! # Program Tree Traversal
//!
//! Cloning walks every node kind explicitly so that adding a node kind
//! without updating the walkers fails to compile (the visitor lambdas have
//! no fallback branch).

#include "tree/tree_walk.hpp"

namespace a2c::tree {

namespace {

auto map_type(const TypePtr& type, const TypeMapper& map) -> TypePtr {
    return type ? map(type) : type;
}

auto clone_opt(const ExprPtr& expr, const TypeMapper& map) -> ExprPtr {
    return expr ? clone_expr(*expr, map) : nullptr;
}

auto clone_all(const std::vector<ExprPtr>& exprs, const TypeMapper& map) -> std::vector<ExprPtr> {
    std::vector<ExprPtr> result;
    result.reserve(exprs.size());
    for (const auto& e : exprs) {
        result.push_back(clone_expr(*e, map));
    }
    return result;
}

auto clone_params(const std::vector<ParamDecl>& params, const TypeMapper& map)
    -> std::vector<ParamDecl> {
    std::vector<ParamDecl> result;
    result.reserve(params.size());
    for (const auto& p : params) {
        ParamDecl copy = p;
        copy.type = map_type(p.type, map);
        result.push_back(std::move(copy));
    }
    return result;
}

auto clone_fields(const std::vector<FieldDecl>& fields, const TypeMapper& map)
    -> std::vector<FieldDecl> {
    std::vector<FieldDecl> result;
    result.reserve(fields.size());
    for (const auto& f : fields) {
        FieldDecl copy = f;
        copy.type = map_type(f.type, map);
        result.push_back(std::move(copy));
    }
    return result;
}

} // namespace

auto keep_types() -> TypeMapper {
    return [](const TypePtr& type) { return type; };
}

// ============================================================================
// Cloning
// ============================================================================

auto clone_expr(const Expr& expr, const TypeMapper& map) -> ExprPtr {
    auto result = make_box<Expr>();
    result->kind = std::visit(
        [&map](const auto& e) -> decltype(Expr::kind) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, LiteralExpr>) {
                return LiteralExpr{e.value, map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, VarExpr>) {
                return VarExpr{e.name, map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, SelfFieldExpr>) {
                return SelfFieldExpr{e.field, map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, FieldExpr>) {
                return FieldExpr{clone_expr(*e.object, map), e.field, map_type(e.type, map),
                                 e.span};
            } else if constexpr (std::is_same_v<T, IndexExpr>) {
                return IndexExpr{clone_expr(*e.object, map), clone_expr(*e.index, map),
                                 map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return BinaryExpr{e.op, clone_expr(*e.left, map), clone_expr(*e.right, map),
                                  map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                return UnaryExpr{e.op, clone_expr(*e.operand, map), map_type(e.type, map),
                                 e.span};
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                std::vector<TypePtr> type_args;
                for (const auto& arg : e.type_args) {
                    type_args.push_back(map_type(arg, map));
                }
                return CallExpr{e.callee, std::move(type_args), clone_all(e.args, map),
                                map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, MethodCallExpr>) {
                return MethodCallExpr{clone_opt(e.receiver, map), map_type(e.owner, map),
                                      e.method, clone_all(e.args, map), map_type(e.type, map),
                                      e.span};
            } else if constexpr (std::is_same_v<T, StructExpr>) {
                std::vector<FieldInit> fields;
                fields.reserve(e.fields.size());
                for (const auto& f : e.fields) {
                    fields.push_back(FieldInit{f.name, clone_expr(*f.value, map)});
                }
                return StructExpr{std::move(fields), map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, VariantExpr>) {
                return VariantExpr{e.variant, clone_all(e.args, map), map_type(e.type, map),
                                   e.span};
            } else if constexpr (std::is_same_v<T, BlockExpr>) {
                std::vector<StmtPtr> stmts;
                stmts.reserve(e.stmts.size());
                for (const auto& s : e.stmts) {
                    stmts.push_back(clone_stmt(*s, map));
                }
                return BlockExpr{std::move(stmts), clone_opt(e.tail, map), e.is_lowlevel,
                                 map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, IfExpr>) {
                return IfExpr{clone_expr(*e.condition, map), clone_expr(*e.then_branch, map),
                              clone_opt(e.else_branch, map), map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, MatchExpr>) {
                std::vector<MatchArm> arms;
                arms.reserve(e.arms.size());
                for (const auto& arm : e.arms) {
                    arms.push_back(MatchArm{arm.pattern, clone_expr(*arm.body, map)});
                }
                return MatchExpr{clone_expr(*e.scrutinee, map), std::move(arms),
                                 map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, LoopExpr>) {
                return LoopExpr{clone_opt(e.condition, map), clone_expr(*e.body, map),
                                map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, ForExpr>) {
                return ForExpr{e.var,
                               clone_expr(*e.start, map),
                               clone_expr(*e.end, map),
                               e.inclusive,
                               clone_expr(*e.body, map),
                               map_type(e.type, map),
                               e.span};
            } else if constexpr (std::is_same_v<T, ReturnExpr>) {
                return ReturnExpr{clone_opt(e.value, map), map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, BreakExpr>) {
                return BreakExpr{map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, ContinueExpr>) {
                return ContinueExpr{map_type(e.type, map), e.span};
            } else if constexpr (std::is_same_v<T, AssignExpr>) {
                return AssignExpr{e.op, clone_expr(*e.target, map), clone_expr(*e.value, map),
                                  map_type(e.type, map), e.span};
            }
        },
        expr.kind);
    return result;
}

auto clone_stmt(const Stmt& stmt, const TypeMapper& map) -> StmtPtr {
    auto result = make_box<Stmt>();
    if (stmt.is<LetStmt>()) {
        const auto& let = stmt.as<LetStmt>();
        result->kind = LetStmt{let.name, map_type(let.type, map), let.is_mut,
                               clone_opt(let.init, map), let.span};
    } else {
        const auto& es = stmt.as<ExprStmt>();
        result->kind = ExprStmt{clone_expr(*es.expr, map), es.span};
    }
    return result;
}

auto clone_function(const FuncDecl& func, const TypeMapper& map) -> FuncDecl {
    FuncDecl result;
    result.name = func.name;
    result.generic_params = func.generic_params;
    result.params = clone_params(func.params, map);
    result.return_type = map_type(func.return_type, map);
    result.return_passing = func.return_passing;
    result.body = clone_opt(func.body, map);
    result.is_lowlevel = func.is_lowlevel;
    result.only_for = func.only_for;
    result.owner_type = func.owner_type;
    result.generic_origin = func.generic_origin;
    result.span = func.span;
    return result;
}

auto clone_method(const MethodDecl& method, const TypeMapper& map) -> MethodDecl {
    MethodDecl result;
    result.name = method.name;
    result.kind = method.kind;
    result.params = clone_params(method.params, map);
    result.return_type = map_type(method.return_type, map);
    result.mutates_receiver = method.mutates_receiver;
    result.receiver_passing = method.receiver_passing;
    result.return_passing = method.return_passing;
    result.body = clone_opt(method.body, map);
    result.is_lowlevel = method.is_lowlevel;
    result.only_for = method.only_for;
    result.span = method.span;
    return result;
}

auto clone_type_decl(const TypeDecl& decl, const TypeMapper& map) -> TypeDecl {
    TypeDecl result;
    result.name = decl.name;
    result.generic_params = decl.generic_params;
    result.fields = clone_fields(decl.fields, map);
    for (const auto& v : decl.variants) {
        VariantDecl variant;
        variant.name = v.name;
        variant.fields = clone_fields(v.fields, map);
        variant.discriminant = v.discriminant;
        variant.span = v.span;
        result.variants.push_back(std::move(variant));
    }
    result.is_tag = decl.is_tag;
    result.is_opaque = decl.is_opaque;
    result.is_heap_backed = decl.is_heap_backed;
    for (const auto& m : decl.methods) {
        result.methods.push_back(clone_method(m, map));
    }
    result.only_for = decl.only_for;
    result.generic_origin = decl.generic_origin;
    result.span = decl.span;
    return result;
}

// ============================================================================
// Traversal
// ============================================================================

namespace {

/// Calls `f` on every direct child expression of `expr`, in source order.
template <typename ExprT, typename F> void visit_children(ExprT& expr, F&& f) {
    std::visit(
        [&f](auto& e) {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, FieldExpr>) {
                f(*e.object);
            } else if constexpr (std::is_same_v<T, IndexExpr>) {
                f(*e.object);
                f(*e.index);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                f(*e.left);
                f(*e.right);
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                f(*e.operand);
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                for (auto& arg : e.args)
                    f(*arg);
            } else if constexpr (std::is_same_v<T, MethodCallExpr>) {
                if (e.receiver)
                    f(*e.receiver);
                for (auto& arg : e.args)
                    f(*arg);
            } else if constexpr (std::is_same_v<T, StructExpr>) {
                for (auto& field : e.fields)
                    f(*field.value);
            } else if constexpr (std::is_same_v<T, VariantExpr>) {
                for (auto& arg : e.args)
                    f(*arg);
            } else if constexpr (std::is_same_v<T, BlockExpr>) {
                for (auto& stmt : e.stmts) {
                    if (stmt->template is<LetStmt>()) {
                        auto& let = stmt->template as<LetStmt>();
                        if (let.init)
                            f(*let.init);
                    } else {
                        f(*stmt->template as<ExprStmt>().expr);
                    }
                }
                if (e.tail)
                    f(*e.tail);
            } else if constexpr (std::is_same_v<T, IfExpr>) {
                f(*e.condition);
                f(*e.then_branch);
                if (e.else_branch)
                    f(*e.else_branch);
            } else if constexpr (std::is_same_v<T, MatchExpr>) {
                f(*e.scrutinee);
                for (auto& arm : e.arms)
                    f(*arm.body);
            } else if constexpr (std::is_same_v<T, LoopExpr>) {
                if (e.condition)
                    f(*e.condition);
                f(*e.body);
            } else if constexpr (std::is_same_v<T, ForExpr>) {
                f(*e.start);
                f(*e.end);
                f(*e.body);
            } else if constexpr (std::is_same_v<T, ReturnExpr>) {
                if (e.value)
                    f(*e.value);
            } else if constexpr (std::is_same_v<T, AssignExpr>) {
                f(*e.target);
                f(*e.value);
            }
        },
        expr.kind);
}

} // namespace

void for_each_child(const Expr& expr, const std::function<void(const Expr&)>& visit) {
    visit_children(expr, [&visit](const Expr& child) { visit(child); });
}

void for_each_expr(const Expr& expr, const std::function<void(const Expr&)>& visit) {
    visit(expr);
    visit_children(expr, [&visit](const Expr& child) { for_each_expr(child, visit); });
}

void for_each_expr_mut(Expr& expr, const std::function<void(Expr&)>& visit) {
    visit(expr);
    visit_children(expr, [&visit](Expr& child) { for_each_expr_mut(child, visit); });
}

void rewrite_types(Expr& expr, const TypeMapper& map) {
    for_each_expr_mut(expr, [&map](Expr& e) {
        auto& slot = e.type_slot();
        slot = map_type(slot, map);

        if (e.is<CallExpr>()) {
            for (auto& arg : e.as<CallExpr>().type_args) {
                arg = map_type(arg, map);
            }
        } else if (e.is<MethodCallExpr>()) {
            auto& call = e.as<MethodCallExpr>();
            call.owner = map_type(call.owner, map);
        } else if (e.is<BlockExpr>()) {
            for (auto& stmt : e.as<BlockExpr>().stmts) {
                if (stmt->is<LetStmt>()) {
                    auto& let = stmt->as<LetStmt>();
                    let.type = map_type(let.type, map);
                }
            }
        }
    });
}

} // namespace a2c::tree
