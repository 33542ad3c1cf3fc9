//! # Ownership Classifier - Mutability Checks
//!
//! Walks a body with a scoped binding environment. Parameters are mutable
//! unless only read; `let` bindings follow their `mut` flag; loop variables
//! and match bindings are immutable; `self` is mutable only inside
//! mutating methods.

#include "layout/layout_compiler.hpp"
#include "log/log.hpp"
#include "ownership/classifier.hpp"

#include <algorithm>

namespace a2c::ownership {

// ============================================================================
// BindingEnv
// ============================================================================

void BindingEnv::push_scope() {
    scopes_.emplace_back();
}

void BindingEnv::pop_scope() {
    if (!scopes_.empty()) {
        scopes_.pop_back();
    }
}

void BindingEnv::define(const std::string& name, bool is_mut) {
    if (scopes_.empty()) {
        push_scope();
    }
    scopes_.back()[name] = is_mut;
}

auto BindingEnv::is_mutable(const std::string& name) const -> std::optional<bool> {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = it->find(name);
        if (found != it->end()) {
            return found->second;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Place Roots
// ============================================================================

namespace {

auto is_pointer(const types::TypePtr& type) -> bool {
    return type && (type->is<types::PtrType>() || type->is<types::IndirectType>());
}

} // namespace

auto place_root(const tree::Expr& expr) -> std::optional<std::string> {
    if (expr.is<tree::VarExpr>()) {
        return expr.as<tree::VarExpr>().name;
    }
    if (expr.is<tree::SelfFieldExpr>()) {
        return std::string("self");
    }
    if (expr.is<tree::FieldExpr>()) {
        const auto& object = *expr.as<tree::FieldExpr>().object;
        if (is_pointer(object.type()))
            return std::nullopt;
        return place_root(object);
    }
    if (expr.is<tree::IndexExpr>()) {
        const auto& object = *expr.as<tree::IndexExpr>().object;
        if (is_pointer(object.type()))
            return std::nullopt;
        return place_root(object);
    }
    return std::nullopt;
}

// ============================================================================
// MutabilityChecker
// ============================================================================

void MutabilityChecker::define_params(const std::vector<tree::ParamDecl>& params) {
    for (const auto& param : params) {
        env_.define(param.name, param.intent != tree::ParamIntent::Read &&
                                    param.passing != tree::PassingMode::RefImmutable);
    }
}

auto MutabilityChecker::check_function(const tree::FuncDecl& func)
    -> Result<Unit, diag::Diagnostic> {
    env_ = BindingEnv{};
    error_.reset();
    symbol_ = func.name;
    lowlevel_depth_ = func.is_lowlevel ? 1 : 0;

    env_.push_scope();
    define_params(func.params);
    check_expr(*func.body);

    if (error_) {
        return *error_;
    }
    return Unit{};
}

auto MutabilityChecker::check_method(const tree::TypeDecl& owner, const tree::MethodDecl& method)
    -> Result<Unit, diag::Diagnostic> {
    env_ = BindingEnv{};
    error_.reset();
    symbol_ = owner.name + "." + method.name;
    lowlevel_depth_ = method.is_lowlevel ? 1 : 0;

    env_.push_scope();
    if (method.kind == tree::MethodKind::Instance) {
        env_.define("self", method.mutates_receiver);
    }
    define_params(method.params);
    check_expr(*method.body);

    if (error_) {
        return *error_;
    }
    return Unit{};
}

void MutabilityChecker::fail(std::string message, const SourceSpan& span) {
    if (!error_) {
        A2C_LOG_DEBUG("ownership", symbol_ << ": " << message);
        error_ = diag::make_diagnostic(diag::ErrorKind::OwnershipViolation, module_, symbol_,
                                       std::move(message), span);
    }
}

void MutabilityChecker::require_mutable(const tree::Expr& place, const std::string& what) {
    auto root = place_root(place);
    if (!root) {
        return;
    }
    auto is_mut = env_.is_mutable(*root);
    if (is_mut && !*is_mut) {
        fail(what + " needs a mutable binding, but '" + *root + "' is immutable", place.span());
    }
}

void MutabilityChecker::check_call_args(const std::vector<tree::ParamDecl>& params,
                                        const std::vector<tree::ExprPtr>& args,
                                        const std::string& callee) {
    const auto n = std::min(params.size(), args.size());
    for (size_t i = 0; i < n; ++i) {
        if (params[i].passing == tree::PassingMode::RefMutable) {
            require_mutable(*args[i], "argument '" + params[i].name + "' of '" + callee + "'");
        }
    }
}

void MutabilityChecker::check_method_call(const tree::MethodCallExpr& call) {
    auto owner_name = layout::record_name(call.owner);
    if (!owner_name) {
        return;
    }
    const auto symbol = *owner_name + "." + call.method;

    const auto* owner = index_.find_type(*owner_name);
    if (const auto* method = owner ? owner->find_method(call.method) : nullptr) {
        if (call.receiver && method->mutates_receiver) {
            require_mutable(*call.receiver, "receiver of mutating method '" + symbol + "'");
        }
        check_call_args(method->params, call.args, symbol);
        return;
    }

    // Methods of imported types are already lowered to `Type_method`, with
    // the receiver as first parameter.
    const auto* lowered = index_.find_function(tree::lowered_method_name(*owner_name, call.method));
    if (!lowered) {
        return;
    }
    std::vector<tree::ParamDecl> params = lowered->params;
    if (call.receiver && !params.empty()) {
        if (params.front().passing == tree::PassingMode::RefMutable) {
            require_mutable(*call.receiver, "receiver of mutating method '" + symbol + "'");
        }
        params.erase(params.begin());
    }
    check_call_args(params, call.args, symbol);
}

void MutabilityChecker::check_block(const tree::BlockExpr& block) {
    if (block.is_lowlevel)
        ++lowlevel_depth_;
    env_.push_scope();

    for (const auto& stmt : block.stmts) {
        if (error_)
            break;
        if (stmt->is<tree::LetStmt>()) {
            const auto& let = stmt->as<tree::LetStmt>();
            if (let.init)
                check_expr(*let.init);
            env_.define(let.name, let.is_mut);
        } else {
            check_expr(*stmt->as<tree::ExprStmt>().expr);
        }
    }
    if (block.tail && !error_) {
        check_expr(*block.tail);
    }

    env_.pop_scope();
    if (block.is_lowlevel)
        --lowlevel_depth_;
}

void MutabilityChecker::check_expr(const tree::Expr& expr) {
    if (error_) {
        return;
    }

    // Scoping constructs walk their own children.
    if (expr.is<tree::BlockExpr>()) {
        check_block(expr.as<tree::BlockExpr>());
        return;
    }
    if (expr.is<tree::ForExpr>()) {
        const auto& loop = expr.as<tree::ForExpr>();
        check_expr(*loop.start);
        check_expr(*loop.end);
        env_.push_scope();
        env_.define(loop.var, false);
        check_expr(*loop.body);
        env_.pop_scope();
        return;
    }
    if (expr.is<tree::MatchExpr>()) {
        const auto& match = expr.as<tree::MatchExpr>();
        check_expr(*match.scrutinee);
        for (const auto& arm : match.arms) {
            env_.push_scope();
            if (arm.pattern.is<tree::BindingPattern>()) {
                env_.define(arm.pattern.as<tree::BindingPattern>().name, false);
            } else if (arm.pattern.is<tree::VariantPattern>()) {
                for (const auto& name : arm.pattern.as<tree::VariantPattern>().bindings) {
                    if (!name.empty() && name != "_")
                        env_.define(name, false);
                }
            }
            check_expr(*arm.body);
            env_.pop_scope();
        }
        return;
    }

    if (expr.is<tree::AssignExpr>()) {
        require_mutable(*expr.as<tree::AssignExpr>().target, "assignment");
    } else if (expr.is<tree::UnaryExpr>()) {
        const auto& unary = expr.as<tree::UnaryExpr>();
        if (unary.op == tree::UnaryOp::AddrOf && lowlevel_depth_ == 0) {
            fail("address-of outside low-level code", expr.span());
        }
    } else if (expr.is<tree::CallExpr>()) {
        const auto& call = expr.as<tree::CallExpr>();
        if (const auto* callee = index_.find_function(call.callee)) {
            check_call_args(callee->params, call.args, call.callee);
        }
    } else if (expr.is<tree::MethodCallExpr>()) {
        check_method_call(expr.as<tree::MethodCallExpr>());
    }

    tree::for_each_child(expr, [this](const tree::Expr& child) { check_expr(child); });
}

} // namespace a2c::ownership
