//! # C Emitter - Statements
//!
//! Control flow is lowered to C statements. An expression whose value is
//! needed is lowered together with a `Sink` naming where that value goes:
//! nowhere, a `return`, or an assignment to a local or temporary. Branches
//! of `if` and `match` pass the sink on, so every branch delivers its own
//! value.

#include "codegen/c_emitter.hpp"

#include "codegen/c_types.hpp"
#include "log/log.hpp"

#include <tuple>

namespace a2c::codegen {

auto needs_statements(const tree::Expr& expr) -> bool {
    return expr.is<tree::BlockExpr>() || expr.is<tree::IfExpr>() || expr.is<tree::MatchExpr>() ||
           expr.is<tree::LoopExpr>() || expr.is<tree::ForExpr>() || expr.is<tree::ReturnExpr>() ||
           expr.is<tree::BreakExpr>() || expr.is<tree::ContinueExpr>();
}

auto is_place(const tree::Expr& expr) -> bool {
    if (expr.is<tree::VarExpr>()) {
        return true;
    }
    if (expr.is<tree::FieldExpr>()) {
        return is_place(*expr.as<tree::FieldExpr>().object);
    }
    if (expr.is<tree::IndexExpr>()) {
        const auto& index = expr.as<tree::IndexExpr>();
        return is_place(*index.object) &&
               (index.index->is<tree::LiteralExpr>() || index.index->is<tree::VarExpr>());
    }
    return false;
}

// ============================================================================
// Blocks and Statements
// ============================================================================

void CEmitter::gen_block_body(const tree::BlockExpr& block, const Sink& sink) {
    push_scope();
    for (const auto& stmt : block.stmts) {
        if (error_)
            break;
        gen_stmt(*stmt);
    }
    if (block.tail && !error_) {
        gen_value(*block.tail, sink);
    }
    pop_scope();
}

void CEmitter::gen_stmt(const tree::Stmt& stmt) {
    if (stmt.is<tree::LetStmt>()) {
        gen_let(stmt.as<tree::LetStmt>());
    } else {
        gen_value(*stmt.as<tree::ExprStmt>().expr, Sink::discard());
    }
}

void CEmitter::gen_let(const tree::LetStmt& let) {
    auto type = let.type ? let.type : (let.init ? let.init->type() : nullptr);

    if (!let.init) {
        emit_line(c_declare(type, let.name) + ";");
    } else if (types::is_unit(type)) {
        gen_value(*let.init, Sink::discard());
    } else if (needs_statements(*let.init)) {
        emit_line(c_declare(type, let.name) + ";");
        gen_value(*let.init, Sink::assign(let.name));
    } else {
        auto init = gen_init(*let.init);
        emit_line(c_declare(type, let.name) + " = " + init + ";");
    }
    declare_local(let.name, false);
}

void CEmitter::gen_branch(const tree::Expr& body, const Sink& sink) {
    if (body.is<tree::BlockExpr>()) {
        gen_block_body(body.as<tree::BlockExpr>(), sink);
    } else {
        gen_value(body, sink);
    }
}

void CEmitter::deliver(const std::string& value, const types::TypePtr& type, const Sink& sink) {
    switch (sink.kind) {
    case Sink::Kind::Discard:
        if (!value.empty())
            emit_line(value + ";");
        break;
    case Sink::Kind::Return:
        if (value.empty() || types::is_unit(type)) {
            if (!value.empty())
                emit_line(value + ";");
            emit_line("return;");
        } else {
            emit_line("return " + value + ";");
        }
        break;
    case Sink::Kind::Assign:
        if (!value.empty())
            emit_line(sink.target + " = " + value + ";");
        break;
    }
}

void CEmitter::gen_value(const tree::Expr& expr, const Sink& sink) {
    if (error_) {
        return;
    }

    if (expr.is<tree::BlockExpr>()) {
        emit_line("{");
        push_indent();
        gen_block_body(expr.as<tree::BlockExpr>(), sink);
        pop_indent();
        emit_line("}");
    } else if (expr.is<tree::IfExpr>()) {
        gen_if(expr.as<tree::IfExpr>(), sink);
    } else if (expr.is<tree::MatchExpr>()) {
        gen_match(expr.as<tree::MatchExpr>(), sink);
    } else if (expr.is<tree::LoopExpr>()) {
        gen_loop(expr.as<tree::LoopExpr>());
    } else if (expr.is<tree::ForExpr>()) {
        gen_for(expr.as<tree::ForExpr>());
    } else if (expr.is<tree::ReturnExpr>()) {
        gen_return(expr.as<tree::ReturnExpr>());
    } else if (expr.is<tree::BreakExpr>()) {
        emit_line("break;");
    } else if (expr.is<tree::ContinueExpr>()) {
        emit_line("continue;");
    } else if (expr.is<tree::AssignExpr>() && !expr.as<tree::AssignExpr>().op &&
               needs_statements(*expr.as<tree::AssignExpr>().value)) {
        const auto& assign = expr.as<tree::AssignExpr>();
        auto target = gen_expr(*assign.target);
        gen_value(*assign.value, Sink::assign(target));
    } else {
        auto text = gen_expr(expr);
        if (error_)
            return;
        deliver(text, expr.type(), sink);
    }
}

// ============================================================================
// Control Flow
// ============================================================================

void CEmitter::gen_if(const tree::IfExpr& expr, const Sink& sink) {
    auto condition = gen_expr(*expr.condition);
    emit_line("if (" + condition + ") {");
    push_indent();
    gen_branch(*expr.then_branch, sink);
    pop_indent();

    const tree::Expr* rest = expr.else_branch.get();
    while (rest && !error_) {
        if (rest->is<tree::IfExpr>() && !hoists(*rest->as<tree::IfExpr>().condition)) {
            const auto& elif = rest->as<tree::IfExpr>();
            emit_line("} else if (" + gen_expr(*elif.condition) + ") {");
            push_indent();
            gen_branch(*elif.then_branch, sink);
            pop_indent();
            rest = elif.else_branch.get();
            continue;
        }
        emit_line("} else {");
        push_indent();
        gen_branch(*rest, sink);
        pop_indent();
        rest = nullptr;
    }
    emit_line("}");
}

void CEmitter::gen_match(const tree::MatchExpr& expr, const Sink& sink) {
    const auto* tag = layouts_.tag_of(expr.scrutinee->type());
    auto planned = layout::plan_match(expr, tag, module_.name);
    if (is_err(planned)) {
        error_ = unwrap_err(planned);
        return;
    }
    const auto& plan = unwrap(planned);

    // The scrutinee is evaluated once; payload bindings read from it.
    std::string base;
    bool through_pointer = false;
    if (plan.on_tag) {
        std::tie(base, through_pointer) = gen_object(*expr.scrutinee);
    } else {
        base = gen_expr(*expr.scrutinee);
    }
    if (error_)
        return;
    if (!is_place(*expr.scrutinee)) {
        auto temp = new_temp();
        emit_line(c_declare(expr.scrutinee->type(), temp) + " = " + base + ";");
        base = temp;
    }

    auto access = [&](const std::string& path) {
        return base + (through_pointer ? "->" : ".") + path;
    };

    emit_line("switch (" + (plan.on_tag ? access("tag") : base) + ") {");
    for (const auto& c : plan.cases) {
        if (error_)
            break;
        emit_line("case " + c.label + ": {");
        push_indent();
        push_scope();
        for (const auto& binding : c.bindings) {
            if (binding.type && binding.type->is<types::ArrayType>()) {
                // Arrays cannot be copied by initialization; bind the storage
                emit_line(c_declare(binding.type, "(*" + binding.name + ")") + " = &" +
                          access(binding.access) + ";");
                declare_local(binding.name, true);
                continue;
            }
            emit_line(c_declare(binding.type, binding.name) + " = " + access(binding.access) +
                      ";");
            declare_local(binding.name, false);
        }
        gen_branch(*expr.arms[c.arm].body, sink);
        pop_scope();
        pop_indent();
        emit_line("} break;");
    }
    if (plan.default_arm && !error_) {
        emit_line("default: {");
        push_indent();
        push_scope();
        if (!plan.default_binding.empty()) {
            auto value = through_pointer ? "(*" + base + ")" : base;
            emit_line(c_declare(expr.scrutinee->type(), plan.default_binding) + " = " + value +
                      ";");
            declare_local(plan.default_binding, false);
        }
        gen_branch(*expr.arms[*plan.default_arm].body, sink);
        pop_scope();
        pop_indent();
        emit_line("} break;");
    }
    emit_line("}");
}

void CEmitter::gen_loop(const tree::LoopExpr& loop) {
    if (!loop.condition) {
        emit_line("while (1) {");
        push_indent();
    } else if (hoists(*loop.condition)) {
        // The condition's statements have to run on every iteration
        emit_line("while (1) {");
        push_indent();
        auto condition = gen_expr(*loop.condition);
        emit_line("if (!(" + condition + ")) break;");
    } else {
        emit_line("while (" + gen_expr(*loop.condition) + ") {");
        push_indent();
    }
    gen_branch(*loop.body, Sink::discard());
    pop_indent();
    emit_line("}");
}

void CEmitter::gen_for(const tree::ForExpr& loop) {
    auto var_type = loop.start->type() ? loop.start->type() : types::make_i32();
    auto start = gen_expr(*loop.start);
    auto end = gen_expr(*loop.end);
    if (error_)
        return;

    // The range end is evaluated once
    if (!loop.end->is<tree::LiteralExpr>() && !loop.end->is<tree::VarExpr>()) {
        auto temp = new_temp();
        emit_line(c_declare(loop.end->type() ? loop.end->type() : var_type, temp) + " = " + end +
                  ";");
        end = temp;
    }

    const auto cmp = loop.inclusive ? " <= " : " < ";
    emit_line("for (" + c_declare(var_type, loop.var) + " = " + start + "; " + loop.var + cmp +
              end + "; " + loop.var + "++) {");
    push_indent();
    push_scope();
    declare_local(loop.var, false);
    gen_branch(*loop.body, Sink::discard());
    pop_scope();
    pop_indent();
    emit_line("}");
}

void CEmitter::gen_return(const tree::ReturnExpr& ret) {
    if (ret.value) {
        gen_value(*ret.value, Sink::to_return());
        return;
    }
    if (current_func_ && is_main(*current_func_) && types::is_unit(current_func_->return_type)) {
        emit_line("return 0;");
    } else {
        emit_line("return;");
    }
}

} // namespace a2c::codegen
