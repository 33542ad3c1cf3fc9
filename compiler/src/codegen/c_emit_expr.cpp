//! # C Emitter - Expressions
//!
//! Expressions are rendered to C expression text. Constructs that need
//! statements (`if`, `match`, blocks) are hoisted into a fresh temporary
//! first, and the temporary's name is the expression's text.

#include "codegen/c_emitter.hpp"

#include "codegen/c_types.hpp"

#include <climits>

namespace a2c::codegen {

namespace {

/// Binding strength of a binary operator, following C.
auto precedence(tree::BinOp op) -> int {
    switch (op) {
    case tree::BinOp::Mul:
    case tree::BinOp::Div:
    case tree::BinOp::Mod:
        return 10;
    case tree::BinOp::Add:
    case tree::BinOp::Sub:
        return 9;
    case tree::BinOp::Shl:
    case tree::BinOp::Shr:
        return 8;
    case tree::BinOp::Lt:
    case tree::BinOp::Le:
    case tree::BinOp::Gt:
    case tree::BinOp::Ge:
        return 7;
    case tree::BinOp::Eq:
    case tree::BinOp::Ne:
        return 6;
    case tree::BinOp::BitAnd:
        return 5;
    case tree::BinOp::BitXor:
        return 4;
    case tree::BinOp::BitOr:
        return 3;
    case tree::BinOp::And:
        return 2;
    case tree::BinOp::Or:
        return 1;
    }
    return 0;
}

auto takes_address(const tree::ParamDecl& param) -> bool {
    return param.passing && *param.passing != tree::PassingMode::Copy &&
           !param.type->is<types::IndirectType>();
}

auto is_primitive(const types::TypePtr& type, types::PrimitiveKind kind) -> bool {
    return type && type->is<types::PrimitiveType>() &&
           type->as<types::PrimitiveType>().kind == kind;
}

/// Operands that need parentheses before `.`, `->`, `[]` or a unary operator.
auto is_compound(const tree::Expr& expr) -> bool {
    return expr.is<tree::BinaryExpr>() || expr.is<tree::AssignExpr>() ||
           expr.is<tree::UnaryExpr>();
}

} // namespace

// ============================================================================
// Locals and Temporaries
// ============================================================================

void CEmitter::push_scope() {
    pointer_scopes_.emplace_back();
}

void CEmitter::pop_scope() {
    if (!pointer_scopes_.empty())
        pointer_scopes_.pop_back();
}

void CEmitter::declare_local(const std::string& name, bool is_pointer) {
    if (pointer_scopes_.empty())
        push_scope();
    pointer_scopes_.back()[name] = is_pointer;
}

auto CEmitter::is_pointer_var(const std::string& name) const -> bool {
    for (auto it = pointer_scopes_.rbegin(); it != pointer_scopes_.rend(); ++it) {
        auto found = it->find(name);
        if (found != it->end())
            return found->second;
    }
    return false;
}

auto CEmitter::new_temp() -> std::string {
    return "_t" + std::to_string(temp_counter_++);
}

auto CEmitter::hoists(const tree::Expr& expr) const -> bool {
    bool result = false;
    tree::for_each_expr(expr, [this, &result](const tree::Expr& e) {
        if (result)
            return;
        if (needs_statements(e)) {
            result = true;
            return;
        }
        if (!e.is<tree::CallExpr>())
            return;
        const auto& call = e.as<tree::CallExpr>();
        const auto* callee = index_.find_function(call.callee);
        if (!callee)
            return;
        for (size_t i = 0; i < call.args.size() && i < callee->params.size(); ++i) {
            if (takes_address(callee->params[i]) && !is_place(*call.args[i]))
                result = true;
        }
    });
    return result;
}

auto CEmitter::gen_hoisted(const tree::Expr& expr) -> std::string {
    const auto type = expr.type();
    if (types::is_unit(type) || expr.is<tree::ReturnExpr>() || expr.is<tree::BreakExpr>() ||
        expr.is<tree::ContinueExpr>()) {
        gen_value(expr, Sink::discard());
        return "";
    }
    auto temp = new_temp();
    emit_line(c_declare(type, temp) + ";");
    gen_value(expr, Sink::assign(temp));
    return temp;
}

// ============================================================================
// Expressions
// ============================================================================

auto CEmitter::gen_expr(const tree::Expr& expr) -> std::string {
    if (error_) {
        return "";
    }

    if (expr.is<tree::LiteralExpr>())
        return gen_literal(expr.as<tree::LiteralExpr>());
    if (expr.is<tree::VarExpr>())
        return gen_var(expr.as<tree::VarExpr>());
    if (expr.is<tree::FieldExpr>())
        return gen_field(expr.as<tree::FieldExpr>());
    if (expr.is<tree::IndexExpr>())
        return gen_index(expr.as<tree::IndexExpr>());
    if (expr.is<tree::BinaryExpr>())
        return gen_binary(expr.as<tree::BinaryExpr>());
    if (expr.is<tree::UnaryExpr>())
        return gen_unary(expr.as<tree::UnaryExpr>());
    if (expr.is<tree::CallExpr>())
        return gen_call(expr.as<tree::CallExpr>());
    if (expr.is<tree::AssignExpr>())
        return gen_assign(expr.as<tree::AssignExpr>());
    if (expr.is<tree::StructExpr>())
        return "(" + c_type(expr.type()) + ")" + gen_struct_init(expr.as<tree::StructExpr>());
    if (expr.is<tree::VariantExpr>())
        return "(" + c_type(expr.type()) + ")" + gen_variant_init(expr.as<tree::VariantExpr>());
    if (needs_statements(expr))
        return gen_hoisted(expr);

    // Field shorthand and method calls are removed by method lowering
    const auto what = expr.is<tree::SelfFieldExpr>() ? "field shorthand" : "method call";
    fail(diag::ErrorKind::Internal, current_func_ ? current_func_->name : "",
         std::string(what) + " reached emission", expr.span());
    return "";
}

auto CEmitter::gen_literal(const tree::LiteralExpr& lit) -> std::string {
    return std::visit(
        [&lit](const auto& value) -> std::string {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, int64_t>) {
                auto text = std::to_string(value);
                if (value > INT_MAX || value < INT_MIN) {
                    if (is_primitive(lit.type, types::PrimitiveKind::U64))
                        return text + "ULL";
                    return text + "LL";
                }
                return text;
            } else if constexpr (std::is_same_v<T, double>) {
                auto text = c_float_literal(value);
                return is_primitive(lit.type, types::PrimitiveKind::F32) ? text + "f" : text;
            } else if constexpr (std::is_same_v<T, bool>) {
                return value ? "true" : "false";
            } else if constexpr (std::is_same_v<T, char>) {
                return c_char_literal(value);
            } else {
                return c_string_literal(value);
            }
        },
        lit.value);
}

auto CEmitter::gen_var(const tree::VarExpr& var) -> std::string {
    if (is_pointer_var(var.name)) {
        return "(*" + var.name + ")";
    }
    return var.name;
}

auto CEmitter::gen_object(const tree::Expr& object) -> std::pair<std::string, bool> {
    if (object.is<tree::VarExpr>() && is_pointer_var(object.as<tree::VarExpr>().name)) {
        return {object.as<tree::VarExpr>().name, true};
    }
    const auto type = object.type();
    const bool pointer = type && (type->is<types::PtrType>() || type->is<types::IndirectType>());
    auto text = gen_expr(object);
    if (is_compound(object)) {
        text = "(" + text + ")";
    }
    return {text, pointer};
}

auto CEmitter::gen_field(const tree::FieldExpr& field) -> std::string {
    auto [base, pointer] = gen_object(*field.object);
    return base + (pointer ? "->" : ".") + field.field;
}

auto CEmitter::gen_index(const tree::IndexExpr& index) -> std::string {
    auto base = gen_expr(*index.object);
    if (is_compound(*index.object)) {
        base = "(" + base + ")";
    }
    return base + "[" + gen_expr(*index.index) + "]";
}

auto CEmitter::gen_binary(const tree::BinaryExpr& bin) -> std::string {
    if ((bin.op == tree::BinOp::And || bin.op == tree::BinOp::Or) && hoists(*bin.right)) {
        return gen_short_circuit(bin);
    }

    const int own = precedence(bin.op);
    auto operand = [this, own](const tree::Expr& child, bool right) {
        auto text = gen_expr(child);
        if (child.is<tree::BinaryExpr>()) {
            const int inner = precedence(child.as<tree::BinaryExpr>().op);
            if (inner < own || (right && inner == own))
                return "(" + text + ")";
        } else if (child.is<tree::AssignExpr>()) {
            return "(" + text + ")";
        }
        return text;
    };
    auto left = operand(*bin.left, false);
    auto right = operand(*bin.right, true);
    return left + " " + tree::binop_to_string(bin.op) + " " + right;
}

// The right operand's statements run only when the left side does not
// decide the result:
//
//   bool _t0 = left;
//   if (_t0) {        // `if (!_t0)` for ||
//       ...
//       _t0 = right;
//   }
auto CEmitter::gen_short_circuit(const tree::BinaryExpr& bin) -> std::string {
    auto left = gen_expr(*bin.left);
    if (error_)
        return "";
    auto temp = new_temp();
    emit_line(c_declare(types::make_bool(), temp) + " = " + left + ";");
    emit_line(std::string(bin.op == tree::BinOp::And ? "if (" : "if (!") + temp + ") {");
    push_indent();
    push_scope();
    gen_value(*bin.right, Sink::assign(temp));
    pop_scope();
    pop_indent();
    emit_line("}");
    return temp;
}

auto CEmitter::gen_unary(const tree::UnaryExpr& unary) -> std::string {
    const auto& operand = *unary.operand;
    if (unary.op == tree::UnaryOp::AddrOf && operand.is<tree::VarExpr>() &&
        is_pointer_var(operand.as<tree::VarExpr>().name)) {
        return operand.as<tree::VarExpr>().name;
    }

    auto text = gen_expr(operand);
    if (is_compound(operand) || (!text.empty() && text.front() == '-')) {
        text = "(" + text + ")";
    }
    return std::string(tree::unaryop_to_string(unary.op)) + text;
}

auto CEmitter::gen_ref_arg(const tree::Expr& arg) -> std::string {
    if (arg.is<tree::VarExpr>() && is_pointer_var(arg.as<tree::VarExpr>().name)) {
        return arg.as<tree::VarExpr>().name;
    }
    if (is_place(arg)) {
        return "&" + gen_expr(arg);
    }

    // Rvalue for a reference slot: materialize it first
    auto value = gen_init(arg);
    if (error_)
        return "";
    auto temp = new_temp();
    emit_line(c_declare(arg.type(), temp) + " = " + value + ";");
    return "&" + temp;
}

auto CEmitter::gen_call(const tree::CallExpr& call) -> std::string {
    // Unknown callees are external; their arguments are passed by value.
    const auto* callee = index_.find_function(call.callee);

    std::string args;
    for (size_t i = 0; i < call.args.size(); ++i) {
        const auto& arg = *call.args[i];
        const bool by_address = callee && i < callee->params.size() &&
                                takes_address(callee->params[i]);
        if (!args.empty())
            args += ", ";
        args += by_address ? gen_ref_arg(arg) : gen_expr(arg);
    }
    return call.callee + "(" + args + ")";
}

auto CEmitter::gen_assign(const tree::AssignExpr& assign) -> std::string {
    auto target = gen_expr(*assign.target);
    auto value = gen_expr(*assign.value);
    if (assign.op) {
        return target + " " + tree::binop_to_string(*assign.op) + "= " + value;
    }
    return target + " = " + value;
}

auto CEmitter::gen_struct_init(const tree::StructExpr& init) -> std::string {
    if (init.fields.empty()) {
        return "{0}";
    }
    std::string text = "{";
    for (size_t i = 0; i < init.fields.size(); ++i) {
        if (i > 0)
            text += ", ";
        text += "." + init.fields[i].name + " = " + gen_expr(*init.fields[i].value);
    }
    return text + "}";
}

auto CEmitter::gen_variant_init(const tree::VariantExpr& init) -> std::string {
    const auto* tag = layouts_.tag_of(init.type);
    const auto type_name = types::type_to_string(init.type);
    if (!tag) {
        fail(diag::ErrorKind::MalformedTree, type_name,
             "variant '" + init.variant + "' of '" + type_name + "', which is not a tag",
             init.span);
        return "";
    }
    const auto* variant = tag->find_variant(init.variant);
    if (!variant) {
        fail(diag::ErrorKind::MalformedTree, tag->tag_name,
             "'" + tag->tag_name + "' has no variant '" + init.variant + "'", init.span);
        return "";
    }
    if (init.args.size() != variant->fields.size()) {
        fail(diag::ErrorKind::MalformedTree, tag->tag_name,
             "variant '" + init.variant + "' takes " + std::to_string(variant->fields.size()) +
                 " value(s), got " + std::to_string(init.args.size()),
             init.span);
        return "";
    }

    std::string text = "{.tag = " + variant->constant;
    for (size_t i = 0; i < init.args.size(); ++i) {
        text += ", ." + variant->access_path(i) + " = " + gen_expr(*init.args[i]);
    }
    return text + "}";
}

auto CEmitter::gen_init(const tree::Expr& expr) -> std::string {
    if (expr.is<tree::StructExpr>())
        return gen_struct_init(expr.as<tree::StructExpr>());
    if (expr.is<tree::VariantExpr>())
        return gen_variant_init(expr.as<tree::VariantExpr>());
    return gen_expr(expr);
}

} // namespace a2c::codegen
