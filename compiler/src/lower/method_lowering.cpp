#include "lower/method_lowering.hpp"

#include "log/log.hpp"
#include "ownership/classifier.hpp"

namespace a2c::lower {

using diag::ErrorKind;

auto MethodLowering::register_types() -> Result<Unit, diag::Diagnostic> {
    for (const auto& decl : module_.types) {
        auto added = symbols_.add(EmittedSymbol{decl.name, SymbolKind::Type, decl.name, ""},
                                  decl.span);
        if (is_err(added))
            return added;

        const auto* tag = decl.is_tag ? layouts_.find_tag(decl.name) : nullptr;
        if (!tag)
            continue;
        added = symbols_.add(EmittedSymbol{tag->enum_name, SymbolKind::TagEnum, decl.name, ""},
                             decl.span);
        if (is_err(added))
            return added;
        for (const auto& variant : tag->variants) {
            added = symbols_.add(
                EmittedSymbol{variant.constant, SymbolKind::EnumConstant,
                              decl.name + "." + variant.name, ""},
                decl.span);
            if (is_err(added))
                return added;
        }
    }
    return Unit{};
}

auto MethodLowering::register_function(const tree::FuncDecl& func)
    -> Result<Unit, diag::Diagnostic> {
    auto kind = func.is_stub() ? SymbolKind::ExternFunction : SymbolKind::Function;
    auto owner = func.owner_type.empty() ? func.name : func.owner_type;
    return symbols_.add(EmittedSymbol{func.name, kind, std::move(owner), ""}, func.span);
}

auto MethodLowering::lower_method(const tree::TypeDecl& owner, tree::MethodDecl& method)
    -> tree::FuncDecl {
    tree::FuncDecl func;
    func.name = tree::lowered_method_name(owner.name, method.name);
    func.owner_type = owner.name;
    if (owner.is_instance()) {
        func.generic_origin = owner.generic_origin + "." + method.name;
    }

    if (method.kind == tree::MethodKind::Instance) {
        tree::ParamDecl self;
        self.name = "self";
        self.type = types::make_named(owner.name);
        self.intent = method.mutates_receiver ? tree::ParamIntent::Mutate : tree::ParamIntent::Read;
        self.passing = method.receiver_passing;
        self.span = method.span;
        func.params.push_back(std::move(self));
    }
    for (auto& param : method.params) {
        func.params.push_back(std::move(param));
    }

    func.return_type = method.return_type;
    func.return_passing = method.return_passing;
    func.body = std::move(method.body);
    func.is_lowlevel = method.is_lowlevel;
    func.only_for = method.only_for;
    func.span = method.span;
    return func;
}

auto MethodLowering::rewrite_body(tree::Expr& body, const std::string& owner)
    -> Result<Unit, diag::Diagnostic> {
    std::optional<diag::Diagnostic> error;

    tree::for_each_expr_mut(body, [&](tree::Expr& expr) {
        if (error)
            return;

        if (expr.is<tree::SelfFieldExpr>()) {
            auto& field = expr.as<tree::SelfFieldExpr>();
            if (owner.empty()) {
                error = diag::make_diagnostic(ErrorKind::MalformedTree, module_.name, field.field,
                                              "field shorthand '." + field.field +
                                                  "' outside a method",
                                              field.span);
                return;
            }
            auto self = tree::make_var("self", types::make_named(owner), field.span);
            expr.kind = tree::FieldExpr{std::move(self), field.field, field.type, field.span};
            return;
        }

        if (!expr.is<tree::MethodCallExpr>())
            return;

        auto call = std::move(expr.as<tree::MethodCallExpr>());
        auto type_name = layout::record_name(call.owner);
        if (!type_name) {
            error = diag::make_diagnostic(ErrorKind::MalformedTree, module_.name, call.method,
                                          "method '" + call.method + "' called on '" +
                                              types::type_to_string(call.owner) +
                                              "', which is not a record",
                                          call.span);
            return;
        }
        const auto* local = module_.find_type(*type_name);
        if (local && !local->find_method(call.method)) {
            error = diag::make_diagnostic(ErrorKind::MalformedTree, module_.name, *type_name,
                                          "'" + *type_name + "' has no method '" + call.method +
                                              "'",
                                          call.span);
            return;
        }

        std::vector<tree::ExprPtr> args;
        args.reserve(call.args.size() + 1);
        if (call.receiver) {
            args.push_back(std::move(call.receiver));
        }
        for (auto& arg : call.args) {
            args.push_back(std::move(arg));
        }
        expr.kind = tree::CallExpr{tree::lowered_method_name(*type_name, call.method),
                                   {},
                                   std::move(args),
                                   call.type,
                                   call.span};
    });

    if (error) {
        return *error;
    }
    return Unit{};
}

auto MethodLowering::run() -> Result<Unit, diag::Diagnostic> {
    auto classified = ownership::verify_classified(module_);
    if (is_err(classified)) {
        return classified;
    }

    A2C_LOG_DEBUG("lower", "Lowering methods of " << module_.name);

    auto registered = register_types();
    if (is_err(registered)) {
        return registered;
    }

    std::vector<tree::FuncDecl> functions;
    for (auto& decl : module_.types) {
        for (auto& method : decl.methods) {
            functions.push_back(lower_method(decl, method));
        }
    }
    const size_t lowered_methods = functions.size();
    for (auto& func : module_.functions) {
        functions.push_back(std::move(func));
    }

    // Bodies are rewritten while types still own their method lists.
    for (auto& func : functions) {
        if (!func.body)
            continue;
        auto rewritten = rewrite_body(*func.body, func.owner_type);
        if (is_err(rewritten))
            return rewritten;
    }
    for (const auto& func : functions) {
        auto added = register_function(func);
        if (is_err(added))
            return added;
    }

    for (auto& decl : module_.types) {
        decl.methods.clear();
    }
    module_.functions = std::move(functions);

    A2C_LOG_DEBUG("lower", module_.name << ": " << lowered_methods << " methods lowered, "
                                        << symbols_.size() << " symbols");
    return Unit{};
}

} // namespace a2c::lower
