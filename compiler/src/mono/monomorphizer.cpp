//! # Monomorphizer Implementation
//!
//! Declarations are first copied with their generic parameters substituted,
//! then resolved: every applied generic type is requested as an instance and
//! replaced by a plain reference to the instance name, and every call of a
//! generic function is redirected to its instance. Requests made while an
//! instance is being built nest; `in_progress_` holds the names of the
//! instances on that nesting path.

#include "mono/monomorphizer.hpp"

#include "log/log.hpp"

namespace a2c::mono {

using diag::ErrorKind;
using types::TypePtr;

namespace {

auto substitution_mapper(std::unordered_map<std::string, TypePtr> subs) -> tree::TypeMapper {
    return [subs = std::move(subs)](const TypePtr& type) {
        return types::substitute_type(type, subs);
    };
}

/// True if `type` refers to the named type anywhere inside it.
auto mentions(const TypePtr& type, const std::string& name) -> bool {
    if (!type)
        return false;
    if (type->is<types::NamedType>()) {
        const auto& named = type->as<types::NamedType>();
        if (named.name == name)
            return true;
        for (const auto& arg : named.type_args) {
            if (mentions(arg, name))
                return true;
        }
        return false;
    }
    if (type->is<types::PtrType>())
        return mentions(type->as<types::PtrType>().inner, name);
    if (type->is<types::ArrayType>())
        return mentions(type->as<types::ArrayType>().element, name);
    if (type->is<types::IndirectType>())
        return mentions(type->as<types::IndirectType>().inner, name);
    return false;
}

/// The record a field stores inline, looking through arrays.
auto embedded_name(TypePtr type) -> std::optional<std::string> {
    while (type && type->is<types::ArrayType>()) {
        type = type->as<types::ArrayType>().element;
    }
    if (type && type->is<types::NamedType>()) {
        return type->as<types::NamedType>().name;
    }
    return std::nullopt;
}

auto span_or(const SourceSpan& preferred, const SourceSpan& fallback) -> const SourceSpan& {
    return preferred.is_known() ? preferred : fallback;
}

} // namespace

Monomorphizer::Monomorphizer(const tree::ModuleUnit& unit, InstantiationRegistry& registry,
                             std::vector<const tree::ModuleUnit*> imports)
    : unit_(unit), registry_(registry), imports_(std::move(imports)) {
    for (const auto& decl : unit_.types) {
        if (!decl.is_generic())
            plain_names_.insert(decl.name);
    }
    for (const auto& func : unit_.functions) {
        if (!func.is_generic())
            plain_names_.insert(func.name);
    }
}

void Monomorphizer::fail(diag::Diagnostic diagnostic) {
    if (!error_) {
        A2C_LOG_DEBUG("mono", "Failed: " << diag::summarize(diagnostic));
        error_ = std::move(diagnostic);
    }
}

auto Monomorphizer::find_generic_type(const std::string& name) const -> const tree::TypeDecl* {
    if (const auto* local = unit_.find_type(name)) {
        return local->is_generic() ? local : nullptr;
    }
    for (const auto* imported : imports_) {
        const auto* decl = imported->find_type(name);
        if (decl && decl->is_generic())
            return decl;
    }
    return nullptr;
}

auto Monomorphizer::find_generic_function(const std::string& name) const
    -> const tree::FuncDecl* {
    if (const auto* local = unit_.find_function(name)) {
        return local->is_generic() ? local : nullptr;
    }
    for (const auto* imported : imports_) {
        const auto* func = imported->find_function(name);
        if (func && func->is_generic())
            return func;
    }
    return nullptr;
}

// ============================================================================
// Driver
// ============================================================================

auto Monomorphizer::run() -> Result<tree::LoweredModule, diag::Diagnostic> {
    A2C_LOG_DEBUG("mono", "Monomorphizing " << unit_.name);

    tree::LoweredModule module;
    module.name = unit_.name;
    module.imports = unit_.imports;

    auto keep = tree::keep_types();
    for (const auto& decl : unit_.types) {
        if (decl.is_generic())
            continue;
        auto copy = tree::clone_type_decl(decl, keep);
        resolve_type_decl(copy);
        if (error_)
            return *error_;
        module.types.push_back(std::move(copy));
    }

    for (const auto& func : unit_.functions) {
        if (func.is_generic())
            continue;
        auto copy = tree::clone_function(func, keep);
        resolve_function(copy);
        if (error_)
            return *error_;
        module.functions.push_back(std::move(copy));
    }

    for (auto& inst : instance_types_) {
        module.types.push_back(std::move(inst));
    }
    for (auto& inst : instance_functions_) {
        module.functions.push_back(std::move(inst));
    }
    instance_types_.clear();
    instance_functions_.clear();

    A2C_LOG_DEBUG("mono", "Module " << unit_.name << ": " << entries_.size()
                                    << " instantiations, " << module.types.size() << " types, "
                                    << module.functions.size() << " functions");
    return module;
}

// ============================================================================
// Resolution
// ============================================================================

auto Monomorphizer::resolve(const TypePtr& type, const SourceSpan& span) -> TypePtr {
    if (!type || error_)
        return type;

    if (type->is<types::GenericType>()) {
        const auto& param = type->as<types::GenericType>().name;
        fail(diag::make_diagnostic(ErrorKind::UnresolvedGeneric, unit_.name, param,
                                   "generic parameter '" + param + "' is not bound here", span));
        return type;
    }

    if (type->is<types::PtrType>()) {
        const auto& ptr = type->as<types::PtrType>();
        return types::make_ptr(resolve(ptr.inner, span), ptr.is_mut);
    }
    if (type->is<types::ArrayType>()) {
        const auto& arr = type->as<types::ArrayType>();
        return types::make_array(resolve(arr.element, span), arr.size);
    }
    if (type->is<types::IndirectType>()) {
        return types::make_indirect(resolve(type->as<types::IndirectType>().inner, span));
    }
    if (!type->is<types::NamedType>()) {
        return type;
    }

    const auto& named = type->as<types::NamedType>();
    const auto* generic = find_generic_type(named.name);

    if (named.type_args.empty()) {
        if (generic) {
            fail(diag::make_diagnostic(
                ErrorKind::UnresolvedGeneric, unit_.name, named.name,
                "generic type '" + named.name + "' is used without type arguments (expects " +
                    std::to_string(generic->generic_params.size()) + ")",
                span));
        }
        return type;
    }

    if (!generic) {
        fail(diag::make_diagnostic(ErrorKind::MalformedTree, unit_.name, named.name,
                                   "type arguments applied to non-generic type '" + named.name +
                                       "'",
                                   span));
        return type;
    }
    if (named.type_args.size() != generic->generic_params.size()) {
        fail(diag::make_diagnostic(
            ErrorKind::UnresolvedGeneric, unit_.name, named.name,
            "'" + named.name + "' expects " + std::to_string(generic->generic_params.size()) +
                " type argument(s), got " + std::to_string(named.type_args.size()),
            span));
        return type;
    }

    std::vector<TypePtr> args;
    args.reserve(named.type_args.size());
    for (const auto& arg : named.type_args) {
        args.push_back(resolve(arg, span));
    }
    if (error_)
        return type;

    return types::make_named(request_type(*generic, std::move(args), span));
}

void Monomorphizer::resolve_params(std::vector<tree::ParamDecl>& params, const SourceSpan& span) {
    for (auto& param : params) {
        param.type = resolve(param.type, span_or(param.span, span));
    }
}

void Monomorphizer::resolve_type_decl(tree::TypeDecl& decl) {
    for (auto& field : decl.fields) {
        field.type = resolve(field.type, span_or(field.span, decl.span));
    }
    for (auto& variant : decl.variants) {
        for (auto& field : variant.fields) {
            field.type = resolve(field.type, span_or(field.span, variant.span));
        }
    }
    for (auto& method : decl.methods) {
        resolve_params(method.params, method.span);
        method.return_type = resolve(method.return_type, method.span);
        if (method.body)
            resolve_body(*method.body);
    }
}

void Monomorphizer::resolve_function(tree::FuncDecl& func) {
    resolve_params(func.params, func.span);
    func.return_type = resolve(func.return_type, func.span);
    if (func.body)
        resolve_body(*func.body);
}

void Monomorphizer::resolve_body(tree::Expr& body) {
    tree::for_each_expr_mut(body, [this](tree::Expr& expr) {
        if (error_)
            return;
        auto span = expr.span();
        auto& slot = expr.type_slot();
        slot = resolve(slot, span);

        if (expr.is<tree::MethodCallExpr>()) {
            auto& call = expr.as<tree::MethodCallExpr>();
            call.owner = resolve(call.owner, span);
        } else if (expr.is<tree::BlockExpr>()) {
            for (auto& stmt : expr.as<tree::BlockExpr>().stmts) {
                if (stmt->is<tree::LetStmt>()) {
                    auto& let = stmt->as<tree::LetStmt>();
                    let.type = resolve(let.type, span_or(let.span, span));
                }
            }
        } else if (expr.is<tree::CallExpr>()) {
            auto& call = expr.as<tree::CallExpr>();
            for (auto& arg : call.type_args) {
                arg = resolve(arg, span);
            }
            if (error_)
                return;

            const auto* generic = find_generic_function(call.callee);
            if (!generic) {
                if (!call.type_args.empty()) {
                    fail(diag::make_diagnostic(ErrorKind::MalformedTree, unit_.name, call.callee,
                                               "type arguments applied to non-generic function '" +
                                                   call.callee + "'",
                                               span));
                }
                return;
            }
            if (call.type_args.size() != generic->generic_params.size()) {
                fail(diag::make_diagnostic(
                    ErrorKind::UnresolvedGeneric, unit_.name, call.callee,
                    "'" + call.callee + "' expects " +
                        std::to_string(generic->generic_params.size()) +
                        " type argument(s), got " + std::to_string(call.type_args.size()),
                    span));
                return;
            }
            call.callee = request_function(*generic, std::move(call.type_args), span);
            call.type_args.clear();
        }
    });
}

// ============================================================================
// Instance Requests
// ============================================================================

auto Monomorphizer::begin_instance(const InstantiationKey& key, InstanceKind kind,
                                   const std::vector<TypePtr>& args, const SourceSpan& span)
    -> std::pair<std::string, bool> {
    auto it = table_.find(key);
    if (it != table_.end()) {
        return {entries_[it->second].name, false};
    }

    // An instance that asks for a bigger instance of its own generic would
    // never stop growing.
    for (const auto& entry : entries_) {
        if (entry.complete || entry.key.base != key.base)
            continue;
        for (const auto& arg : args) {
            if (mentions(arg, entry.name)) {
                fail(diag::make_diagnostic(ErrorKind::CyclicInstantiation, unit_.name,
                                           key_to_string(key),
                                           "instantiating " + key_to_string(entry.key) +
                                               " requires " + key_to_string(key) +
                                               ", which grows without bound",
                                           span));
                return {"", false};
            }
        }
    }

    if (depth_ >= MAX_INSTANTIATION_DEPTH) {
        fail(diag::make_diagnostic(ErrorKind::CyclicInstantiation, unit_.name, key_to_string(key),
                                   "instantiation nesting exceeds " +
                                       std::to_string(MAX_INSTANTIATION_DEPTH) + " levels at " +
                                       key_to_string(key),
                                   span));
        return {"", false};
    }

    auto interned = registry_.intern(key, unit_.name);
    if (is_err(interned)) {
        auto diagnostic = unwrap_err(interned);
        diagnostic.span = span.is_known() ? std::optional<SourceSpan>(span) : std::nullopt;
        fail(std::move(diagnostic));
        return {"", false};
    }
    auto name = unwrap(interned);

    if (plain_names_.count(name) > 0) {
        fail(diag::make_diagnostic(ErrorKind::SymbolCollision, unit_.name, name,
                                   "instance " + key_to_string(key) + " is named '" + name +
                                       "', which is already declared in the module",
                                   span));
        return {"", false};
    }

    table_.emplace(key, entries_.size());
    entries_.push_back(GenericInstantiation{key, name, kind, false});
    in_progress_.insert(name);
    ++depth_;
    return {name, true};
}

void Monomorphizer::finish_instance(const InstantiationKey& key, const std::string& name) {
    entries_[table_.at(key)].complete = true;
    in_progress_.erase(name);
    --depth_;
}

auto Monomorphizer::request_type(const tree::TypeDecl& generic, std::vector<TypePtr> args,
                                 const SourceSpan& span) -> std::string {
    InstantiationKey key{generic.name, {}};
    for (const auto& arg : args) {
        key.args.push_back(type_arg_code(arg));
    }

    auto [name, build] = begin_instance(key, InstanceKind::Type, args, span);
    if (!build || error_)
        return name;

    A2C_LOG_DEBUG("mono", "Instantiating type " << key_to_string(key) << " as " << name);

    Substitution subs;
    for (size_t i = 0; i < args.size(); ++i) {
        subs[generic.generic_params[i]] = args[i];
    }

    auto instance = tree::clone_type_decl(generic, substitution_mapper(std::move(subs)));
    instance.name = name;
    instance.generic_params.clear();
    instance.generic_origin = key_to_string(key);

    resolve_type_decl(instance);
    if (!error_)
        check_embedding(instance);
    if (error_)
        return name;

    finish_instance(key, name);
    instance_types_.push_back(std::move(instance));
    return name;
}

auto Monomorphizer::request_function(const tree::FuncDecl& generic, std::vector<TypePtr> args,
                                     const SourceSpan& span) -> std::string {
    InstantiationKey key{generic.name, {}};
    for (const auto& arg : args) {
        key.args.push_back(type_arg_code(arg));
    }

    auto [name, build] = begin_instance(key, InstanceKind::Function, args, span);
    if (!build || error_)
        return name;

    A2C_LOG_DEBUG("mono", "Instantiating function " << key_to_string(key) << " as " << name);

    Substitution subs;
    for (size_t i = 0; i < args.size(); ++i) {
        subs[generic.generic_params[i]] = args[i];
    }

    auto instance = tree::clone_function(generic, substitution_mapper(std::move(subs)));
    instance.name = name;
    instance.generic_params.clear();
    instance.generic_origin = key_to_string(key);

    resolve_function(instance);
    if (error_)
        return name;

    finish_instance(key, name);
    instance_functions_.push_back(std::move(instance));
    return name;
}

void Monomorphizer::check_embedding(const tree::TypeDecl& instance) {
    auto check = [this, &instance](const tree::FieldDecl& field) {
        auto embedded = embedded_name(field.type);
        if (!embedded || in_progress_.count(*embedded) == 0)
            return;
        fail(diag::make_diagnostic(
            ErrorKind::CyclicInstantiation, unit_.name, instance.name,
            "'" + instance.name + "' (" + instance.generic_origin + ") contains '" + *embedded +
                "' by value through field '" + field.name + "'",
            span_or(field.span, instance.span)));
    };

    for (const auto& field : instance.fields) {
        check(field);
    }
    for (const auto& variant : instance.variants) {
        for (const auto& field : variant.fields) {
            check(field);
        }
    }
}

} // namespace a2c::mono
