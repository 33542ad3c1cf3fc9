#include "tree/tree_decl.hpp"

#include "tree/tree_module.hpp"

namespace a2c::tree {

auto scenario_name(Scenario scenario) -> const char* {
    switch (scenario) {
    case Scenario::Interp:
        return "vm";
    case Scenario::TransC:
        return "c";
    case Scenario::TransRust:
        return "rust";
    }
    return "?";
}

auto lowered_method_name(const std::string& type_name, const std::string& method)
    -> std::string {
    return type_name + "_" + method;
}

auto passing_mode_name(PassingMode mode) -> const char* {
    switch (mode) {
    case PassingMode::Copy:
        return "Copy";
    case PassingMode::RefImmutable:
        return "RefImmutable";
    case PassingMode::RefMutable:
        return "RefMutable";
    case PassingMode::Pointer:
        return "Pointer";
    }
    return "?";
}

auto param_intent_name(ParamIntent intent) -> const char* {
    switch (intent) {
    case ParamIntent::Read:
        return "read";
    case ParamIntent::Mutate:
        return "mutate";
    case ParamIntent::Transfer:
        return "transfer";
    case ParamIntent::AddressOf:
        return "address-of";
    }
    return "?";
}

// ============================================================================
// TypeDecl lookups
// ============================================================================

auto TypeDecl::find_field(const std::string& field) const -> const FieldDecl* {
    for (const auto& f : fields) {
        if (f.name == field)
            return &f;
    }
    return nullptr;
}

auto TypeDecl::find_variant(const std::string& variant) const -> const VariantDecl* {
    for (const auto& v : variants) {
        if (v.name == variant)
            return &v;
    }
    return nullptr;
}

auto TypeDecl::find_method(const std::string& method) const -> const MethodDecl* {
    for (const auto& m : methods) {
        if (m.name == method)
            return &m;
    }
    return nullptr;
}

auto TypeDecl::find_method(const std::string& method) -> MethodDecl* {
    for (auto& m : methods) {
        if (m.name == method)
            return &m;
    }
    return nullptr;
}

// ============================================================================
// Builders
// ============================================================================

auto make_field_decl(std::string name, TypePtr type, Visibility vis) -> FieldDecl {
    FieldDecl field;
    field.name = std::move(name);
    field.type = std::move(type);
    field.vis = vis;
    return field;
}

auto make_param(std::string name, TypePtr type, ParamIntent intent) -> ParamDecl {
    ParamDecl param;
    param.name = std::move(name);
    param.type = std::move(type);
    param.intent = intent;
    return param;
}

auto make_variant_decl(std::string name, std::vector<FieldDecl> fields,
                       std::optional<int64_t> discriminant) -> VariantDecl {
    VariantDecl variant;
    variant.name = std::move(name);
    variant.fields = std::move(fields);
    variant.discriminant = discriminant;
    return variant;
}

auto make_record(std::string name, std::vector<FieldDecl> fields,
                 std::vector<std::string> generic_params) -> TypeDecl {
    TypeDecl decl;
    decl.name = std::move(name);
    decl.fields = std::move(fields);
    decl.generic_params = std::move(generic_params);
    return decl;
}

auto make_tag(std::string name, std::vector<VariantDecl> variants,
              std::vector<std::string> generic_params) -> TypeDecl {
    TypeDecl decl;
    decl.name = std::move(name);
    decl.variants = std::move(variants);
    decl.generic_params = std::move(generic_params);
    decl.is_tag = true;
    return decl;
}

auto make_opaque(std::string name) -> TypeDecl {
    TypeDecl decl;
    decl.name = std::move(name);
    decl.is_opaque = true;
    return decl;
}

auto make_function(std::string name, std::vector<ParamDecl> params, TypePtr return_type,
                   ExprPtr body, std::vector<std::string> generic_params) -> FuncDecl {
    FuncDecl func;
    func.name = std::move(name);
    func.params = std::move(params);
    func.return_type = return_type ? std::move(return_type) : types::make_unit();
    func.body = std::move(body);
    func.generic_params = std::move(generic_params);
    return func;
}

auto make_method(std::string name, std::vector<ParamDecl> params, TypePtr return_type,
                 ExprPtr body, bool mutates_receiver) -> MethodDecl {
    MethodDecl method;
    method.name = std::move(name);
    method.kind = MethodKind::Instance;
    method.params = std::move(params);
    method.return_type = return_type ? std::move(return_type) : types::make_unit();
    method.body = std::move(body);
    method.mutates_receiver = mutates_receiver;
    return method;
}

auto make_static_method(std::string name, std::vector<ParamDecl> params, TypePtr return_type,
                        ExprPtr body) -> MethodDecl {
    auto method = make_method(std::move(name), std::move(params), std::move(return_type),
                              std::move(body), false);
    method.kind = MethodKind::Static;
    return method;
}

// ============================================================================
// Module lookups
// ============================================================================

namespace {

template <typename Decl> auto find_by_name(std::vector<Decl>& decls, const std::string& name)
    -> Decl* {
    for (auto& decl : decls) {
        if (decl.name == name)
            return &decl;
    }
    return nullptr;
}

template <typename Decl>
auto find_by_name(const std::vector<Decl>& decls, const std::string& name) -> const Decl* {
    for (const auto& decl : decls) {
        if (decl.name == name)
            return &decl;
    }
    return nullptr;
}

} // namespace

auto ModuleUnit::find_type(const std::string& type_name) const -> const TypeDecl* {
    return find_by_name(types, type_name);
}

auto ModuleUnit::find_function(const std::string& func_name) const -> const FuncDecl* {
    return find_by_name(functions, func_name);
}

auto LoweredModule::find_type(const std::string& type_name) const -> const TypeDecl* {
    return find_by_name(types, type_name);
}

auto LoweredModule::find_type(const std::string& type_name) -> TypeDecl* {
    return find_by_name(types, type_name);
}

auto LoweredModule::find_function(const std::string& func_name) const -> const FuncDecl* {
    return find_by_name(functions, func_name);
}

auto DeclIndex::find_type(const std::string& type_name) const -> const TypeDecl* {
    if (const auto* decl = local_.find_type(type_name)) {
        return decl;
    }
    for (const auto* imported : imports_) {
        if (const auto* decl = imported->find_type(type_name)) {
            return decl;
        }
    }
    return nullptr;
}

auto DeclIndex::find_function(const std::string& func_name) const -> const FuncDecl* {
    if (const auto* func = local_.find_function(func_name)) {
        return func;
    }
    for (const auto* imported : imports_) {
        if (const auto* func = imported->find_function(func_name)) {
            return func;
        }
    }
    return nullptr;
}

} // namespace a2c::tree
