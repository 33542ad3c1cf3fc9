//! # C Emitter - Module Level
//!
//! Header layout, type definitions, prototypes and function framing.
//! Statement lowering lives in `c_emit_stmt.cpp`, expressions in
//! `c_emit_expr.cpp`.

#include "codegen/c_emitter.hpp"

#include "codegen/c_types.hpp"
#include "log/log.hpp"

#include <functional>
#include <set>

namespace a2c::codegen {

CEmitter::CEmitter(const tree::LoweredModule& module, const tree::DeclIndex& index,
                   const layout::LayoutTable& layouts, lower::SymbolTable& symbols,
                   EmitOptions options)
    : module_(module), index_(index), layouts_(layouts), symbols_(symbols),
      options_(std::move(options)) {}

// ============================================================================
// Output Helpers
// ============================================================================

void CEmitter::emit_line(const std::string& code) {
    out_ << indent() << code << "\n";
}

void CEmitter::push_indent() {
    ++indent_level_;
}

void CEmitter::pop_indent() {
    if (indent_level_ > 0)
        --indent_level_;
}

auto CEmitter::indent() const -> std::string {
    return std::string(static_cast<size_t>(indent_level_ * options_.indent_width), ' ');
}

void CEmitter::fail(diag::ErrorKind kind, const std::string& symbol, std::string message,
                    const SourceSpan& span) {
    if (!error_) {
        error_ = diag::make_diagnostic(kind, module_.name, symbol, std::move(message), span);
    }
}

auto CEmitter::guard_name() const -> std::string {
    auto prefix = options_.guard_prefix.empty() ? std::string("A2C") : options_.guard_prefix;
    return c_macro_name(prefix + "_" + module_.name + "_H");
}

auto CEmitter::is_main(const tree::FuncDecl& func) const -> bool {
    return func.name == "main" && func.owner_type.empty();
}

// ============================================================================
// Types
// ============================================================================

namespace {

/// Records reached through `*T` or `ref T` anywhere inside `type`.
void collect_pointees(const types::TypePtr& type, std::vector<std::string>& names) {
    if (!type)
        return;
    if (type->is<types::PtrType>() || type->is<types::IndirectType>()) {
        const auto& inner = type->is<types::PtrType>() ? type->as<types::PtrType>().inner
                                                       : type->as<types::IndirectType>().inner;
        if (inner && inner->is<types::NamedType>()) {
            names.push_back(inner->as<types::NamedType>().name);
        } else {
            collect_pointees(inner, names);
        }
    } else if (type->is<types::ArrayType>()) {
        collect_pointees(type->as<types::ArrayType>().element, names);
    }
}

auto strip_arrays(types::TypePtr type) -> types::TypePtr {
    while (type && type->is<types::ArrayType>()) {
        type = type->as<types::ArrayType>().element;
    }
    return type;
}

auto is_reference(const tree::ParamDecl& param) -> bool {
    return param.passing && *param.passing != tree::PassingMode::Copy;
}

} // namespace

auto CEmitter::type_order() const -> std::vector<const tree::TypeDecl*> {
    std::vector<const tree::TypeDecl*> order;
    std::set<std::string> placed;

    std::function<void(const tree::TypeDecl&)> place = [&](const tree::TypeDecl& decl) {
        if (!placed.insert(decl.name).second)
            return;
        auto depend_on = [&](const types::TypePtr& type) {
            auto t = strip_arrays(type);
            if (t && t->is<types::NamedType>()) {
                if (const auto* dep = module_.find_type(t->as<types::NamedType>().name))
                    place(*dep);
            }
        };
        for (const auto& field : decl.fields) {
            depend_on(field.type);
        }
        for (const auto& variant : decl.variants) {
            for (const auto& field : variant.fields) {
                depend_on(field.type);
            }
        }
        order.push_back(&decl);
    };

    for (const auto& decl : module_.types) {
        place(decl);
    }
    return order;
}

auto CEmitter::gen_forward_decls() -> std::string {
    std::vector<std::string> names;
    for (const auto& decl : module_.types) {
        if (decl.is_opaque)
            names.push_back(decl.name);
        for (const auto& field : decl.fields) {
            collect_pointees(field.type, names);
        }
        for (const auto& variant : decl.variants) {
            for (const auto& field : variant.fields) {
                collect_pointees(field.type, names);
            }
        }
    }
    for (const auto& func : module_.functions) {
        for (const auto& param : func.params) {
            collect_pointees(param.type, names);
        }
        collect_pointees(func.return_type, names);
    }

    std::ostringstream os;
    std::set<std::string> seen;
    for (const auto& name : names) {
        if (seen.insert(name).second) {
            os << "struct " << name << ";\n";
        }
    }
    return os.str();
}

auto CEmitter::gen_record(const tree::TypeDecl& decl) -> std::string {
    const auto pad = std::string(static_cast<size_t>(options_.indent_width), ' ');
    std::ostringstream os;
    os << "struct " << decl.name << " {\n";
    if (decl.fields.empty()) {
        os << pad << "char _placeholder;\n";
    }
    for (const auto& field : decl.fields) {
        os << pad << c_declare(field.type, field.name) << ";\n";
    }
    os << "};\n";
    return os.str();
}

auto CEmitter::gen_tag(const tree::TypeDecl& decl, const layout::TagLayout& tag) -> std::string {
    const auto pad = std::string(static_cast<size_t>(options_.indent_width), ' ');
    std::ostringstream os;

    os << "enum " << tag.enum_name << " {\n";
    for (const auto& variant : tag.variants) {
        os << pad << variant.constant << " = " << variant.discriminant << ",\n";
        symbols_.set_decl_text(variant.constant,
                               variant.constant + " = " + std::to_string(variant.discriminant));
    }
    os << "};\n\n";
    symbols_.set_decl_text(tag.enum_name, "enum " + tag.enum_name);

    os << "struct " << decl.name << " {\n";
    os << pad << "enum " << tag.enum_name << " tag;\n";
    if (tag.has_payload) {
        os << pad << "union {\n";
        for (const auto& variant : tag.variants) {
            if (variant.storage == layout::PayloadStorage::Direct) {
                os << pad << pad << c_declare(variant.fields.front().type, variant.name)
                   << ";\n";
            } else if (variant.storage == layout::PayloadStorage::Struct) {
                os << pad << pad << "struct {\n";
                for (const auto& field : variant.fields) {
                    os << pad << pad << pad << c_declare(field.type, field.name) << ";\n";
                }
                os << pad << pad << "} " << variant.name << ";\n";
            }
        }
        os << pad << "} as;\n";
    }
    os << "};\n";
    return os.str();
}

auto CEmitter::gen_type_decl(const tree::TypeDecl& decl) -> std::string {
    if (decl.is_opaque) {
        return "";
    }

    std::string body;
    if (decl.is_tag) {
        const auto* tag = layouts_.find_tag(decl.name);
        if (!tag) {
            fail(diag::ErrorKind::Internal, decl.name,
                 "tag '" + decl.name + "' reached emission without a layout", decl.span);
            return "";
        }
        body = gen_tag(decl, *tag);
    } else {
        body = gen_record(decl);
    }
    symbols_.set_decl_text(decl.name, "struct " + decl.name);

    std::ostringstream os;
    const bool guarded = decl.is_instance() && options_.instance_guards;
    const auto guard = "A2C_INST_" + decl.name;
    if (guarded) {
        os << "#ifndef " << guard << "\n#define " << guard << "\n";
    }
    if (decl.is_instance() && options_.emit_comments) {
        os << "// " << decl.generic_origin << "\n";
    }
    os << body;
    if (guarded) {
        os << "#endif // " << guard << "\n";
    }
    return os.str();
}

// ============================================================================
// Functions
// ============================================================================

auto CEmitter::gen_param(const tree::ParamDecl& param) -> std::string {
    if (!is_reference(param) || param.type->is<types::IndirectType>()) {
        return c_declare(param.type, param.name);
    }

    if (param.type->is<types::ArrayType>()) {
        // Pointer to the whole array keeps `(*p)[i]` indexing valid. No const:
        // C does not convert `T (*)[N]` to `const T (*)[N]` implicitly.
        return c_declare(param.type, "(*" + param.name + ")");
    }
    auto decl = c_declare(types::make_ptr(param.type), param.name);
    return *param.passing == tree::PassingMode::RefImmutable ? "const " + decl : decl;
}

auto CEmitter::gen_prototype(const tree::FuncDecl& func) -> std::string {
    std::string params;
    for (const auto& param : func.params) {
        if (!params.empty())
            params += ", ";
        params += gen_param(param);
    }
    if (params.empty()) {
        params = "void";
    }

    const auto declarator = func.name + "(" + params + ")";
    auto proto = is_main(func) && types::is_unit(func.return_type)
                     ? "int " + declarator
                     : (types::is_unit(func.return_type) ? "void " + declarator
                                                         : c_declare(func.return_type, declarator));
    if (func.is_instance() && !func.is_stub()) {
        proto = "static " + proto;
    }
    return proto;
}

auto CEmitter::gen_function(const tree::FuncDecl& func) -> std::string {
    out_.str("");
    out_.clear();
    indent_level_ = 0;
    temp_counter_ = 0;
    current_func_ = &func;
    pointer_scopes_.clear();

    push_scope();
    for (const auto& param : func.params) {
        declare_local(param.name, is_reference(param) && !param.type->is<types::IndirectType>());
    }

    emit_line(gen_prototype(func) + " {");
    push_indent();

    const auto sink =
        types::is_unit(func.return_type) ? Sink::discard() : Sink::to_return();
    if (func.body->is<tree::BlockExpr>()) {
        gen_block_body(func.body->as<tree::BlockExpr>(), sink);
    } else {
        gen_value(*func.body, sink);
    }
    if (is_main(func) && types::is_unit(func.return_type)) {
        emit_line("return 0;");
    }

    pop_indent();
    emit_line("}");

    pop_scope();
    current_func_ = nullptr;
    return out_.str();
}

// ============================================================================
// Artifacts
// ============================================================================

auto CEmitter::gen_header() -> std::string {
    std::ostringstream os;
    const auto guard = guard_name();

    os << "#ifndef " << guard << "\n";
    os << "#define " << guard << "\n\n";
    if (options_.emit_comments) {
        os << "// Generated by a2c from module '" << module_.name << "'. Do not edit.\n\n";
    }

    os << "#include <stdbool.h>\n";
    os << "#include <stddef.h>\n";
    os << "#include <stdint.h>\n";
    if (!module_.imports.empty()) {
        os << "\n";
        for (const auto& import : module_.imports) {
            os << "#include \"" << import << ".h\"\n";
        }
    }

    auto forward = gen_forward_decls();
    if (!forward.empty()) {
        os << "\n" << forward;
    }

    for (const auto* decl : type_order()) {
        auto text = gen_type_decl(*decl);
        if (error_)
            return "";
        if (!text.empty())
            os << "\n" << text;
    }

    std::vector<std::string> defined;
    std::vector<std::string> external;
    for (const auto& func : module_.functions) {
        if (func.is_instance() && !func.is_stub())
            continue;
        auto proto = gen_prototype(func);
        symbols_.set_decl_text(func.name, proto);
        (func.is_stub() ? external : defined).push_back(proto + ";");
    }
    if (!defined.empty()) {
        os << "\n";
        for (const auto& proto : defined) {
            os << proto << "\n";
        }
    }
    if (!external.empty()) {
        os << "\n";
        if (options_.emit_comments) {
            os << "// Provided externally\n";
        }
        for (const auto& proto : external) {
            os << proto << "\n";
        }
    }

    os << "\n#endif // " << guard << "\n";
    return os.str();
}

auto CEmitter::gen_source() -> std::string {
    std::ostringstream os;
    os << "#include \"" << module_.name << ".h\"\n";

    bool has_instances = false;
    for (const auto& func : module_.functions) {
        if (!func.is_instance() || func.is_stub())
            continue;
        if (!has_instances) {
            os << "\n";
            has_instances = true;
        }
        auto proto = gen_prototype(func);
        symbols_.set_decl_text(func.name, proto);
        os << proto << ";\n";
    }

    for (const auto& func : module_.functions) {
        if (func.is_stub())
            continue;
        auto text = gen_function(func);
        if (error_)
            return "";
        os << "\n";
        if (func.is_instance() && options_.emit_comments) {
            os << "// " << func.generic_origin << "\n";
        }
        os << text;
    }
    return os.str();
}

auto CEmitter::emit() -> Result<EmittedArtifacts, diag::Diagnostic> {
    A2C_LOG_DEBUG("codegen", "Emitting " << module_.name);

    EmittedArtifacts artifacts;
    artifacts.module = module_.name;
    artifacts.header = gen_header();
    if (error_) {
        return *error_;
    }
    artifacts.source = gen_source();
    if (error_) {
        return *error_;
    }

    A2C_LOG_DEBUG("codegen", module_.name << ": " << artifacts.header.size() << " bytes of "
                                          << artifacts.header_name() << ", "
                                          << artifacts.source.size() << " bytes of "
                                          << artifacts.source_name());
    return artifacts;
}

} // namespace a2c::codegen
