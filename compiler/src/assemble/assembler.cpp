//! # Fragment Assembler Implementation
//!
//! Both fragments are first filtered for the scenario and checked for
//! internal duplicates. The scenario-specific fragment then seeds the unit,
//! and each shared declaration is either merged into its counterpart or
//! appended.

#include "assemble/assembler.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <set>

namespace a2c::assemble {

using diag::Diagnostic;
using diag::ErrorKind;
using tree::FuncDecl;
using tree::MethodDecl;
using tree::ParamDecl;
using tree::Scenario;
using tree::TypeDecl;

namespace {

/// Scenario-filtered copy of one fragment.
struct FragmentView {
    std::string path;
    std::vector<std::string> imports;
    std::vector<TypeDecl> types;
    std::vector<FuncDecl> functions;
};

auto applies_to(const std::optional<Scenario>& only_for, Scenario scenario) -> bool {
    return !only_for || *only_for == scenario;
}

auto filter_fragment(const tree::Fragment& fragment, Scenario scenario) -> FragmentView {
    FragmentView view;
    view.path = fragment.path;
    view.imports = fragment.imports;

    auto keep = tree::keep_types();
    for (const auto& decl : fragment.types) {
        if (!applies_to(decl.only_for, scenario)) {
            A2C_LOG_DEBUG("assemble", "Dropping type " << decl.name << " from " << fragment.path
                                                       << " (only for "
                                                       << tree::scenario_name(*decl.only_for)
                                                       << ")");
            continue;
        }
        auto copy = tree::clone_type_decl(decl, keep);
        std::erase_if(copy.methods, [scenario](const MethodDecl& m) {
            return !applies_to(m.only_for, scenario);
        });
        view.types.push_back(std::move(copy));
    }
    for (const auto& func : fragment.functions) {
        if (!applies_to(func.only_for, scenario)) {
            A2C_LOG_DEBUG("assemble", "Dropping function " << func.name << " from "
                                                           << fragment.path << " (only for "
                                                           << tree::scenario_name(*func.only_for)
                                                           << ")");
            continue;
        }
        view.functions.push_back(tree::clone_function(func, keep));
    }
    return view;
}

auto conflict(const std::string& module, const std::string& symbol, std::string message,
              const SourceSpan& span) -> Diagnostic {
    return diag::make_diagnostic(ErrorKind::AssemblyConflict, module, symbol, std::move(message),
                                 span);
}

auto check_duplicates(const FragmentView& view, const std::string& module)
    -> std::optional<Diagnostic> {
    std::set<std::string> type_names;
    for (const auto& decl : view.types) {
        if (!type_names.insert(decl.name).second) {
            return conflict(module, decl.name,
                            "type '" + decl.name + "' is declared twice in " + view.path,
                            decl.span);
        }
        std::set<std::string> method_names;
        for (const auto& method : decl.methods) {
            if (!method_names.insert(method.name).second) {
                return conflict(module, decl.name + "." + method.name,
                                "method '" + method.name + "' of '" + decl.name +
                                    "' is declared twice in " + view.path,
                                method.span);
            }
        }
    }

    std::set<std::string> func_names;
    for (const auto& func : view.functions) {
        if (!func_names.insert(func.name).second) {
            return conflict(module, func.name,
                            "function '" + func.name + "' is declared twice in " + view.path,
                            func.span);
        }
    }
    return std::nullopt;
}

auto same_params(const std::vector<ParamDecl>& a, const std::vector<ParamDecl>& b) -> bool {
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i].intent != b[i].intent || !types::types_equal(a[i].type, b[i].type))
            return false;
    }
    return true;
}

auto merge_method(MethodDecl& into, MethodDecl& from, const std::string& module,
                  const std::string& owner) -> std::optional<Diagnostic> {
    auto symbol = owner + "." + into.name;
    if (!into.is_stub() && !from.is_stub()) {
        return conflict(module, symbol,
                        "method '" + symbol + "' has a body in both fragments", from.span);
    }
    if (into.kind != from.kind || into.mutates_receiver != from.mutates_receiver ||
        !same_params(into.params, from.params) ||
        !types::types_equal(into.return_type, from.return_type)) {
        return conflict(module, symbol,
                        "signature of method '" + symbol + "' differs between fragments",
                        from.span);
    }
    if (into.is_stub() && !from.is_stub()) {
        into.body = std::move(from.body);
        into.is_lowlevel = from.is_lowlevel;
        into.span = from.span;
    }
    return std::nullopt;
}

auto merge_function(FuncDecl& into, FuncDecl& from, const std::string& module)
    -> std::optional<Diagnostic> {
    if (!into.is_stub() && !from.is_stub()) {
        return conflict(module, into.name,
                        "function '" + into.name + "' has a body in both fragments", from.span);
    }
    if (into.generic_params != from.generic_params || !same_params(into.params, from.params) ||
        !types::types_equal(into.return_type, from.return_type)) {
        return conflict(module, into.name,
                        "signature of function '" + into.name + "' differs between fragments",
                        from.span);
    }
    if (into.is_stub() && !from.is_stub()) {
        into.body = std::move(from.body);
        into.is_lowlevel = from.is_lowlevel;
        into.span = from.span;
    }
    return std::nullopt;
}

auto merge_type(TypeDecl& into, TypeDecl& from, const std::string& module)
    -> std::optional<Diagnostic> {
    if (!into.is_opaque && !from.is_opaque) {
        return conflict(module, into.name,
                        "type '" + into.name + "' states its structure in both fragments",
                        from.span);
    }
    if (!into.generic_params.empty() && !from.generic_params.empty() &&
        into.generic_params != from.generic_params) {
        return conflict(module, into.name,
                        "generic parameters of '" + into.name + "' differ between fragments",
                        from.span);
    }

    if (into.is_opaque && !from.is_opaque) {
        into.fields = std::move(from.fields);
        into.variants = std::move(from.variants);
        into.is_tag = from.is_tag;
        into.is_opaque = false;
        into.span = from.span;
    }
    if (into.generic_params.empty()) {
        into.generic_params = std::move(from.generic_params);
    }
    into.is_heap_backed = into.is_heap_backed || from.is_heap_backed;

    for (auto& method : from.methods) {
        if (auto* existing = into.find_method(method.name)) {
            if (auto err = merge_method(*existing, method, module, into.name)) {
                return err;
            }
        } else {
            into.methods.push_back(std::move(method));
        }
    }
    return std::nullopt;
}

} // namespace

auto Assembler::assemble(const std::string& module, Scenario scenario)
    -> Result<tree::ModuleUnit, Diagnostic> {
    const auto* specific = provider_.find(specific_fragment_path(module, scenario));
    const auto* shared = provider_.find(shared_fragment_path(module));

    if (!specific && !shared) {
        return diag::make_diagnostic(ErrorKind::ModuleNotFound, module, module,
                                     "no fragment found for module '" + module + "' (looked for " +
                                         shared_fragment_path(module) + " and " +
                                         specific_fragment_path(module, scenario) + ")");
    }
    if (!specific) {
        A2C_LOG_DEBUG("assemble", "No " << fragment_suffix(scenario) << " fragment for " << module
                                        << ", using the shared fragment only");
    }

    std::vector<FragmentView> views;
    if (specific) {
        views.push_back(filter_fragment(*specific, scenario));
    }
    if (shared) {
        views.push_back(filter_fragment(*shared, scenario));
    }
    for (const auto& view : views) {
        if (auto err = check_duplicates(view, module)) {
            return *err;
        }
    }

    tree::ModuleUnit unit;
    unit.name = module;
    unit.scenario = scenario;

    std::set<std::string> seen_imports;
    for (auto& view : views) {
        for (auto& import : view.imports) {
            if (seen_imports.insert(import).second) {
                unit.imports.push_back(import);
            }
        }

        for (auto& decl : view.types) {
            auto existing = std::find_if(unit.types.begin(), unit.types.end(),
                                         [&decl](const TypeDecl& t) { return t.name == decl.name; });
            if (existing == unit.types.end()) {
                unit.types.push_back(std::move(decl));
                continue;
            }
            A2C_LOG_TRACE("assemble", "Merging type " << decl.name << " from " << view.path);
            if (auto err = merge_type(*existing, decl, module)) {
                return *err;
            }
        }

        for (auto& func : view.functions) {
            auto existing =
                std::find_if(unit.functions.begin(), unit.functions.end(),
                             [&func](const FuncDecl& f) { return f.name == func.name; });
            if (existing == unit.functions.end()) {
                unit.functions.push_back(std::move(func));
                continue;
            }
            A2C_LOG_TRACE("assemble", "Merging function " << func.name << " from " << view.path);
            if (auto err = merge_function(*existing, func, module)) {
                return *err;
            }
        }
    }

    A2C_LOG_DEBUG("assemble", "Assembled " << module << " for " << tree::scenario_name(scenario)
                                           << ": " << unit.types.size() << " types, "
                                           << unit.functions.size() << " functions");
    return unit;
}

} // namespace a2c::assemble
