//! # Program Tree Modules
//!
//! ## Module Forms
//!
//! | Form            | Produced by         | Mutability                      |
//! |-----------------|---------------------|---------------------------------|
//! | `Fragment`      | Front end           | Input, read only                |
//! | `ModuleUnit`    | Fragment assembler  | Read only after assembly        |
//! | `LoweredModule` | Monomorphizer       | Rewritten in place by later passes |
//!
//! A `LoweredModule` contains no generic declarations: generic types and
//! functions are replaced by their concrete instances, appended after the
//! non-generic declarations in instantiation order.

#pragma once

#include "tree/tree_decl.hpp"

namespace a2c::tree {

/// Which half of a module a fragment holds.
enum class FragmentRole {
    Shared,   ///< Shared interface fragment (`name.at`)
    Specific, ///< Scenario-specific fragment (`name.c.at`, ...)
};

/// One fragment file of a module, already parsed and resolved.
struct Fragment {
    std::string module;
    FragmentRole role = FragmentRole::Shared;
    std::string path;
    std::vector<std::string> imports;
    std::vector<TypeDecl> types;
    std::vector<FuncDecl> functions;
};

/// The merged program tree of one module.
struct ModuleUnit {
    std::string name;
    Scenario scenario = Scenario::TransC;
    std::vector<std::string> imports;
    std::vector<TypeDecl> types;
    std::vector<FuncDecl> functions;

    [[nodiscard]] auto find_type(const std::string& type_name) const -> const TypeDecl*;
    [[nodiscard]] auto find_function(const std::string& func_name) const -> const FuncDecl*;
};

/// Concrete, rewritable copy of a module produced by monomorphization.
struct LoweredModule {
    std::string name;
    std::vector<std::string> imports;
    std::vector<TypeDecl> types;
    std::vector<FuncDecl> functions;

    [[nodiscard]] auto find_type(const std::string& type_name) const -> const TypeDecl*;
    [[nodiscard]] auto find_type(const std::string& type_name) -> TypeDecl*;
    [[nodiscard]] auto find_function(const std::string& func_name) const -> const FuncDecl*;
};

/// A dependency of the module being compiled: its assembled unit (for
/// generic declarations) and, once built, its lowered form (for concrete
/// types and function signatures).
struct ImportedModule {
    const ModuleUnit* unit = nullptr;
    const LoweredModule* lowered = nullptr;
};

/// Name lookup over a lowered module and the lowered forms of its imports.
/// Local declarations shadow imported ones.
class DeclIndex {
public:
    explicit DeclIndex(const LoweredModule& local) : local_(local) {}

    void add_import(const LoweredModule& imported) {
        imports_.push_back(&imported);
    }

    [[nodiscard]] auto find_type(const std::string& type_name) const -> const TypeDecl*;
    [[nodiscard]] auto find_function(const std::string& func_name) const -> const FuncDecl*;

    [[nodiscard]] auto local() const -> const LoweredModule& {
        return local_;
    }

private:
    const LoweredModule& local_;
    std::vector<const LoweredModule*> imports_;
};

} // namespace a2c::tree
