//! # Type Resolver and Monomorphizer
//!
//! Produces a `LoweredModule` from a `ModuleUnit`: non-generic declarations
//! are copied with every type reference rewritten, generic declarations are
//! replaced by one concrete copy per distinct instantiation key.
//!
//! ## Instantiation
//!
//! | Reference                 | Result                                   |
//! |---------------------------|------------------------------------------|
//! | `List<int>` (type)        | `List_int` with all methods instantiated |
//! | `identity<int>(x)` (call) | call of `identity_int`                   |
//!
//! Requests are deduplicated by key. A key is marked complete only after its
//! whole declaration has been rewritten, and instances are appended to the
//! module in completion order, so dependencies always precede dependents.
//!
//! ## Errors
//!
//! - `UnresolvedGeneric`: a generic parameter left unbound, or a generic
//!   referenced with the wrong number of arguments (including none)
//! - `CyclicInstantiation`: an instance contains an in-progress instance by
//!   value, or an instance requests a bigger instance of its own generic
//! - `SymbolCollision`: an instance name clashes with another key or with a
//!   non-generic declaration
//! - `MalformedTree`: type arguments applied to a non-generic name

#pragma once

#include "diag/diagnostic.hpp"
#include "mono/instantiation.hpp"
#include "tree/tree.hpp"

#include <map>
#include <set>
#include <unordered_map>

namespace a2c::mono {

/// Nesting limit for instantiations requested while instantiating.
constexpr size_t MAX_INSTANTIATION_DEPTH = 64;

class Monomorphizer {
public:
    /// `imports` supply generic declarations of imported modules; they are
    /// instantiated into this module.
    Monomorphizer(const tree::ModuleUnit& unit, InstantiationRegistry& registry,
                  std::vector<const tree::ModuleUnit*> imports = {});

    [[nodiscard]] auto run() -> Result<tree::LoweredModule, diag::Diagnostic>;

    /// The instantiation table of the last run, in request order.
    [[nodiscard]] auto instantiations() const -> const std::vector<GenericInstantiation>& {
        return entries_;
    }

private:
    using Substitution = std::unordered_map<std::string, types::TypePtr>;

    const tree::ModuleUnit& unit_;
    InstantiationRegistry& registry_;
    std::vector<const tree::ModuleUnit*> imports_;

    std::map<InstantiationKey, size_t> table_;
    std::vector<GenericInstantiation> entries_;
    std::set<std::string> in_progress_;
    size_t depth_ = 0;

    std::set<std::string> plain_names_;
    std::vector<tree::TypeDecl> instance_types_;
    std::vector<tree::FuncDecl> instance_functions_;
    std::optional<diag::Diagnostic> error_;

    void fail(diag::Diagnostic diagnostic);

    [[nodiscard]] auto find_generic_type(const std::string& name) const -> const tree::TypeDecl*;
    [[nodiscard]] auto find_generic_function(const std::string& name) const
        -> const tree::FuncDecl*;

    [[nodiscard]] auto resolve(const types::TypePtr& type, const SourceSpan& span)
        -> types::TypePtr;

    void resolve_params(std::vector<tree::ParamDecl>& params, const SourceSpan& span);
    void resolve_type_decl(tree::TypeDecl& decl);
    void resolve_function(tree::FuncDecl& func);

    /// Resolves every type slot of a body and rewrites generic calls to
    /// their instances.
    void resolve_body(tree::Expr& body);

    [[nodiscard]] auto request_type(const tree::TypeDecl& generic,
                                    std::vector<types::TypePtr> args, const SourceSpan& span)
        -> std::string;
    [[nodiscard]] auto request_function(const tree::FuncDecl& generic,
                                        std::vector<types::TypePtr> args, const SourceSpan& span)
        -> std::string;

    /// Common bookkeeping of both request kinds. Returns the instance name
    /// and whether the caller has to build the instance.
    [[nodiscard]] auto begin_instance(const InstantiationKey& key, InstanceKind kind,
                                      const std::vector<types::TypePtr>& args,
                                      const SourceSpan& span) -> std::pair<std::string, bool>;
    void finish_instance(const InstantiationKey& key, const std::string& name);

    void check_embedding(const tree::TypeDecl& instance);
};

} // namespace a2c::mono
