//! # Method Lowering
//!
//! Turns every method into a free function and registers every top-level
//! name of the module.
//!
//! | Before                         | After                                |
//! |--------------------------------|--------------------------------------|
//! | `Point.len(self)` method       | `Point_len(self)` function           |
//! | `.x` inside a method           | `self.x`                             |
//! | `p.len()`                      | `Point_len(p)`                       |
//! | `Point.origin()` (static)      | `Point_origin()`                     |
//!
//! Instance methods gain `self` as first parameter, passed as the receiver
//! was classified. Lowered methods are placed before the free functions,
//! in type and method declaration order. Afterwards no type owns methods.

#pragma once

#include "diag/diagnostic.hpp"
#include "layout/layout_compiler.hpp"
#include "lower/symbol_table.hpp"
#include "tree/tree.hpp"

namespace a2c::lower {

class MethodLowering {
public:
    MethodLowering(tree::LoweredModule& module, const layout::LayoutTable& layouts,
                   SymbolTable& symbols)
        : module_(module), layouts_(layouts), symbols_(symbols) {}

    [[nodiscard]] auto run() -> Result<Unit, diag::Diagnostic>;

private:
    tree::LoweredModule& module_;
    const layout::LayoutTable& layouts_;
    SymbolTable& symbols_;

    [[nodiscard]] auto register_types() -> Result<Unit, diag::Diagnostic>;
    [[nodiscard]] auto register_function(const tree::FuncDecl& func)
        -> Result<Unit, diag::Diagnostic>;

    [[nodiscard]] auto lower_method(const tree::TypeDecl& owner, tree::MethodDecl& method)
        -> tree::FuncDecl;

    /// Rewrites field shorthand and method calls in a body.
    [[nodiscard]] auto rewrite_body(tree::Expr& body, const std::string& owner)
        -> Result<Unit, diag::Diagnostic>;
};

} // namespace a2c::lower
